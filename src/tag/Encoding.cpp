/*
 * Encoding.cpp - ID3v2 text encodings and the string converter
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef FINAL_BUILD
#include "tagforge.h"
#endif // !FINAL_BUILD

namespace TagForge {
namespace Tag {

using Core::Utility::UTF8Util;

const char* encodingName(Encoding encoding) {
    switch (encoding) {
        case Encoding::Latin1: return "Latin1";
        case Encoding::UTF16: return "UTF16";
        case Encoding::UTF16BE: return "UTF16BE";
        case Encoding::UTF8: return "UTF8";
    }
    return "Unknown";
}

Encoding encodingFromByte(uint8_t byte) {
    if (byte > static_cast<uint8_t>(Encoding::UTF8)) {
        throw Error(ErrorKind::Parsing, "invalid text encoding byte " + std::to_string(byte));
    }
    return static_cast<Encoding>(byte);
}

bool isEncodingAllowed(Encoding encoding, Version version) {
    if (version == Version::ID3v24) {
        return true;
    }
    return encoding == Encoding::Latin1 || encoding == Encoding::UTF16;
}

Encoding encodingForVersion(Encoding encoding, Version version) {
    return isEncodingAllowed(encoding, version) ? encoding : Encoding::UTF16;
}

size_t terminatorSize(Encoding encoding) {
    switch (encoding) {
        case Encoding::UTF16:
        case Encoding::UTF16BE:
            return 2;
        default:
            return 1;
    }
}

size_t findTerminator(const uint8_t* data, size_t size, Encoding encoding) {
    if (terminatorSize(encoding) == 2) {
        for (size_t i = 0; i + 1 < size; i += 2) {
            if (data[i] == 0x00 && data[i + 1] == 0x00) {
                return i;
            }
        }
        return size;
    }
    for (size_t i = 0; i < size; ++i) {
        if (data[i] == 0x00) {
            return i;
        }
    }
    return size;
}

std::string decodeString(const uint8_t* data, size_t size, Encoding encoding) {
    std::string result;
    switch (encoding) {
        case Encoding::Latin1:
            return UTF8Util::fromLatin1(data, size);

        case Encoding::UTF16: {
            if (size == 0) {
                return result;
            }
            if (size < 2) {
                throw Error(ErrorKind::StringDecoding, "UTF-16 text too short for a byte order mark");
            }
            bool big_endian;
            if (data[0] == 0xFF && data[1] == 0xFE) {
                big_endian = false;
            } else if (data[0] == 0xFE && data[1] == 0xFF) {
                big_endian = true;
            } else {
                throw Error(ErrorKind::StringDecoding, "unrecognized UTF-16 byte order mark");
            }
            if (!UTF8Util::fromUTF16(data + 2, size - 2, big_endian, result)) {
                throw Error(ErrorKind::StringDecoding, "invalid UTF-16 text");
            }
            return result;
        }

        case Encoding::UTF16BE:
            if (!UTF8Util::fromUTF16(data, size, true, result)) {
                throw Error(ErrorKind::StringDecoding, "invalid UTF-16BE text");
            }
            return result;

        case Encoding::UTF8:
            if (!UTF8Util::isValid(data, size)) {
                throw Error(ErrorKind::StringDecoding, "invalid UTF-8 text");
            }
            return std::string(reinterpret_cast<const char*>(data), size);
    }
    throw Error(ErrorKind::StringDecoding, "unknown encoding");
}

std::vector<uint8_t> encodeString(const std::string& text, Encoding encoding) {
    std::vector<uint8_t> result;
    switch (encoding) {
        case Encoding::Latin1:
            if (!UTF8Util::toLatin1(text, result)) {
                throw Error(ErrorKind::StringDecoding, "text is not representable in Latin1: \"" + text + "\"");
            }
            return result;

        case Encoding::UTF16: {
            std::vector<uint8_t> units;
            if (!UTF8Util::toUTF16(text, false, units)) {
                throw Error(ErrorKind::StringDecoding, "text is not valid UTF-8");
            }
            result.reserve(units.size() + 2);
            result.push_back(0xFF);
            result.push_back(0xFE);
            result.insert(result.end(), units.begin(), units.end());
            return result;
        }

        case Encoding::UTF16BE:
            if (!UTF8Util::toUTF16(text, true, result)) {
                throw Error(ErrorKind::StringDecoding, "text is not valid UTF-8");
            }
            return result;

        case Encoding::UTF8:
            if (!UTF8Util::isValid(text)) {
                throw Error(ErrorKind::StringDecoding, "text is not valid UTF-8");
            }
            return std::vector<uint8_t>(text.begin(), text.end());
    }
    throw Error(ErrorKind::StringDecoding, "unknown encoding");
}

bool canEncode(const std::string& text, Encoding encoding) {
    if (encoding == Encoding::Latin1) {
        std::vector<uint8_t> scratch;
        return UTF8Util::toLatin1(text, scratch);
    }
    return UTF8Util::isValid(text);
}

} // namespace Tag
} // namespace TagForge
