/*
 * ContentCodec.cpp - Wire layouts of ID3v2 frame bodies
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
namespace ContentCodec {

namespace {

/**
 * Cursor over a frame body. Every read past the end is a Parsing error
 * naming the frame and the field.
 */
class BodyReader {
public:
    BodyReader(const std::string& id, const uint8_t* data, size_t size)
        : m_id(id), m_data(data), m_size(size), m_pos(0) {}

    size_t remaining() const { return m_size - m_pos; }

    uint8_t byte(const char* field) {
        if (remaining() < 1) {
            truncated(field);
        }
        return m_data[m_pos++];
    }

    Encoding encoding() {
        return encodingFromByte(byte("encoding"));
    }

    std::string fixedLatin1(size_t count, const char* field) {
        if (remaining() < count) {
            truncated(field);
        }
        std::string value = Core::Utility::UTF8Util::fromLatin1(m_data + m_pos, count);
        m_pos += count;
        return value;
    }

    // A string that must be followed by a terminator
    std::string terminated(Encoding encoding, const char* field) {
        size_t length = findTerminator(m_data + m_pos, remaining(), encoding);
        if (length == remaining()) {
            throw Error(ErrorKind::Parsing, m_id + ": missing terminator after " + field);
        }
        std::string value = decodeString(m_data + m_pos, length, encoding);
        m_pos += length + terminatorSize(encoding);
        return value;
    }

    // The final string of a body; one trailing terminator is tolerated
    std::string rest(Encoding encoding) {
        size_t length = trimmedRemaining(encoding);
        std::string value = decodeString(m_data + m_pos, length, encoding);
        m_pos = m_size;
        return value;
    }

    std::vector<std::string> restValues(Encoding encoding) {
        size_t end = m_pos + trimmedRemaining(encoding);
        size_t term = terminatorSize(encoding);
        std::vector<std::string> values;
        while (true) {
            size_t length = findTerminator(m_data + m_pos, end - m_pos, encoding);
            values.push_back(decodeString(m_data + m_pos, length, encoding));
            if (m_pos + length >= end) {
                break;
            }
            m_pos += length + term;
        }
        m_pos = m_size;
        return values;
    }

    std::vector<uint8_t> restBytes() {
        std::vector<uint8_t> value(m_data + m_pos, m_data + m_size);
        m_pos = m_size;
        return value;
    }

private:
    size_t trimmedRemaining(Encoding encoding) const {
        size_t length = remaining();
        size_t term = terminatorSize(encoding);
        if (length >= term && (term == 1 || length % 2 == 0)) {
            bool zero = true;
            for (size_t i = length - term; i < length; ++i) {
                zero = zero && m_data[m_pos + i] == 0x00;
            }
            if (zero) {
                length -= term;
            }
        }
        return length;
    }

    [[noreturn]] void truncated(const char* field) const {
        throw Error(ErrorKind::Parsing, m_id + ": frame body truncated before " + field);
    }

    const std::string& m_id;
    const uint8_t* m_data;
    size_t m_size;
    size_t m_pos;
};

// Builds a frame body
class BodyWriter {
public:
    explicit BodyWriter(Encoding encoding) : m_encoding(encoding) {}

    void encodingByte() { m_out.push_back(static_cast<uint8_t>(m_encoding)); }
    void byte(uint8_t value) { m_out.push_back(value); }

    void text(const std::string& value) {
        std::vector<uint8_t> bytes = encodeString(value, m_encoding);
        m_out.insert(m_out.end(), bytes.begin(), bytes.end());
    }

    void terminator() {
        m_out.insert(m_out.end(), terminatorSize(m_encoding), 0x00);
    }

    void latin1(const std::string& value) {
        std::vector<uint8_t> bytes = encodeString(value, Encoding::Latin1);
        m_out.insert(m_out.end(), bytes.begin(), bytes.end());
    }

    void language(const std::string& lang) {
        std::vector<uint8_t> bytes = encodeString(lang, Encoding::Latin1);
        if (bytes.size() != 3) {
            throw Error(ErrorKind::Parsing, "language code \"" + lang + "\" is not 3 characters");
        }
        m_out.insert(m_out.end(), bytes.begin(), bytes.end());
    }

    void bytes(const std::vector<uint8_t>& value) {
        m_out.insert(m_out.end(), value.begin(), value.end());
    }

    size_t size() const { return m_out.size(); }
    std::vector<uint8_t> take() { return std::move(m_out); }

private:
    Encoding m_encoding;
    std::vector<uint8_t> m_out;
};

uint64_t readCounter(const std::string& id, const std::vector<uint8_t>& bytes) {
    auto significant = std::find_if(bytes.begin(), bytes.end(), [](uint8_t b) { return b != 0x00; });
    if (bytes.end() - significant > 8) {
        throw Error(ErrorKind::Parsing, id + ": play counter wider than 64 bits");
    }
    uint64_t counter = 0;
    for (auto it = significant; it != bytes.end(); ++it) {
        counter = (counter << 8) | *it;
    }
    return counter;
}

std::vector<uint8_t> writeCounter(uint64_t counter) {
    std::vector<uint8_t> bytes;
    while (counter > 0) {
        bytes.insert(bytes.begin(), static_cast<uint8_t>(counter & 0xFF));
        counter >>= 8;
    }
    while (bytes.size() < 4) {
        bytes.insert(bytes.begin(), 0x00);
    }
    return bytes;
}

} // anonymous namespace

std::string mimeFromFormat(const std::string& format) {
    if (format == "JPG") {
        return "image/jpeg";
    } else if (format == "PNG") {
        return "image/png";
    } else if (format == "GIF") {
        return "image/gif";
    } else if (format == "BMP") {
        return "image/bmp";
    }
    return "image/" + format;
}

std::string formatFromMime(const std::string& mime_type) {
    if (mime_type == "image/jpeg" || mime_type == "image/jpg") {
        return "JPG";
    } else if (mime_type == "image/png") {
        return "PNG";
    } else if (mime_type == "image/gif") {
        return "GIF";
    } else if (mime_type == "image/bmp") {
        return "BMP";
    }
    std::string format = mime_type;
    if (format.compare(0, 6, "image/") == 0) {
        format = format.substr(6);
    }
    if (format.size() == 3) {
        return format;
    }
    for (auto& c : format) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    format.resize(3, ' ');
    return format;
}

Decoded decode(const std::string& id, Version version, const uint8_t* data, size_t size) {
    BodyReader reader(id, data, size);
    Decoded result{Unknown{}, std::nullopt};

    switch (FrameRegistry::contentShape(id)) {
        case ContentShape::Text: {
            Encoding encoding = reader.encoding();
            result.encoding = encoding;
            result.content = Text{reader.restValues(encoding)};
            break;
        }
        case ContentShape::ExtendedText: {
            Encoding encoding = reader.encoding();
            result.encoding = encoding;
            ExtendedText content;
            content.description = reader.terminated(encoding, "description");
            content.value = reader.rest(encoding);
            result.content = std::move(content);
            break;
        }
        case ContentShape::Link:
            result.content = Link{reader.rest(Encoding::Latin1)};
            break;
        case ContentShape::ExtendedLink: {
            Encoding encoding = reader.encoding();
            result.encoding = encoding;
            ExtendedLink content;
            content.description = reader.terminated(encoding, "description");
            content.link = reader.rest(Encoding::Latin1);
            result.content = std::move(content);
            break;
        }
        case ContentShape::Comment: {
            Encoding encoding = reader.encoding();
            result.encoding = encoding;
            Comment content;
            content.lang = reader.fixedLatin1(3, "language");
            content.description = reader.terminated(encoding, "description");
            content.text = reader.rest(encoding);
            result.content = std::move(content);
            break;
        }
        case ContentShape::Lyrics: {
            Encoding encoding = reader.encoding();
            result.encoding = encoding;
            Lyrics content;
            content.lang = reader.fixedLatin1(3, "language");
            content.description = reader.terminated(encoding, "description");
            content.text = reader.rest(encoding);
            result.content = std::move(content);
            break;
        }
        case ContentShape::Picture: {
            Encoding encoding = reader.encoding();
            result.encoding = encoding;
            Picture content;
            if (version == Version::ID3v22) {
                content.mime_type = mimeFromFormat(reader.fixedLatin1(3, "image format"));
            } else {
                content.mime_type = reader.terminated(Encoding::Latin1, "MIME type");
            }
            content.picture_type = static_cast<PictureType>(reader.byte("picture type"));
            content.description = reader.terminated(encoding, "description");
            content.data = reader.restBytes();
            result.content = std::move(content);
            break;
        }
        case ContentShape::Popularimeter: {
            Popularimeter content;
            content.user = reader.terminated(Encoding::Latin1, "email");
            content.rating = reader.byte("rating");
            content.counter = readCounter(id, reader.restBytes());
            result.content = std::move(content);
            break;
        }
        case ContentShape::Timestamp: {
            Encoding encoding = reader.encoding();
            result.encoding = encoding;
            result.content = Timestamp::parse(reader.rest(encoding));
            break;
        }
        case ContentShape::Unknown:
            result.content = Unknown{reader.restBytes()};
            break;
    }

    return result;
}

std::vector<uint8_t> encode(const Content& content, Version version, Encoding encoding) {
    if (!isEncodingAllowed(encoding, version)) {
        throw Error(ErrorKind::UnsupportedFeature,
                    std::string(encodingName(encoding)) + " encoding is not available in " + versionName(version));
    }

    BodyWriter writer(encoding);
    std::visit([&writer, version](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Text>) {
            writer.encodingByte();
            size_t last_start = writer.size();
            for (size_t i = 0; i < value.values.size(); ++i) {
                if (i > 0) writer.terminator();
                last_start = writer.size();
                writer.text(value.values[i]);
            }
            // The reader drops one trailing terminator; keep an empty last value
            if (value.values.size() > 1 && writer.size() == last_start) {
                writer.terminator();
            }
            if (value.values.empty()) {
                writer.text("");
            }
        } else if constexpr (std::is_same_v<T, ExtendedText>) {
            writer.encodingByte();
            writer.text(value.description);
            writer.terminator();
            writer.text(value.value);
        } else if constexpr (std::is_same_v<T, Link>) {
            writer.latin1(value.url);
        } else if constexpr (std::is_same_v<T, ExtendedLink>) {
            writer.encodingByte();
            writer.text(value.description);
            writer.terminator();
            writer.latin1(value.link);
        } else if constexpr (std::is_same_v<T, Comment> || std::is_same_v<T, Lyrics>) {
            writer.encodingByte();
            writer.language(value.lang);
            writer.text(value.description);
            writer.terminator();
            writer.text(value.text);
        } else if constexpr (std::is_same_v<T, Picture>) {
            writer.encodingByte();
            if (version == Version::ID3v22) {
                writer.latin1(formatFromMime(value.mime_type));
            } else {
                writer.latin1(value.mime_type);
                writer.byte(0x00);
            }
            writer.byte(static_cast<uint8_t>(value.picture_type));
            writer.text(value.description);
            writer.terminator();
            writer.bytes(value.data);
        } else if constexpr (std::is_same_v<T, Popularimeter>) {
            writer.latin1(value.user);
            writer.byte(0x00);
            writer.byte(value.rating);
            writer.bytes(writeCounter(value.counter));
        } else if constexpr (std::is_same_v<T, Timestamp>) {
            writer.encodingByte();
            writer.text(value.toString());
        } else {
            writer.bytes(value.data);
        }
    }, content);

    return writer.take();
}

} // namespace ContentCodec
} // namespace Tag
} // namespace TagForge
