/*
 * FrameCodec.cpp - ID3v2 frame header and body transforms
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
namespace FrameCodec {

namespace {

std::string printableId(const uint8_t* data, size_t length) {
    std::ostringstream ss;
    for (size_t i = 0; i < length; ++i) {
        if (data[i] >= 0x20 && data[i] < 0x7F) {
            ss << static_cast<char>(data[i]);
        } else {
            ss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
        }
    }
    return ss.str();
}

FrameFlags flagsFromHeader(uint16_t bits, Version version) {
    FrameFlags flags;
    if (version == Version::ID3v23) {
        flags.tag_alter_preservation = (bits & V23_TAG_ALTER) != 0;
        flags.file_alter_preservation = (bits & V23_FILE_ALTER) != 0;
        flags.read_only = (bits & V23_READ_ONLY) != 0;
        flags.compressed = (bits & V23_COMPRESSION) != 0;
        flags.encrypted = (bits & V23_ENCRYPTION) != 0;
    } else if (version == Version::ID3v24) {
        flags.tag_alter_preservation = (bits & V24_TAG_ALTER) != 0;
        flags.file_alter_preservation = (bits & V24_FILE_ALTER) != 0;
        flags.read_only = (bits & V24_READ_ONLY) != 0;
        flags.compressed = (bits & V24_COMPRESSION) != 0;
        flags.encrypted = (bits & V24_ENCRYPTION) != 0;
        flags.unsynchronised = (bits & V24_UNSYNC) != 0;
        flags.has_data_length_indicator = (bits & V24_DATA_LENGTH) != 0;
    }
    return flags;
}

bool hasGrouping(uint16_t bits, Version version) {
    if (version == Version::ID3v23) {
        return (bits & V23_GROUPING) != 0;
    }
    return version == Version::ID3v24 && (bits & V24_GROUPING) != 0;
}

// Cursor over the header additions that precede the frame data
class AdditionReader {
public:
    AdditionReader(const std::string& id, const std::vector<uint8_t>& data)
        : m_id(id), m_data(data), m_pos(0) {}

    uint8_t byte(const char* field) {
        require(1, field);
        return m_data[m_pos++];
    }

    uint32_t be32(const char* field) {
        require(4, field);
        uint32_t value = ID3v2Utils::readBE32(m_data.data() + m_pos);
        m_pos += 4;
        return value;
    }

    uint32_t synchsafe(const char* field) {
        require(4, field);
        uint32_t value = ID3v2Utils::decodeSynchsafeBytes(m_data.data() + m_pos);
        m_pos += 4;
        return value;
    }

    size_t position() const { return m_pos; }

private:
    void require(size_t count, const char* field) const {
        if (m_data.size() - m_pos < count) {
            throw Error(ErrorKind::Parsing, m_id + ": frame too short for " + field);
        }
    }

    const std::string& m_id;
    const std::vector<uint8_t>& m_data;
    size_t m_pos;
};

} // anonymous namespace

size_t headerSize(Version version) {
    return version == Version::ID3v22 ? 6 : 10;
}

std::optional<FrameHeader> readHeader(const uint8_t* data, size_t size, Version version) {
    size_t header_size = headerSize(version);
    if (size < header_size || data[0] == 0x00) {
        return std::nullopt;
    }

    size_t id_length = version == Version::ID3v22 ? 3 : 4;
    FrameHeader header;
    header.id.assign(reinterpret_cast<const char*>(data), id_length);
    if (!FrameRegistry::isValidFrameId(header.id, version)) {
        throw Error(ErrorKind::Parsing, "invalid frame identifier \"" + printableId(data, id_length) + "\"");
    }

    switch (version) {
        case Version::ID3v22:
            header.size = ID3v2Utils::readBE24(data + 3);
            break;
        case Version::ID3v23:
            header.size = ID3v2Utils::readBE32(data + 4);
            header.flags = static_cast<uint16_t>((data[8] << 8) | data[9]);
            break;
        case Version::ID3v24:
            header.size = ID3v2Utils::decodeSynchsafeBytes(data + 4);
            header.flags = static_cast<uint16_t>((data[8] << 8) | data[9]);
            break;
    }
    return header;
}

Frame decodeBody(const FrameHeader& header, const uint8_t* body, Version version,
                 bool tag_unsynchronised) {
    FrameFlags flags = flagsFromHeader(header.flags, version);
    std::vector<uint8_t> data(body, body + header.size);

    if (version == Version::ID3v24 && (flags.unsynchronised || tag_unsynchronised)) {
        data = ID3v2Utils::decodeUnsync(data.data(), data.size());
    }

    AdditionReader additions(header.id, data);
    uint32_t decompressed_size = 0;
    std::optional<uint8_t> encryption_method;

    if (version == Version::ID3v23) {
        if (flags.compressed) {
            decompressed_size = additions.be32("decompressed size");
        }
        if (flags.encrypted) {
            encryption_method = additions.byte("encryption method");
        }
        if (hasGrouping(header.flags, version)) {
            flags.grouping_identifier = additions.byte("group identifier");
        }
    } else if (version == Version::ID3v24) {
        if (hasGrouping(header.flags, version)) {
            flags.grouping_identifier = additions.byte("group identifier");
        }
        if (flags.encrypted) {
            encryption_method = additions.byte("encryption method");
        }
        if (flags.has_data_length_indicator) {
            decompressed_size = additions.synchsafe("data length indicator");
        }
    }

    if (flags.encrypted) {
        throw Error(ErrorKind::UnsupportedFeature,
                    header.id + ": encrypted frames are not supported (method " +
                    std::to_string(encryption_method.value_or(0)) + ")");
    }

    const uint8_t* payload = data.data() + additions.position();
    size_t payload_size = data.size() - additions.position();
    std::vector<uint8_t> inflated;
    if (flags.compressed) {
        try {
            Core::Compression::ZlibDecompressor decompressor(decompressed_size);
            inflated = decompressor.decompress(payload, payload_size);
        } catch (const Error& e) {
            throw Error(ErrorKind::Parsing, header.id + ": " + e.description());
        }
        payload = inflated.data();
        payload_size = inflated.size();
    }

    std::string id = header.id;
    if (version == Version::ID3v22) {
        if (auto canonical = FrameRegistry::canonicalFromLegacy(id)) {
            id = *canonical;
        }
    }

    ContentCodec::Decoded decoded = ContentCodec::decode(id, version, payload, payload_size);

    Frame frame(id, std::move(decoded.content));
    frame.flags() = flags;
    frame.setEncoding(decoded.encoding);

    Debug::log("frame", "FrameCodec::decodeBody: ", header.id, " -> ", id, ", ", header.size,
               " stored bytes, ", payload_size, " payload bytes");
    return frame;
}

Encoding defaultEncoding(Version version) {
    return version == Version::ID3v24 ? Encoding::UTF8 : Encoding::UTF16;
}

std::string identifierFor(const std::string& id, Version version) {
    if (version == Version::ID3v22) {
        if (id.size() == 3) {
            return id;
        }
        if (auto legacy = FrameRegistry::legacyFromCanonical(id)) {
            return *legacy;
        }
        throw Error(ErrorKind::UnsupportedFeature, id + " has no ID3v2.2 equivalent");
    }
    if (id.size() == 3) {
        throw Error(ErrorKind::UnsupportedFeature, id + " is an ID3v2.2 frame with no " +
                    std::string(versionName(version)) + " equivalent");
    }
    if (version == Version::ID3v23 && FrameRegistry::isV24Only(id)) {
        throw Error(ErrorKind::UnsupportedFeature, id + " is not available in ID3v2.3");
    }
    return id;
}

std::vector<uint8_t> encodeFrame(const Frame& frame, Version version, const EncodeOptions& options) {
    const FrameFlags& flags = frame.flags();
    if (flags.encrypted) {
        throw Error(ErrorKind::UnsupportedFeature, frame.id() + ": encrypted frames cannot be written");
    }

    std::string id = identifierFor(frame.id(), version);
    if (!FrameRegistry::isValidFrameId(id, version)) {
        throw Error(ErrorKind::Parsing, "invalid frame identifier \"" + id + "\"");
    }

    ContentShape shape = shapeOf(frame.content());
    if (shape != ContentShape::Unknown && shape != FrameRegistry::contentShape(frame.id())) {
        throw Error(ErrorKind::Parsing, frame.id() + ": " + contentShapeName(shape) +
                    " content does not belong in this frame");
    }

    Encoding encoding = encodingForVersion(frame.encoding().value_or(defaultEncoding(version)), version);
    std::vector<uint8_t> content = ContentCodec::encode(frame.content(), version, encoding);

    std::vector<uint8_t> data;
    uint16_t bits = 0;

    if (version == Version::ID3v22) {
        data = std::move(content);
    } else {
        bool compress = flags.compressed || options.compression;
        std::vector<uint8_t> payload;
        if (compress) {
            Core::Compression::ZlibCompressor compressor;
            payload = compressor.compress(content.data(), content.size());
        } else {
            payload = content;
        }

        if (version == Version::ID3v23) {
            if (flags.tag_alter_preservation) bits |= V23_TAG_ALTER;
            if (flags.file_alter_preservation) bits |= V23_FILE_ALTER;
            if (flags.read_only) bits |= V23_READ_ONLY;
            if (compress) {
                bits |= V23_COMPRESSION;
                uint8_t size_bytes[4];
                ID3v2Utils::writeBE32(static_cast<uint32_t>(content.size()), size_bytes);
                data.insert(data.end(), size_bytes, size_bytes + 4);
            }
            if (flags.grouping_identifier) {
                bits |= V23_GROUPING;
                data.push_back(*flags.grouping_identifier);
            }
        } else {
            if (flags.tag_alter_preservation) bits |= V24_TAG_ALTER;
            if (flags.file_alter_preservation) bits |= V24_FILE_ALTER;
            if (flags.read_only) bits |= V24_READ_ONLY;
            if (flags.grouping_identifier) {
                bits |= V24_GROUPING;
                data.push_back(*flags.grouping_identifier);
            }
            if (compress) {
                bits |= V24_COMPRESSION;
            }
            if (compress || flags.has_data_length_indicator) {
                bits |= V24_DATA_LENGTH;
                uint8_t size_bytes[4];
                ID3v2Utils::encodeSynchsafeBytes(static_cast<uint32_t>(content.size()), size_bytes);
                data.insert(data.end(), size_bytes, size_bytes + 4);
            }
        }
        data.insert(data.end(), payload.begin(), payload.end());

        if (version == Version::ID3v24 && (flags.unsynchronised || options.unsynchronisation)) {
            bits |= V24_UNSYNC;
            data = ID3v2Utils::encodeUnsync(data.data(), data.size(), version);
        }
    }

    std::vector<uint8_t> out(headerSize(version));
    std::memcpy(out.data(), id.data(), id.size());
    switch (version) {
        case Version::ID3v22:
            if (data.size() > 0xFFFFFF) {
                throw Error(ErrorKind::Parsing, id + ": frame too large for ID3v2.2");
            }
            ID3v2Utils::writeBE24(static_cast<uint32_t>(data.size()), out.data() + 3);
            break;
        case Version::ID3v23:
            ID3v2Utils::writeBE32(static_cast<uint32_t>(data.size()), out.data() + 4);
            out[8] = static_cast<uint8_t>(bits >> 8);
            out[9] = static_cast<uint8_t>(bits & 0xFF);
            break;
        case Version::ID3v24:
            ID3v2Utils::encodeSynchsafeBytes(static_cast<uint32_t>(data.size()), out.data() + 4);
            out[8] = static_cast<uint8_t>(bits >> 8);
            out[9] = static_cast<uint8_t>(bits & 0xFF);
            break;
    }
    out.insert(out.end(), data.begin(), data.end());

    Debug::log("frame", "FrameCodec::encodeFrame: ", frame.id(), " as ", id, " (", versionName(version),
               "), ", data.size(), " bytes, flags 0x", std::hex, bits);
    return out;
}

} // namespace FrameCodec
} // namespace Tag
} // namespace TagForge
