/*
 * FrameCodec.h - ID3v2 frame header and body transforms
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGFORGE_TAG_FRAMECODEC_H
#define TAGFORGE_TAG_FRAMECODEC_H

// No direct includes - all includes should be in tagforge.h

namespace TagForge {
namespace Tag {
namespace FrameCodec {

/**
 * @brief A frame header as stored
 *
 * size counts the bytes after the header, as stored (compressed and/or
 * unsynchronised). flags is zero for ID3v2.2.
 */
struct FrameHeader {
    std::string id;
    uint32_t size = 0;
    uint16_t flags = 0;
};

// v2.3 flag bits, status byte high, format byte low
constexpr uint16_t V23_TAG_ALTER    = 0x8000;
constexpr uint16_t V23_FILE_ALTER   = 0x4000;
constexpr uint16_t V23_READ_ONLY    = 0x2000;
constexpr uint16_t V23_COMPRESSION  = 0x0080;
constexpr uint16_t V23_ENCRYPTION   = 0x0040;
constexpr uint16_t V23_GROUPING     = 0x0020;

// v2.4 flag bits
constexpr uint16_t V24_TAG_ALTER    = 0x4000;
constexpr uint16_t V24_FILE_ALTER   = 0x2000;
constexpr uint16_t V24_READ_ONLY    = 0x1000;
constexpr uint16_t V24_GROUPING     = 0x0040;
constexpr uint16_t V24_COMPRESSION  = 0x0008;
constexpr uint16_t V24_ENCRYPTION   = 0x0004;
constexpr uint16_t V24_UNSYNC       = 0x0002;
constexpr uint16_t V24_DATA_LENGTH  = 0x0001;

/**
 * @brief Frame header size: 6 bytes for v2.2, 10 otherwise
 */
size_t headerSize(Version version);

/**
 * @brief Read a frame header
 *
 * @return The header, or nullopt when the bytes are padding (first
 *         identifier byte is zero) or too few for a header
 * @throws Error(Parsing) for an identifier that is not A-Z0-9, or a
 *         v2.4 size with a high bit set
 */
std::optional<FrameHeader> readHeader(const uint8_t* data, size_t size, Version version);

/**
 * @brief Decode a frame body into a Frame
 *
 * Order: v2.4 unsynchronisation removal, header additions (decompressed
 * size, group id, encryption method, data length), inflate, content
 * decoding. ID3v2.2 identifiers are normalised to canonical form.
 *
 * @param header Header returned by readHeader()
 * @param body Stored frame body, header.size bytes
 * @param version Tag revision
 * @param tag_unsynchronised ID3v2.4 tag header unsynchronisation flag,
 *        which marks every frame as unsynchronised
 * @throws Error(UnsupportedFeature) for encrypted frames;
 *         Error(Parsing) or Error(StringDecoding) for malformed bodies
 */
Frame decodeBody(const FrameHeader& header, const uint8_t* body, Version version,
                 bool tag_unsynchronised = false);

/**
 * @brief Per-write frame options
 */
struct EncodeOptions {
    bool compression = false;       ///< Compress every frame (v2.3/2.4)
    bool unsynchronisation = false; ///< Unsynchronise every frame (v2.4)
};

/**
 * @brief Default text encoding for frames that do not carry one
 */
Encoding defaultEncoding(Version version);

/**
 * @brief Identifier a frame is written under in a revision
 * @throws Error(UnsupportedFeature) if the frame has no identifier there
 */
std::string identifierFor(const std::string& id, Version version);

/**
 * @brief Serialise a frame, header included
 *
 * Order: content encoding, compression, header additions,
 * unsynchronisation, header with the resulting size.
 *
 * @throws Error(UnsupportedFeature) for encrypted frames or identifiers
 *         the revision lacks; Error(StringDecoding) for text the frame's
 *         encoding cannot hold; Error(Parsing) for sizes that overflow
 *         the header field
 */
std::vector<uint8_t> encodeFrame(const Frame& frame, Version version, const EncodeOptions& options = {});

} // namespace FrameCodec
} // namespace Tag
} // namespace TagForge

#endif // TAGFORGE_TAG_FRAMECODEC_H
