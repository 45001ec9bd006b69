/*
 * TagCodec.h - ID3v2 tag header, frame sequence and storage entry points
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGFORGE_TAG_TAGCODEC_H
#define TAGFORGE_TAG_TAGCODEC_H

// No direct includes - all includes should be in tagforge.h

namespace TagForge {
namespace Tag {
namespace TagCodec {

/// ID3v2 header and footer size in bytes
constexpr size_t HEADER_SIZE = 10;

// Header flags
constexpr uint8_t FLAG_UNSYNCHRONISATION = 0x80;
constexpr uint8_t FLAG_EXTENDED_HEADER = 0x40;
constexpr uint8_t FLAG_EXPERIMENTAL = 0x20;
constexpr uint8_t FLAG_FOOTER = 0x10;
/// In ID3v2.2 bit 6 announces a compression scheme that was never defined
constexpr uint8_t V22_FLAG_COMPRESSION = 0x40;

/**
 * @brief The fixed 10-byte ID3v2 header
 */
struct TagHeader {
    Version version = Version::ID3v24;
    uint8_t revision = 0;
    uint8_t flags = 0;
    uint32_t size = 0;      ///< Excludes the header and the footer

    bool unsynchronised() const { return (flags & FLAG_UNSYNCHRONISATION) != 0; }
    bool hasExtendedHeader() const {
        return version != Version::ID3v22 && (flags & FLAG_EXTENDED_HEADER) != 0;
    }
    bool hasFooter() const { return version == Version::ID3v24 && (flags & FLAG_FOOTER) != 0; }

    /**
     * @brief Offset one past the tag, footer included
     */
    size_t tagEnd() const { return HEADER_SIZE + size + (hasFooter() ? HEADER_SIZE : 0); }
};

struct DecoderOptions {
    /// Skip frames that fail to decode instead of failing the read
    bool partial_tag_ok = false;
};

struct EncoderOptions {
    Version version = Version::ID3v24;
    /// zlib-compress every frame (ignored for ID3v2.2)
    bool compression = false;
    /// Whole-tag unsynchronisation (v2.2/v2.3) or per-frame (v2.4)
    bool unsynchronisation = false;
    /// Append a "3DI" footer; ID3v2.4 only, no padding is written then
    bool footer = false;
    /// Zero bytes after the last frame
    size_t padding = 0;
};

/**
 * @brief Parse the 10-byte header
 * @throws Error NoTag (no "ID3" magic), UnsupportedVersion (major not
 *         2/3/4, or revision 0xFF), UnsupportedFeature (ID3v2.2
 *         compression), Parsing (bad size field)
 */
TagHeader parseHeader(const uint8_t* data, size_t size);

/**
 * @brief Decode a complete tag
 *
 * Frame errors either throw an Error that carries the frames decoded so
 * far, or with partial_tag_ok are recorded on the tag as SkippedFrame.
 */
ID3v2Tag decode(const uint8_t* data, size_t size, const DecoderOptions& options = {});
ID3v2Tag decode(const std::vector<uint8_t>& data, const DecoderOptions& options = {});

/**
 * @brief Copy of a tag with its date frames expressed the way a revision
 *        stores them
 *
 * For ID3v2.2/2.3 TDRC becomes TYER/TDAT/TIME and TDOR becomes TORY; for
 * ID3v2.4 the reverse happens.
 */
ID3v2Tag convertForVersion(const ID3v2Tag& tag, Version version);

/**
 * @brief Encode a tag
 * @throws Error UnsupportedFeature or Parsing if any frame cannot be
 *         represented in the target revision
 */
std::vector<uint8_t> encode(const ID3v2Tag& tag, const EncoderOptions& options = {});

// ============================================================================
// Storage
// ============================================================================

/**
 * @brief True if the store starts with an ID3v2 header
 */
bool isCandidate(IO::IOHandler& handler);

/**
 * @throws Error NoTag if the store has no ID3v2 tag
 */
ID3v2Tag readFrom(IO::IOHandler& handler, const DecoderOptions& options = {});

/**
 * @brief readFrom() with absence reported as nullopt
 */
std::optional<ID3v2Tag> readFromNoTagOk(IO::IOHandler& handler, const DecoderOptions& options = {});

/**
 * @brief Encode the tag and splice it over the existing one
 *
 * Encoding completes before the store is touched.
 */
void writeTo(IO::IOHandler& handler, const ID3v2Tag& tag, const EncoderOptions& options = {});

/**
 * @return false if the store had no ID3v2 tag
 */
bool removeFrom(IO::IOHandler& handler);

bool isCandidatePath(const std::string& path);
ID3v2Tag readFromPath(const std::string& path, const DecoderOptions& options = {});
void writeToPath(const std::string& path, const ID3v2Tag& tag, const EncoderOptions& options = {});
bool removeFromPath(const std::string& path);

} // namespace TagCodec
} // namespace Tag
} // namespace TagForge

#endif // TAGFORGE_TAG_TAGCODEC_H
