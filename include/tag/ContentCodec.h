/*
 * ContentCodec.h - Wire layouts of ID3v2 frame bodies
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGFORGE_TAG_CONTENTCODEC_H
#define TAGFORGE_TAG_CONTENTCODEC_H

// No direct includes - all includes should be in tagforge.h

namespace TagForge {
namespace Tag {
namespace ContentCodec {

/**
 * @brief A decoded body and the text encoding it declared, if any
 */
struct Decoded {
    Content content;
    std::optional<Encoding> encoding;
};

/**
 * @brief Decode a frame body
 *
 * The shape comes from FrameRegistry::contentShape(id). The body
 * must already be free of compression and unsynchronisation.
 *
 * @param id Canonical frame identifier
 * @param version Revision of the tag the body was read from
 * @param data Frame body
 * @param size Body size in bytes
 * @throws Error(Parsing) for a malformed or truncated body or a bad
 *         encoding byte; Error(StringDecoding) for undecodable text
 */
Decoded decode(const std::string& id, Version version, const uint8_t* data, size_t size);

/**
 * @brief Encode a frame body
 *
 * @param content Payload to write
 * @param version Target revision (selects the APIC/PIC layout)
 * @param encoding Text encoding, must be legal for the revision
 * @throws Error(UnsupportedFeature) if the encoding is not legal for the
 *         revision; Error(StringDecoding) if text cannot be encoded;
 *         Error(Parsing) for a language code that is not 3 characters
 */
std::vector<uint8_t> encode(const Content& content, Version version, Encoding encoding);

/**
 * @brief Map a v2.2 image format ("JPG") to a MIME type ("image/jpeg")
 */
std::string mimeFromFormat(const std::string& format);

/**
 * @brief Map a MIME type back to a 3-character v2.2 image format
 */
std::string formatFromMime(const std::string& mime_type);

} // namespace ContentCodec
} // namespace Tag
} // namespace TagForge

#endif // TAGFORGE_TAG_CONTENTCODEC_H
