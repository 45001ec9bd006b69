/*
 * Encoding.h - ID3v2 text encodings and the string converter
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGFORGE_TAG_ENCODING_H
#define TAGFORGE_TAG_ENCODING_H

// No direct includes - all includes should be in tagforge.h

namespace TagForge {
namespace Tag {

/**
 * @brief ID3v2 text encodings, valued by their encoding byte
 */
enum class Encoding : uint8_t {
    Latin1 = 0,   // ISO-8859-1
    UTF16 = 1,    // UTF-16 with BOM
    UTF16BE = 2,  // UTF-16 Big Endian (no BOM), v2.4 only
    UTF8 = 3      // UTF-8, v2.4 only
};

const char* encodingName(Encoding encoding);

inline std::ostream& operator<<(std::ostream& os, Encoding encoding) {
    return os << encodingName(encoding);
}

/**
 * @brief Interpret a frame's encoding byte
 * @throws Error(Parsing) for values above 3
 */
Encoding encodingFromByte(uint8_t byte);

/**
 * @brief Whether a revision permits an encoding (2.2/2.3: Latin1 and UTF16)
 */
bool isEncodingAllowed(Encoding encoding, Version version);

/**
 * @brief Encoding actually written for a revision
 *
 * Encodings the revision does not permit are downgraded to UTF16, which
 * represents every string the others can.
 */
Encoding encodingForVersion(Encoding encoding, Version version);

/**
 * @brief Null terminator width: 1 for Latin1/UTF8, 2 for the UTF-16 forms
 */
size_t terminatorSize(Encoding encoding);

/**
 * @brief Locate the first terminator in encoded text
 *
 * For the UTF-16 forms only code-unit aligned 00 00 pairs count.
 *
 * @return Offset of the terminator, or size if there is none
 */
size_t findTerminator(const uint8_t* data, size_t size, Encoding encoding);

/**
 * @brief Decode encoded bytes to UTF-8
 *
 * UTF16 requires a leading byte order mark unless the input is empty.
 *
 * @throws Error(StringDecoding) on an unknown BOM, odd UTF-16 length,
 *         unpaired surrogate or invalid UTF-8
 */
std::string decodeString(const uint8_t* data, size_t size, Encoding encoding);

/**
 * @brief Encode UTF-8 text, without terminator
 *
 * UTF16 output is little-endian behind an FF FE byte order mark.
 *
 * @throws Error(StringDecoding) if the text is not valid UTF-8 or, for
 *         Latin1, holds a code point above U+00FF
 */
std::vector<uint8_t> encodeString(const std::string& text, Encoding encoding);

/**
 * @brief Whether every code point of text fits in the encoding
 */
bool canEncode(const std::string& text, Encoding encoding);

} // namespace Tag
} // namespace TagForge

#endif // TAGFORGE_TAG_ENCODING_H
