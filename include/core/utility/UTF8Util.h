/*
 * UTF8Util.h - Strict UTF-8 encoding/decoding utilities
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#ifndef TAGFORGE_CORE_UTILITY_UTF8UTIL_H
#define TAGFORGE_CORE_UTILITY_UTF8UTIL_H

#include <cstdint>
#include <string>
#include <vector>

namespace TagForge {
namespace Core {
namespace Utility {

/**
 * @brief Code point level conversions between UTF-8 and the byte
 *        encodings used by ID3 tags
 *
 * All text in TagForge is internally represented as UTF-8. Unlike a
 * display-oriented converter, nothing here substitutes U+FFFD: every
 * conversion that can meet invalid input reports it through its return
 * value and leaves the decision to the caller.
 *
 * Thread Safety: All methods are stateless and thread-safe.
 */
class UTF8Util {
public:
    // ========================================================================
    // Code points
    // ========================================================================

    /**
     * @brief Check that a value is a Unicode scalar value
     * @return true for U+0000..U+10FFFF excluding the surrogate range
     */
    static bool isValidCodepoint(uint32_t codepoint);

    /**
     * @brief Append the UTF-8 form of a scalar value
     * @param output String to append to
     * @param codepoint Code point, must satisfy isValidCodepoint()
     */
    static void appendCodepoint(std::string& output, uint32_t codepoint);

    /**
     * @brief Decode one UTF-8 sequence
     *
     * Overlong forms, surrogates, values above U+10FFFF and truncated
     * sequences are rejected.
     *
     * @param data Pointer to UTF-8 data
     * @param size Bytes available at data
     * @param codepoint Receives the decoded scalar value
     * @param bytesConsumed Receives the sequence length
     * @return false if the bytes do not start a valid sequence
     */
    static bool decodeCodepoint(const uint8_t* data, size_t size,
                                uint32_t& codepoint, size_t& bytesConsumed);

    /**
     * @brief Split a UTF-8 string into code points
     * @return false if the text is not valid UTF-8
     */
    static bool toCodepoints(const std::string& text, std::vector<uint32_t>& codepoints);

    // ========================================================================
    // UTF-8 Validation
    // ========================================================================

    static bool isValid(const uint8_t* data, size_t size);
    static bool isValid(const std::string& text);

    // ========================================================================
    // ISO-8859-1 (Latin-1) Conversion
    // ========================================================================

    /**
     * @brief Decode ISO-8859-1 (Latin-1) to UTF-8
     *
     * Every byte maps to the code point of the same value, so this cannot fail.
     */
    static std::string fromLatin1(const uint8_t* data, size_t size);

    /**
     * @brief Encode UTF-8 to ISO-8859-1
     * @param text UTF-8 string
     * @param output Receives one byte per code point
     * @return false if the text is invalid or holds a code point above U+00FF
     */
    static bool toLatin1(const std::string& text, std::vector<uint8_t>& output);

    // ========================================================================
    // UTF-16 Conversion
    // ========================================================================

    /**
     * @brief Decode UTF-16 to UTF-8
     * @param data UTF-16 code units, no byte order mark
     * @param size Size in bytes, must be even
     * @param bigEndian Byte order of the code units
     * @param output Receives the UTF-8 text
     * @return false on odd length or an unpaired surrogate
     */
    static bool fromUTF16(const uint8_t* data, size_t size, bool bigEndian, std::string& output);

    /**
     * @brief Encode UTF-8 to UTF-16 (no byte order mark)
     * @return false if the text is not valid UTF-8
     */
    static bool toUTF16(const std::string& text, bool bigEndian, std::vector<uint8_t>& output);
};

} // namespace Utility
} // namespace Core
} // namespace TagForge

#endif // TAGFORGE_CORE_UTILITY_UTF8UTIL_H
