/*
 * UTF8Util.cpp - Strict UTF-8 encoding/decoding utilities implementation
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
namespace Core {
namespace Utility {

bool UTF8Util::isValidCodepoint(uint32_t codepoint) {
    // Valid range: U+0000 to U+10FFFF, excluding surrogates (U+D800-U+DFFF)
    return codepoint <= 0x10FFFF && (codepoint < 0xD800 || codepoint > 0xDFFF);
}

void UTF8Util::appendCodepoint(std::string& output, uint32_t codepoint) {
    if (codepoint < 0x80) {
        output += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        output += static_cast<char>(0xC0 | (codepoint >> 6));
        output += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        output += static_cast<char>(0xE0 | (codepoint >> 12));
        output += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        output += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        output += static_cast<char>(0xF0 | (codepoint >> 18));
        output += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        output += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        output += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

bool UTF8Util::decodeCodepoint(const uint8_t* data, size_t size,
                               uint32_t& codepoint, size_t& bytesConsumed) {
    bytesConsumed = 0;
    if (!data || size == 0) {
        return false;
    }

    uint8_t c = data[0];
    size_t length;
    uint32_t cp;
    uint8_t lower = 0x80;
    uint8_t upper = 0xBF;

    if (c < 0x80) {
        codepoint = c;
        bytesConsumed = 1;
        return true;
    } else if (c >= 0xC2 && c <= 0xDF) {
        length = 2;
        cp = c & 0x1F;
    } else if (c >= 0xE0 && c <= 0xEF) {
        length = 3;
        cp = c & 0x0F;
        // Overlong and surrogate ranges
        if (c == 0xE0) lower = 0xA0;
        if (c == 0xED) upper = 0x9F;
    } else if (c >= 0xF0 && c <= 0xF4) {
        length = 4;
        cp = c & 0x07;
        // Overlong and > U+10FFFF ranges
        if (c == 0xF0) lower = 0x90;
        if (c == 0xF4) upper = 0x8F;
    } else {
        // Continuation byte, C0/C1 overlong lead, or F5..FF
        return false;
    }

    if (size < length) {
        return false;
    }
    if (data[1] < lower || data[1] > upper) {
        return false;
    }
    cp = (cp << 6) | (data[1] & 0x3F);
    for (size_t i = 2; i < length; ++i) {
        if ((data[i] & 0xC0) != 0x80) {
            return false;
        }
        cp = (cp << 6) | (data[i] & 0x3F);
    }

    codepoint = cp;
    bytesConsumed = length;
    return true;
}

bool UTF8Util::toCodepoints(const std::string& text, std::vector<uint32_t>& codepoints) {
    const uint8_t* data = reinterpret_cast<const uint8_t*>(text.data());
    size_t i = 0;
    codepoints.clear();
    codepoints.reserve(text.size());
    while (i < text.size()) {
        uint32_t cp;
        size_t consumed;
        if (!decodeCodepoint(data + i, text.size() - i, cp, consumed)) {
            return false;
        }
        codepoints.push_back(cp);
        i += consumed;
    }
    return true;
}

// ============================================================================
// UTF-8 Validation
// ============================================================================

bool UTF8Util::isValid(const uint8_t* data, size_t size) {
    size_t i = 0;
    while (i < size) {
        uint32_t cp;
        size_t consumed;
        if (!decodeCodepoint(data + i, size - i, cp, consumed)) {
            return false;
        }
        i += consumed;
    }
    return true;
}

bool UTF8Util::isValid(const std::string& text) {
    return isValid(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

// ============================================================================
// ISO-8859-1 (Latin-1) Conversion
// ============================================================================

std::string UTF8Util::fromLatin1(const uint8_t* data, size_t size) {
    std::string result;
    if (!data) {
        return result;
    }
    result.reserve(size + size / 4);
    for (size_t i = 0; i < size; ++i) {
        appendCodepoint(result, data[i]);
    }
    return result;
}

bool UTF8Util::toLatin1(const std::string& text, std::vector<uint8_t>& output) {
    std::vector<uint32_t> codepoints;
    if (!toCodepoints(text, codepoints)) {
        return false;
    }
    output.clear();
    output.reserve(codepoints.size());
    for (uint32_t cp : codepoints) {
        if (cp > 0xFF) {
            return false;
        }
        output.push_back(static_cast<uint8_t>(cp));
    }
    return true;
}

// ============================================================================
// UTF-16 Conversion
// ============================================================================

bool UTF8Util::fromUTF16(const uint8_t* data, size_t size, bool bigEndian, std::string& output) {
    output.clear();
    if (size % 2 != 0) {
        return false;
    }
    if (!data) {
        return size == 0;
    }

    auto unitAt = [data, bigEndian](size_t i) -> uint16_t {
        return bigEndian
            ? static_cast<uint16_t>((data[i] << 8) | data[i + 1])
            : static_cast<uint16_t>(data[i] | (data[i + 1] << 8));
    };

    output.reserve(size);
    for (size_t i = 0; i < size; i += 2) {
        uint16_t unit = unitAt(i);
        if (unit >= 0xD800 && unit <= 0xDBFF) {
            // High surrogate - need low surrogate
            if (i + 3 >= size) {
                return false;
            }
            uint16_t low = unitAt(i + 2);
            if (low < 0xDC00 || low > 0xDFFF) {
                return false;
            }
            uint32_t cp = 0x10000 + ((static_cast<uint32_t>(unit - 0xD800) << 10) | (low - 0xDC00));
            appendCodepoint(output, cp);
            i += 2;
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            // Orphan low surrogate
            return false;
        } else {
            appendCodepoint(output, unit);
        }
    }
    return true;
}

bool UTF8Util::toUTF16(const std::string& text, bool bigEndian, std::vector<uint8_t>& output) {
    std::vector<uint32_t> codepoints;
    if (!toCodepoints(text, codepoints)) {
        return false;
    }

    auto pushUnit = [&output, bigEndian](uint16_t unit) {
        if (bigEndian) {
            output.push_back(static_cast<uint8_t>(unit >> 8));
            output.push_back(static_cast<uint8_t>(unit & 0xFF));
        } else {
            output.push_back(static_cast<uint8_t>(unit & 0xFF));
            output.push_back(static_cast<uint8_t>(unit >> 8));
        }
    };

    output.clear();
    output.reserve(codepoints.size() * 2);
    for (uint32_t cp : codepoints) {
        if (cp < 0x10000) {
            pushUnit(static_cast<uint16_t>(cp));
        } else {
            // Supplementary character - surrogate pair
            cp -= 0x10000;
            pushUnit(static_cast<uint16_t>(0xD800 + ((cp >> 10) & 0x3FF)));
            pushUnit(static_cast<uint16_t>(0xDC00 + (cp & 0x3FF)));
        }
    }
    return true;
}

} // namespace Utility
} // namespace Core
} // namespace TagForge
