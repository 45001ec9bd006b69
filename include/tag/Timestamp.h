/*
 * Timestamp.h - Partial ISO-8601 timestamps used by ID3v2.4 time frames
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGFORGE_TAG_TIMESTAMP_H
#define TAGFORGE_TAG_TIMESTAMP_H

// No direct includes - all includes should be in tagforge.h

namespace TagForge {
namespace Tag {

/**
 * @brief yyyy[-MM[-dd[THH[:mm[:ss]]]]]
 *
 * Components after the first absent one are absent too. A value parsed
 * from text formats back to the same text.
 */
struct Timestamp {
    int32_t year = 0;
    std::optional<uint8_t> month;
    std::optional<uint8_t> day;
    std::optional<uint8_t> hour;
    std::optional<uint8_t> minute;
    std::optional<uint8_t> second;

    /**
     * @brief Parse a partial ISO-8601 timestamp
     * @throws Error(Parsing) if the text is not of the accepted form
     */
    static Timestamp parse(const std::string& text);

    /**
     * @brief Parse without throwing
     */
    static std::optional<Timestamp> tryParse(const std::string& text);

    std::string toString() const;

    bool operator==(const Timestamp& other) const;
    bool operator!=(const Timestamp& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const Timestamp& timestamp) {
    return os << timestamp.toString();
}

} // namespace Tag
} // namespace TagForge

#endif // TAGFORGE_TAG_TIMESTAMP_H
