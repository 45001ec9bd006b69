/*
 * Genres.h - ID3v1 genre table (standard list plus Winamp extensions)
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGFORGE_TAG_GENRES_H
#define TAGFORGE_TAG_GENRES_H

// No direct includes - all includes should be in tagforge.h

namespace TagForge {
namespace Tag {
namespace Genres {

/// Number of genres in the table (0-79 standard, 80-191 Winamp)
constexpr size_t COUNT = 192;

/// Genre byte meaning "no genre" in an ID3v1 tag
constexpr uint8_t UNKNOWN = 255;

/**
 * @brief Genre name for an index
 * @return The name, or nullopt outside 0-191
 */
std::optional<std::string> name(int index);

/**
 * @brief Index of a genre name, compared case-insensitively
 */
std::optional<int> index(const std::string& name);

} // namespace Genres
} // namespace Tag
} // namespace TagForge

#endif // TAGFORGE_TAG_GENRES_H
