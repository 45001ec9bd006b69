/*
 * FrameRegistry.h - Static table of ID3v2 frame identifiers
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGFORGE_TAG_FRAMEREGISTRY_H
#define TAGFORGE_TAG_FRAMEREGISTRY_H

// No direct includes - all includes should be in tagforge.h

namespace TagForge {
namespace Tag {

/**
 * @brief Payload layout of a frame, chosen by identifier
 */
enum class ContentShape {
    Text,
    ExtendedText,
    Link,
    ExtendedLink,
    Comment,
    Lyrics,
    Picture,
    Popularimeter,
    Timestamp,
    Unknown
};

const char* contentShapeName(ContentShape shape);

inline std::ostream& operator<<(std::ostream& os, ContentShape shape) {
    return os << contentShapeName(shape);
}

namespace FrameRegistry {

/**
 * @brief One row of the identifier table
 */
struct FrameInfo {
    const char* id;          ///< Canonical 4-character identifier
    const char* legacy;      ///< ID3v2.2 identifier, nullptr if none exists
    ContentShape shape;
    bool singular;           ///< At most one frame with this id per tag
    bool v24_only;           ///< Introduced by ID3v2.4, absent from 2.3
    const char* description;
};

/**
 * @brief Find the table row for a canonical identifier
 * @return Row pointer, or nullptr for identifiers not in the table
 */
const FrameInfo* lookup(const std::string& id);

/**
 * @brief Map a 3-character ID3v2.2 identifier to its canonical form
 */
std::optional<std::string> canonicalFromLegacy(const std::string& legacy);

/**
 * @brief Map a canonical identifier to its ID3v2.2 form
 */
std::optional<std::string> legacyFromCanonical(const std::string& id);

/**
 * @brief Content shape used for an identifier
 *
 * Identifiers missing from the table fall back on their first letter:
 * T*** is Text, W*** is Link, everything else (including 3-character
 * identifiers that had no canonical form) is Unknown. ID3v2.2 identifiers
 * are mapped to their canonical form before lookup, so the shape does not
 * depend on the tag version.
 */
ContentShape contentShape(const std::string& id);

/**
 * @brief Whether a tag may hold only one frame with this identifier
 */
bool isSingular(const std::string& id);

/**
 * @brief Whether the identifier only exists in ID3v2.4
 */
bool isV24Only(const std::string& id);

/**
 * @brief Whether the identifier is well formed for a header of this revision
 *
 * Identifiers are 3 (v2.2) or 4 (v2.3/2.4) characters from A-Z and 0-9.
 */
bool isValidFrameId(const std::string& id, Version version);

} // namespace FrameRegistry
} // namespace Tag
} // namespace TagForge

#endif // TAGFORGE_TAG_FRAMEREGISTRY_H
