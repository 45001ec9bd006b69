/*
 * Version.h - ID3v2 revision selector
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGFORGE_TAG_VERSION_H
#define TAGFORGE_TAG_VERSION_H

namespace TagForge {
namespace Tag {

/**
 * @brief The three ID3v2 revisions, valued by their header major byte
 *
 * Every codec call takes the revision explicitly and switches on it
 * locally.
 */
enum class Version : uint8_t {
    ID3v22 = 2,
    ID3v23 = 3,
    ID3v24 = 4
};

/**
 * @brief Map a header major version byte to a revision
 * @return The revision, or nullopt for anything other than 2, 3 or 4
 */
inline std::optional<Version> versionFromMajor(uint8_t major) {
    switch (major) {
        case 2: return Version::ID3v22;
        case 3: return Version::ID3v23;
        case 4: return Version::ID3v24;
        default: return std::nullopt;
    }
}

inline uint8_t majorVersion(Version version) {
    return static_cast<uint8_t>(version);
}

inline const char* versionName(Version version) {
    switch (version) {
        case Version::ID3v22: return "ID3v2.2";
        case Version::ID3v23: return "ID3v2.3";
        case Version::ID3v24: return "ID3v2.4";
    }
    return "ID3v2.?";
}

inline std::ostream& operator<<(std::ostream& os, Version version) {
    return os << versionName(version);
}

} // namespace Tag
} // namespace TagForge

#endif // TAGFORGE_TAG_VERSION_H
