/*
 * ID3v1v2.h - Operations over both tag formats at once
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGFORGE_TAG_ID3V1V2_H
#define TAGFORGE_TAG_ID3V1V2_H

// No direct includes - all includes should be in tagforge.h

namespace TagForge {
namespace Tag {
namespace ID3v1v2 {

/**
 * @brief Which tag formats a store carries
 */
enum class FormatVersion {
    None,
    ID3v1,
    ID3v2,
    Both
};

const char* formatVersionName(FormatVersion format);

inline std::ostream& operator<<(std::ostream& os, FormatVersion format) {
    return os << formatVersionName(format);
}

FormatVersion isCandidate(IO::IOHandler& handler);
FormatVersion isCandidatePath(const std::string& path);

/**
 * @brief Read the ID3v2 tag, or the ID3v1 tag converted when there is none
 * @throws Error NoTag if the store carries neither
 */
ID3v2Tag readFrom(IO::IOHandler& handler, const TagCodec::DecoderOptions& options = {});
ID3v2Tag readFromPath(const std::string& path, const TagCodec::DecoderOptions& options = {});

/**
 * @brief Write the ID3v2 tag and drop any ID3v1 tag
 *
 * ID3v1 cannot hold everything ID3v2 does, so a stale copy is removed
 * rather than left to disagree with the new tag.
 */
void writeTo(IO::IOHandler& handler, const ID3v2Tag& tag, const TagCodec::EncoderOptions& options);
void writeTo(IO::IOHandler& handler, const ID3v2Tag& tag, Version version);
void writeToPath(const std::string& path, const ID3v2Tag& tag, const TagCodec::EncoderOptions& options);
void writeToPath(const std::string& path, const ID3v2Tag& tag, Version version);

/**
 * @brief Remove both tags
 * @return The formats present before removal
 */
FormatVersion removeFrom(IO::IOHandler& handler);
FormatVersion removeFromPath(const std::string& path);

} // namespace ID3v1v2
} // namespace Tag
} // namespace TagForge

#endif // TAGFORGE_TAG_ID3V1V2_H
