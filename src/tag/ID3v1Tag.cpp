/*
 * ID3v1Tag.cpp - ID3v1/ID3v1.1 tag implementation
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
namespace Tag {

namespace {

// Field offsets within the 128-byte block
constexpr size_t TITLE_OFFSET = 3;
constexpr size_t ARTIST_OFFSET = 33;
constexpr size_t ALBUM_OFFSET = 63;
constexpr size_t YEAR_OFFSET = 93;
constexpr size_t COMMENT_OFFSET = 97;
constexpr size_t GENRE_OFFSET = 127;
constexpr size_t TEXT_WIDTH = 30;
constexpr size_t YEAR_WIDTH = 4;
constexpr size_t V11_COMMENT_WIDTH = 28;

[[noreturn]] void ioFailure(const IO::IOHandler& handler, const std::string& operation) {
    int code = handler.getLastError();
    std::string message = code != 0
        ? IO::IOHandler::getErrorMessage(code, operation)
        : operation + ": unexpected end of file";
    Debug::log("tag", "ID3v1Tag - ", message);
    throw Error(ErrorKind::Io, message);
}

off_t storeSize(IO::IOHandler& handler) {
    off_t size = handler.getFileSize();
    if (size < 0) {
        ioFailure(handler, "query file size");
    }
    return size;
}

} // anonymous namespace

// ============================================================================
// Static Methods
// ============================================================================

bool ID3v1Tag::isValid(const uint8_t* data, size_t size) {
    if (!data || size < TAG_SIZE) {
        return false;
    }
    // Check for "TAG" magic bytes
    return data[0] == 'T' && data[1] == 'A' && data[2] == 'G';
}

std::string ID3v1Tag::trimString(const uint8_t* data, size_t max_len) {
    // Find actual string length (stop at null or max_len)
    size_t len = 0;
    while (len < max_len && data[len] != '\0') {
        len++;
    }

    // Trim trailing spaces
    while (len > 0 && data[len - 1] == ' ') {
        len--;
    }

    return Core::Utility::UTF8Util::fromLatin1(data, len);
}

void ID3v1Tag::putField(const std::string& text, uint8_t* field, size_t width) {
    std::vector<uint32_t> codepoints;
    if (!Core::Utility::UTF8Util::toCodepoints(text, codepoints)) {
        throw Error(ErrorKind::StringDecoding, "ID3v1 field is not valid UTF-8");
    }
    size_t count = std::min(codepoints.size(), width);
    for (size_t i = 0; i < count; i++) {
        field[i] = codepoints[i] <= 0xFF ? static_cast<uint8_t>(codepoints[i]) : '?';
    }
}

ID3v1Tag ID3v1Tag::parse(const uint8_t* data, size_t size) {
    if (!isValid(data, size)) {
        throw Error(ErrorKind::NoTag, "no ID3v1 tag");
    }

    ID3v1Tag tag;
    tag.m_title = trimString(data + TITLE_OFFSET, TEXT_WIDTH);
    tag.m_artist = trimString(data + ARTIST_OFFSET, TEXT_WIDTH);
    tag.m_album = trimString(data + ALBUM_OFFSET, TEXT_WIDTH);

    // Year is four ASCII digits; anything else counts as unset
    std::string year_str = trimString(data + YEAR_OFFSET, YEAR_WIDTH);
    if (!year_str.empty() &&
        std::all_of(year_str.begin(), year_str.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        tag.m_year = static_cast<int32_t>(std::stoi(year_str));
    }

    // ID3v1.1: byte 28 of the comment is 0x00 and byte 29 is non-zero
    if (data[COMMENT_OFFSET + 28] == 0x00 && data[COMMENT_OFFSET + 29] != 0x00) {
        tag.m_comment = trimString(data + COMMENT_OFFSET, V11_COMMENT_WIDTH);
        tag.m_track = data[COMMENT_OFFSET + 29];
    } else {
        tag.m_comment = trimString(data + COMMENT_OFFSET, TEXT_WIDTH);
    }

    tag.m_genre_index = data[GENRE_OFFSET];

    Debug::log("tag", "ID3v1Tag::parse: title='", tag.m_title, "', artist='", tag.m_artist,
               "', album='", tag.m_album, "', year=", tag.m_year.value_or(0),
               ", genre=", static_cast<int>(tag.m_genre_index), tag.isID3v1_1() ? " (ID3v1.1)" : "");
    return tag;
}

std::vector<uint8_t> ID3v1Tag::render() const {
    std::vector<uint8_t> out(TAG_SIZE, 0x00);
    std::memcpy(out.data(), "TAG", 3);

    putField(m_title, out.data() + TITLE_OFFSET, TEXT_WIDTH);
    putField(m_artist, out.data() + ARTIST_OFFSET, TEXT_WIDTH);
    putField(m_album, out.data() + ALBUM_OFFSET, TEXT_WIDTH);
    if (m_year && *m_year >= 0 && *m_year <= 9999) {
        std::ostringstream ss;
        ss << std::setw(4) << std::setfill('0') << *m_year;
        putField(ss.str(), out.data() + YEAR_OFFSET, YEAR_WIDTH);
    }

    if (m_track && *m_track != 0) {
        putField(m_comment, out.data() + COMMENT_OFFSET, V11_COMMENT_WIDTH);
        out[COMMENT_OFFSET + 29] = *m_track;
    } else {
        putField(m_comment, out.data() + COMMENT_OFFSET, TEXT_WIDTH);
    }

    out[GENRE_OFFSET] = m_genre_index;
    return out;
}

ID3v2Tag ID3v1Tag::toID3v2() const {
    ID3v2Tag tag(Version::ID3v24);

    if (!m_title.empty()) {
        tag.setTitle(m_title);
    }
    if (!m_artist.empty()) {
        tag.setArtist(m_artist);
    }
    if (!m_album.empty()) {
        tag.setAlbum(m_album);
    }
    if (m_year) {
        tag.setYear(*m_year);
    }
    if (!m_comment.empty()) {
        tag.addComment(Comment{"eng", "", m_comment});
    }
    if (m_track) {
        tag.setTrack(*m_track);
    }
    if (std::optional<std::string> name = genre()) {
        tag.setGenre(*name);
    }
    return tag;
}

bool ID3v1Tag::isEmpty() const {
    return m_title.empty() && m_artist.empty() && m_album.empty() &&
           !m_year && m_comment.empty() && !m_track &&
           m_genre_index >= Genres::COUNT;
}

bool ID3v1Tag::operator==(const ID3v1Tag& other) const {
    return m_title == other.m_title && m_artist == other.m_artist && m_album == other.m_album &&
           m_year == other.m_year && m_comment == other.m_comment && m_track == other.m_track &&
           m_genre_index == other.m_genre_index;
}

// ============================================================================
// Storage
// ============================================================================

std::optional<off_t> ID3v1Tag::locate(IO::IOHandler& handler) {
    off_t size = storeSize(handler);
    if (size < static_cast<off_t>(TAG_SIZE)) {
        return std::nullopt;
    }

    off_t offset = size - static_cast<off_t>(TAG_SIZE);
    uint8_t magic[3];
    if (handler.seek(offset, SEEK_SET) != 0) {
        ioFailure(handler, "seek to ID3v1 tag");
    }
    if (handler.read(magic, 1, sizeof(magic)) != sizeof(magic)) {
        ioFailure(handler, "read ID3v1 magic");
    }
    if (std::memcmp(magic, "TAG", 3) != 0) {
        return std::nullopt;
    }
    return offset;
}

bool ID3v1Tag::isCandidate(IO::IOHandler& handler) {
    return locate(handler).has_value();
}

ID3v1Tag ID3v1Tag::readFrom(IO::IOHandler& handler) {
    std::optional<off_t> offset = locate(handler);
    if (!offset) {
        throw Error(ErrorKind::NoTag, "no ID3v1 tag at the end of the file");
    }

    uint8_t data[TAG_SIZE];
    if (handler.seek(*offset, SEEK_SET) != 0) {
        ioFailure(handler, "seek to ID3v1 tag");
    }
    if (handler.read(data, 1, TAG_SIZE) != TAG_SIZE) {
        ioFailure(handler, "read ID3v1 tag");
    }
    return parse(data, TAG_SIZE);
}

void ID3v1Tag::writeTo(IO::IOHandler& handler) const {
    std::vector<uint8_t> bytes = render();

    std::optional<off_t> offset = locate(handler);
    off_t position = offset ? *offset : storeSize(handler);

    Debug::log("tag", "ID3v1Tag::writeTo: ", offset ? "replacing" : "appending", " tag at ", position);

    if (handler.seek(position, SEEK_SET) != 0) {
        ioFailure(handler, "seek to ID3v1 tag");
    }
    if (handler.write(bytes.data(), 1, bytes.size()) != bytes.size()) {
        ioFailure(handler, "write ID3v1 tag");
    }
}

bool ID3v1Tag::removeFrom(IO::IOHandler& handler) {
    std::optional<off_t> offset = locate(handler);
    if (!offset) {
        return false;
    }
    Debug::log("tag", "ID3v1Tag::removeFrom: truncating to ", *offset);
    if (handler.truncate(*offset) != 0) {
        ioFailure(handler, "truncate ID3v1 tag");
    }
    return true;
}

bool ID3v1Tag::isCandidatePath(const std::string& path) {
    IO::File::FileIOHandler file(path);
    return isCandidate(file);
}

ID3v1Tag ID3v1Tag::readFromPath(const std::string& path) {
    IO::File::FileIOHandler file(path);
    return readFrom(file);
}

void ID3v1Tag::writeToPath(const std::string& path) const {
    IO::File::FileIOHandler file(path, IO::File::FileIOHandler::Mode::ReadWrite);
    writeTo(file);
    if (file.close() != 0) {
        ioFailure(file, "close " + path);
    }
}

bool ID3v1Tag::removeFromPath(const std::string& path) {
    IO::File::FileIOHandler file(path, IO::File::FileIOHandler::Mode::ReadWrite);
    bool removed = removeFrom(file);
    if (file.close() != 0) {
        ioFailure(file, "close " + path);
    }
    return removed;
}

} // namespace Tag
} // namespace TagForge
