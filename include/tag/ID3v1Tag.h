/*
 * ID3v1Tag.h - ID3v1/ID3v1.1 tag implementation
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGFORGE_TAG_ID3V1TAG_H
#define TAGFORGE_TAG_ID3V1TAG_H

// No direct includes - all includes should be in tagforge.h

namespace TagForge {
namespace Tag {

/**
 * @brief ID3v1/ID3v1.1 tag implementation
 *
 * ID3v1 is a simple fixed-size metadata format appended to MP3 files.
 * The tag is exactly 128 bytes and contains:
 * - 3 bytes: "TAG" identifier
 * - 30 bytes: Title
 * - 30 bytes: Artist
 * - 30 bytes: Album
 * - 4 bytes: Year
 * - 30 bytes: Comment (28 bytes + null + track in ID3v1.1)
 * - 1 byte: Genre index
 *
 * ID3v1.1 extends ID3v1 by using the last two bytes of the comment field
 * to store a track number (byte 28 = 0x00, byte 29 = track number).
 *
 * Text is ISO-8859-1 on disk and UTF-8 in memory. Characters above
 * U+00FF are written as '?' and fields are cut to their width.
 */
class ID3v1Tag {
public:
    /// ID3v1 tag size in bytes
    static constexpr size_t TAG_SIZE = 128;

    ID3v1Tag() = default;

    /**
     * @brief Parse ID3v1 tag from raw data
     * @param data At least 128 bytes starting with "TAG"
     * @throws Error NoTag if the data is short or lacks the magic
     */
    static ID3v1Tag parse(const uint8_t* data, size_t size);

    /**
     * @brief Check if data contains a valid ID3v1 tag
     */
    static bool isValid(const uint8_t* data, size_t size);

    /**
     * @brief The 128-byte on-disk form
     */
    std::vector<uint8_t> render() const;

    /**
     * @brief ID3v2.4 tag carrying the same fields
     *
     * The comment becomes a COMM frame in language "eng" with an empty
     * description; the genre byte becomes its name.
     */
    ID3v2Tag toID3v2() const;

    // ========================================================================
    // Storage
    // ========================================================================

    /**
     * @brief True if the last 128 bytes of the store start with "TAG"
     */
    static bool isCandidate(IO::IOHandler& handler);

    /**
     * @throws Error NoTag if the store has no ID3v1 tag
     */
    static ID3v1Tag readFrom(IO::IOHandler& handler);

    /**
     * @brief Overwrite the existing ID3v1 tag, or append one
     */
    void writeTo(IO::IOHandler& handler) const;

    /**
     * @return false if the store had no ID3v1 tag
     */
    static bool removeFrom(IO::IOHandler& handler);

    static bool isCandidatePath(const std::string& path);
    static ID3v1Tag readFromPath(const std::string& path);
    void writeToPath(const std::string& path) const;
    static bool removeFromPath(const std::string& path);

    // ========================================================================
    // Fields
    // ========================================================================

    const std::string& title() const { return m_title; }
    void setTitle(std::string title) { m_title = std::move(title); }

    const std::string& artist() const { return m_artist; }
    void setArtist(std::string artist) { m_artist = std::move(artist); }

    const std::string& album() const { return m_album; }
    void setAlbum(std::string album) { m_album = std::move(album); }

    std::optional<int32_t> year() const { return m_year; }
    void setYear(std::optional<int32_t> year) { m_year = year; }

    const std::string& comment() const { return m_comment; }
    void setComment(std::string comment) { m_comment = std::move(comment); }

    /**
     * @brief Track number; present only in ID3v1.1 tags
     */
    std::optional<uint8_t> track() const { return m_track; }
    void setTrack(std::optional<uint8_t> track) { m_track = track; }

    /**
     * @brief Check if this is an ID3v1.1 tag (has track number)
     */
    bool isID3v1_1() const { return m_track.has_value(); }

    /**
     * @brief Get the raw genre index
     * @return Genre index (0-191), or 255 if unknown
     */
    uint8_t genreIndex() const { return m_genre_index; }
    void setGenreIndex(uint8_t index) { m_genre_index = index; }

    /**
     * @brief Genre name, nullopt for indices outside the table
     */
    std::optional<std::string> genre() const { return Genres::name(m_genre_index); }

    bool isEmpty() const;

    bool operator==(const ID3v1Tag& other) const;
    bool operator!=(const ID3v1Tag& other) const { return !(*this == other); }

private:
    std::string m_title;
    std::string m_artist;
    std::string m_album;
    std::optional<int32_t> m_year;
    std::string m_comment;
    std::optional<uint8_t> m_track;
    uint8_t m_genre_index = Genres::UNKNOWN;

    /**
     * @brief Trim trailing null bytes and spaces, then decode ISO-8859-1
     */
    static std::string trimString(const uint8_t* data, size_t max_len);

    /**
     * @brief Write text into a zero-filled fixed-width field
     */
    static void putField(const std::string& text, uint8_t* field, size_t width);

    /**
     * @brief Offset of the tag in the store, or nullopt if there is none
     */
    static std::optional<off_t> locate(IO::IOHandler& handler);
};

} // namespace Tag
} // namespace TagForge

#endif // TAGFORGE_TAG_ID3V1TAG_H
