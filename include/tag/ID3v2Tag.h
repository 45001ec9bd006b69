/*
 * ID3v2Tag.h - In-memory ID3v2 tag
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGFORGE_TAG_ID3V2TAG_H
#define TAGFORGE_TAG_ID3V2TAG_H

// No direct includes - all includes should be in tagforge.h

namespace TagForge {
namespace Tag {

/**
 * @brief A frame the decoder dropped under the partial-tag-ok policy
 */
struct SkippedFrame {
    std::string id;
    ErrorKind kind;
    std::string message;
};

/**
 * @brief ID3v2 tag: a revision and an ordered list of frames
 *
 * Supports ID3v2 versions 2.2, 2.3 and 2.4. Frames keep their insertion
 * order. addFrame() enforces the uniqueness rules of the format:
 * - Text and URL frames (other than TXXX/WXXX), PCNT, MCDI and the
 *   timestamp frames exist at most once per identifier
 * - COMM and USLT are unique per (language, description)
 * - APIC per picture type
 * - TXXX and WXXX per description
 * - POPM per email
 *
 * Reading and writing are done by TagCodec; this class only holds data.
 */
class ID3v2Tag {
public:
    /**
     * @brief Empty ID3v2.4 tag
     */
    ID3v2Tag();
    explicit ID3v2Tag(Version version);

    Version version() const { return m_version; }
    void setVersion(Version version) { m_version = version; }

    // ========================================================================
    // Frames
    // ========================================================================

    const std::vector<Frame>& frames() const { return m_frames; }
    size_t frameCount() const { return m_frames.size(); }
    bool isEmpty() const { return m_frames.empty(); }

    /**
     * @brief Add a frame, replacing a frame it may not coexist with
     *
     * A replaced frame keeps its position in the frame list.
     *
     * @return The replaced frame, if any
     */
    std::optional<Frame> addFrame(Frame frame);

    /**
     * @brief First frame with an identifier
     * @return Pointer into the tag, or nullptr if not found
     */
    const Frame* getFrame(const std::string& id) const;

    /**
     * @brief All frames with an identifier, in tag order
     */
    std::vector<const Frame*> getFrames(const std::string& id) const;

    /**
     * @brief Remove every frame with an identifier
     * @return Removed frames, in tag order
     */
    std::vector<Frame> removeFrames(const std::string& id);

    /**
     * @brief Text of the first text frame with an identifier
     *
     * Multiple values are joined with '/' as ID3v2.3 writers do.
     */
    std::optional<std::string> textFor(const std::string& id) const;

    void setText(const std::string& id, const std::string& value);
    void setTextValues(const std::string& id, std::vector<std::string> values);

    // ========================================================================
    // Common fields
    // ========================================================================

    std::optional<std::string> title() const { return textFor("TIT2"); }
    void setTitle(const std::string& title) { setText("TIT2", title); }
    void removeTitle() { removeFrames("TIT2"); }

    std::optional<std::string> artist() const { return textFor("TPE1"); }
    void setArtist(const std::string& artist) { setText("TPE1", artist); }
    void removeArtist() { removeFrames("TPE1"); }

    std::optional<std::string> album() const { return textFor("TALB"); }
    void setAlbum(const std::string& album) { setText("TALB", album); }
    void removeAlbum() { removeFrames("TALB"); }

    std::optional<std::string> albumArtist() const { return textFor("TPE2"); }
    void setAlbumArtist(const std::string& album_artist) { setText("TPE2", album_artist); }
    void removeAlbumArtist() { removeFrames("TPE2"); }

    /**
     * @brief Raw TCON text
     */
    std::optional<std::string> genre() const { return textFor("TCON"); }
    void setGenre(const std::string& genre) { setText("TCON", genre); }
    void removeGenre() { removeFrames("TCON"); }

    /**
     * @brief TCON with ID3v1 genre references resolved
     *
     * "(31)", "31" and "(31)Trance" all give "Trance"; "(RX)" and "(CR)"
     * give "Remix" and "Cover". Anything else is returned unchanged.
     */
    std::optional<std::string> genreParsed() const;

    /**
     * @brief Recording year from TDRC, or TYER when there is no TDRC
     */
    std::optional<int32_t> year() const;

    /**
     * @brief Set the recording year, keeping the rest of TDRC
     *
     * TYER is removed; the codec writes TYER again for ID3v2.3 targets.
     */
    void setYear(int32_t year);
    void removeYear();

    std::optional<uint32_t> track() const;
    std::optional<uint32_t> totalTracks() const;
    void setTrack(uint32_t track);
    void setTotalTracks(uint32_t total);
    void removeTrack() { removeFrames("TRCK"); }

    std::optional<uint32_t> disc() const;
    std::optional<uint32_t> totalDiscs() const;
    void setDisc(uint32_t disc);
    void setTotalDiscs(uint32_t total);
    void removeDisc() { removeFrames("TPOS"); }

    /**
     * @brief TDRC, or a timestamp assembled from TYER, TDAT and TIME
     */
    std::optional<Timestamp> dateRecorded() const;
    void setDateRecorded(const Timestamp& timestamp);
    void removeDateRecorded();

    /**
     * @brief TDOR, or the year from TORY
     */
    std::optional<Timestamp> originalDateReleased() const;
    void setOriginalDateReleased(const Timestamp& timestamp);
    void removeOriginalDateReleased();

    // ========================================================================
    // Repeatable frames
    // ========================================================================

    std::vector<Picture> pictures() const;
    void addPicture(Picture picture);
    void removePicturesByType(PictureType type);
    void removeAllPictures() { removeFrames("APIC"); }

    std::vector<Comment> comments() const;
    void addComment(Comment comment);

    /**
     * @brief Remove comments matching every given field
     *
     * An unset field matches anything, so removeComment({}, {}) removes
     * all comments.
     */
    void removeComment(const std::optional<std::string>& description,
                       const std::optional<std::string>& text);

    std::vector<Lyrics> lyrics() const;
    void addLyrics(Lyrics lyrics);
    void removeAllLyrics() { removeFrames("USLT"); }

    std::vector<ExtendedText> extendedTexts() const;
    void addExtendedText(const std::string& description, const std::string& value);
    void removeExtendedText(const std::optional<std::string>& description);

    std::vector<ExtendedLink> extendedLinks() const;

    // ========================================================================
    // Decoder bookkeeping
    // ========================================================================

    const std::vector<SkippedFrame>& skippedFrames() const { return m_skipped; }
    void recordSkipped(SkippedFrame skipped) { m_skipped.push_back(std::move(skipped)); }

    /**
     * @brief Extended header bytes as read, including the size field
     *
     * Never written back.
     */
    const std::vector<uint8_t>& extendedHeader() const { return m_extended_header; }
    void setExtendedHeader(std::vector<uint8_t> bytes) { m_extended_header = std::move(bytes); }

    /**
     * @brief Tags are equal when they hold equal frames in the same order
     */
    bool operator==(const ID3v2Tag& other) const { return m_frames == other.m_frames; }
    bool operator!=(const ID3v2Tag& other) const { return !(*this == other); }

private:
    /**
     * @brief True if b may not coexist with a
     */
    static bool collides(const Frame& a, const Frame& b);

    /**
     * @brief Parse track/disc number from text (handles "N/M" format)
     */
    static std::pair<std::optional<uint32_t>, std::optional<uint32_t>> parseNumberPair(const std::string& text);
    void setNumberPair(const std::string& id, std::optional<uint32_t> number, std::optional<uint32_t> total);

    template<typename T>
    std::vector<T> collect(const std::string& id) const {
        std::vector<T> result;
        for (const Frame& frame : m_frames) {
            if (frame.id() == id) {
                if (const T* value = frame.get<T>()) {
                    result.push_back(*value);
                }
            }
        }
        return result;
    }

    Version m_version;
    std::vector<Frame> m_frames;
    std::vector<SkippedFrame> m_skipped;
    std::vector<uint8_t> m_extended_header;
};

} // namespace Tag
} // namespace TagForge

#endif // TAGFORGE_TAG_ID3V2TAG_H
