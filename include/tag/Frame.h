/*
 * Frame.h - One ID3v2 frame: identifier, flags and payload
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGFORGE_TAG_FRAME_H
#define TAGFORGE_TAG_FRAME_H

// No direct includes - all includes should be in tagforge.h

namespace TagForge {
namespace Tag {

/**
 * @brief Frame header flags common to ID3v2.3 and ID3v2.4
 *
 * unsynchronised and has_data_length_indicator only exist in ID3v2.4.
 * ID3v2.2 frames have no flags at all.
 */
struct FrameFlags {
    bool tag_alter_preservation = false;
    bool file_alter_preservation = false;
    bool read_only = false;
    std::optional<uint8_t> grouping_identifier;
    bool compressed = false;
    bool encrypted = false;
    bool unsynchronised = false;
    bool has_data_length_indicator = false;

    bool operator==(const FrameFlags& other) const;
    bool operator!=(const FrameFlags& other) const { return !(*this == other); }
};

/**
 * @brief A frame as held by ID3v2Tag
 *
 * The identifier is canonical (4 characters) except for ID3v2.2 frames
 * that have no canonical equivalent, which keep their 3-character form.
 */
class Frame {
public:
    Frame(std::string id, Content content);

    /**
     * @brief Text frame holding a single value
     */
    static Frame text(const std::string& id, const std::string& value);

    /**
     * @brief Text frame holding several values (null separated on the wire)
     */
    static Frame text(const std::string& id, std::vector<std::string> values);

    static Frame link(const std::string& id, const std::string& url);

    const std::string& id() const { return m_id; }
    void setId(std::string id) { m_id = std::move(id); }

    const Content& content() const { return m_content; }
    Content& content() { return m_content; }
    void setContent(Content content) { m_content = std::move(content); }

    const FrameFlags& flags() const { return m_flags; }
    FrameFlags& flags() { return m_flags; }

    /**
     * @brief Text encoding read from the file, or requested for writing
     *
     * Unset means the writer's default for the target revision.
     */
    std::optional<Encoding> encoding() const { return m_encoding; }
    void setEncoding(std::optional<Encoding> encoding) { m_encoding = encoding; }

    /**
     * @brief Typed access to the payload
     * @return Pointer to the payload, or nullptr if it holds another shape
     */
    template<typename T>
    const T* get() const { return std::get_if<T>(&m_content); }

    template<typename T>
    T* get() { return std::get_if<T>(&m_content); }

    /**
     * @brief First value of a text frame, nullptr for other shapes
     */
    const std::string* textValue() const;

    std::string toString() const;

    /**
     * @brief Frames compare equal on identifier and payload
     */
    bool operator==(const Frame& other) const;
    bool operator!=(const Frame& other) const { return !(*this == other); }

private:
    std::string m_id;
    Content m_content;
    FrameFlags m_flags;
    std::optional<Encoding> m_encoding;
};

inline std::ostream& operator<<(std::ostream& os, const Frame& frame) {
    return os << frame.toString();
}

} // namespace Tag
} // namespace TagForge

#endif // TAGFORGE_TAG_FRAME_H
