/*
 * Content.h - Typed payloads of ID3v2 frames
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGFORGE_TAG_CONTENT_H
#define TAGFORGE_TAG_CONTENT_H

// No direct includes - all includes should be in tagforge.h

namespace TagForge {
namespace Tag {

/**
 * @brief APIC picture type byte
 *
 * Values outside the enumerators are kept as read.
 */
enum class PictureType : uint8_t {
    Other = 0,
    FileIcon = 1,
    OtherFileIcon = 2,
    FrontCover = 3,
    BackCover = 4,
    LeafletPage = 5,
    Media = 6,
    LeadArtist = 7,
    Artist = 8,
    Conductor = 9,
    Band = 10,
    Composer = 11,
    Lyricist = 12,
    RecordingLocation = 13,
    DuringRecording = 14,
    DuringPerformance = 15,
    MovieScreenCapture = 16,
    BrightColoredFish = 17,
    Illustration = 18,
    BandLogotype = 19,
    PublisherLogotype = 20
};

const char* pictureTypeName(PictureType type);

inline std::ostream& operator<<(std::ostream& os, PictureType type) {
    return os << pictureTypeName(type);
}

/**
 * @brief T*** text information; v2.4 may hold several values
 */
struct Text {
    std::vector<std::string> values;

    bool operator==(const Text& other) const { return values == other.values; }
};

/**
 * @brief TXXX
 */
struct ExtendedText {
    std::string description;
    std::string value;

    bool operator==(const ExtendedText& other) const {
        return description == other.description && value == other.value;
    }
};

/**
 * @brief W*** URL link
 */
struct Link {
    std::string url;

    bool operator==(const Link& other) const { return url == other.url; }
};

/**
 * @brief WXXX
 */
struct ExtendedLink {
    std::string description;
    std::string link;

    bool operator==(const ExtendedLink& other) const {
        return description == other.description && link == other.link;
    }
};

/**
 * @brief COMM. lang is the 3-byte language field, kept as read
 */
struct Comment {
    std::string lang;
    std::string description;
    std::string text;

    bool operator==(const Comment& other) const {
        return lang == other.lang && description == other.description && text == other.text;
    }
};

/**
 * @brief USLT, laid out like Comment
 */
struct Lyrics {
    std::string lang;
    std::string description;
    std::string text;

    bool operator==(const Lyrics& other) const {
        return lang == other.lang && description == other.description && text == other.text;
    }
};

/**
 * @brief APIC (PIC in v2.2, where mime_type is derived from a 3-letter format)
 */
struct Picture {
    std::string mime_type;
    PictureType picture_type = PictureType::Other;
    std::string description;
    std::vector<uint8_t> data;

    bool operator==(const Picture& other) const {
        return mime_type == other.mime_type && picture_type == other.picture_type &&
               description == other.description && data == other.data;
    }
};

/**
 * @brief POPM
 */
struct Popularimeter {
    std::string user;
    uint8_t rating = 0;
    uint64_t counter = 0;

    bool operator==(const Popularimeter& other) const {
        return user == other.user && rating == other.rating && counter == other.counter;
    }
};

/**
 * @brief Frame body kept byte for byte
 */
struct Unknown {
    std::vector<uint8_t> data;

    bool operator==(const Unknown& other) const { return data == other.data; }
};

/**
 * @brief Closed set of frame payloads; the alternative in use always
 *        matches FrameRegistry::contentShape() of the frame identifier,
 *        except that any frame may carry Unknown
 */
using Content = std::variant<Text, ExtendedText, Link, ExtendedLink, Comment,
                             Lyrics, Picture, Popularimeter, Timestamp, Unknown>;

/**
 * @brief Shape of the alternative held by a Content
 */
ContentShape shapeOf(const Content& content);

/**
 * @brief One-line human readable rendering, used by the command line tool
 */
std::string describeContent(const Content& content);

} // namespace Tag
} // namespace TagForge

#endif // TAGFORGE_TAG_CONTENT_H
