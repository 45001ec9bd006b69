/*
 * Content.cpp - Typed payloads of ID3v2 frames
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

const char* pictureTypeName(PictureType type) {
    switch (type) {
        case PictureType::Other: return "Other";
        case PictureType::FileIcon: return "32x32 pixels 'file icon' (PNG only)";
        case PictureType::OtherFileIcon: return "Other file icon";
        case PictureType::FrontCover: return "Cover (front)";
        case PictureType::BackCover: return "Cover (back)";
        case PictureType::LeafletPage: return "Leaflet page";
        case PictureType::Media: return "Media (e.g. label side of CD)";
        case PictureType::LeadArtist: return "Lead artist/lead performer/soloist";
        case PictureType::Artist: return "Artist/performer";
        case PictureType::Conductor: return "Conductor";
        case PictureType::Band: return "Band/Orchestra";
        case PictureType::Composer: return "Composer";
        case PictureType::Lyricist: return "Lyricist/text writer";
        case PictureType::RecordingLocation: return "Recording Location";
        case PictureType::DuringRecording: return "During recording";
        case PictureType::DuringPerformance: return "During performance";
        case PictureType::MovieScreenCapture: return "Movie/video screen capture";
        case PictureType::BrightColoredFish: return "A bright coloured fish";
        case PictureType::Illustration: return "Illustration";
        case PictureType::BandLogotype: return "Band/artist logotype";
        case PictureType::PublisherLogotype: return "Publisher/Studio logotype";
    }
    return "Undefined";
}

ContentShape shapeOf(const Content& content) {
    return std::visit([](const auto& value) -> ContentShape {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Text>) return ContentShape::Text;
        else if constexpr (std::is_same_v<T, ExtendedText>) return ContentShape::ExtendedText;
        else if constexpr (std::is_same_v<T, Link>) return ContentShape::Link;
        else if constexpr (std::is_same_v<T, ExtendedLink>) return ContentShape::ExtendedLink;
        else if constexpr (std::is_same_v<T, Comment>) return ContentShape::Comment;
        else if constexpr (std::is_same_v<T, Lyrics>) return ContentShape::Lyrics;
        else if constexpr (std::is_same_v<T, Picture>) return ContentShape::Picture;
        else if constexpr (std::is_same_v<T, Popularimeter>) return ContentShape::Popularimeter;
        else if constexpr (std::is_same_v<T, Timestamp>) return ContentShape::Timestamp;
        else return ContentShape::Unknown;
    }, content);
}

std::string describeContent(const Content& content) {
    std::ostringstream ss;
    std::visit([&ss](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Text>) {
            for (size_t i = 0; i < value.values.size(); ++i) {
                if (i > 0) ss << " / ";
                ss << value.values[i];
            }
        } else if constexpr (std::is_same_v<T, ExtendedText>) {
            ss << "(" << value.description << ") " << value.value;
        } else if constexpr (std::is_same_v<T, Link>) {
            ss << value.url;
        } else if constexpr (std::is_same_v<T, ExtendedLink>) {
            ss << "(" << value.description << ") " << value.link;
        } else if constexpr (std::is_same_v<T, Comment> || std::is_same_v<T, Lyrics>) {
            ss << "[" << value.lang << "] (" << value.description << ") " << value.text;
        } else if constexpr (std::is_same_v<T, Picture>) {
            ss << value.mime_type << ", " << value.picture_type << ", \""
               << value.description << "\", " << value.data.size() << " bytes";
        } else if constexpr (std::is_same_v<T, Popularimeter>) {
            ss << value.user << " rating=" << static_cast<int>(value.rating)
               << " counter=" << value.counter;
        } else if constexpr (std::is_same_v<T, Timestamp>) {
            ss << value.toString();
        } else {
            ss << "<" << value.data.size() << " bytes>";
        }
    }, content);
    return ss.str();
}

} // namespace Tag
} // namespace TagForge
