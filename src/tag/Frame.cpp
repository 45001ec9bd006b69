/*
 * Frame.cpp - One ID3v2 frame: identifier, flags and payload
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

bool FrameFlags::operator==(const FrameFlags& other) const {
    return tag_alter_preservation == other.tag_alter_preservation &&
           file_alter_preservation == other.file_alter_preservation &&
           read_only == other.read_only &&
           grouping_identifier == other.grouping_identifier &&
           compressed == other.compressed &&
           encrypted == other.encrypted &&
           unsynchronised == other.unsynchronised &&
           has_data_length_indicator == other.has_data_length_indicator;
}

Frame::Frame(std::string id, Content content)
    : m_id(std::move(id)), m_content(std::move(content)) {
}

Frame Frame::text(const std::string& id, const std::string& value) {
    return Frame(id, Text{{value}});
}

Frame Frame::text(const std::string& id, std::vector<std::string> values) {
    return Frame(id, Text{std::move(values)});
}

Frame Frame::link(const std::string& id, const std::string& url) {
    return Frame(id, Link{url});
}

const std::string* Frame::textValue() const {
    const Text* text = get<Text>();
    if (!text || text->values.empty()) {
        return nullptr;
    }
    return &text->values.front();
}

std::string Frame::toString() const {
    return m_id + " = " + describeContent(m_content);
}

bool Frame::operator==(const Frame& other) const {
    return m_id == other.m_id && m_content == other.m_content;
}

} // namespace Tag
} // namespace TagForge
