/*
 * ID3v2Tag.cpp - In-memory ID3v2 tag
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

// Exactly `count` ASCII digits starting at `pos`
std::optional<int> parseDigits(const std::string& text, size_t pos, size_t count) {
    if (pos + count > text.size()) {
        return std::nullopt;
    }
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return std::nullopt;
        }
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

std::optional<uint32_t> parseNumber(const std::string& text) {
    if (text.empty() || text.size() > 9) {
        return std::nullopt;
    }
    uint32_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint32_t>(c - '0');
    }
    return value;
}

} // anonymous namespace

ID3v2Tag::ID3v2Tag() : m_version(Version::ID3v24) {
}

ID3v2Tag::ID3v2Tag(Version version) : m_version(version) {
}

// ============================================================================
// Frames
// ============================================================================

bool ID3v2Tag::collides(const Frame& a, const Frame& b) {
    if (a.id() != b.id()) {
        return false;
    }
    if (FrameRegistry::isSingular(a.id())) {
        return true;
    }

    if (const Comment* ca = a.get<Comment>()) {
        const Comment* cb = b.get<Comment>();
        return cb && ca->lang == cb->lang && ca->description == cb->description;
    }
    if (const Lyrics* la = a.get<Lyrics>()) {
        const Lyrics* lb = b.get<Lyrics>();
        return lb && la->lang == lb->lang && la->description == lb->description;
    }
    if (const Picture* pa = a.get<Picture>()) {
        const Picture* pb = b.get<Picture>();
        return pb && pa->picture_type == pb->picture_type;
    }
    if (const ExtendedText* ta = a.get<ExtendedText>()) {
        const ExtendedText* tb = b.get<ExtendedText>();
        return tb && ta->description == tb->description;
    }
    if (const ExtendedLink* wa = a.get<ExtendedLink>()) {
        const ExtendedLink* wb = b.get<ExtendedLink>();
        return wb && wa->description == wb->description;
    }
    if (const Popularimeter* pa = a.get<Popularimeter>()) {
        const Popularimeter* pb = b.get<Popularimeter>();
        return pb && pa->user == pb->user;
    }
    return false;
}

std::optional<Frame> ID3v2Tag::addFrame(Frame frame) {
    for (Frame& existing : m_frames) {
        if (collides(existing, frame)) {
            Frame replaced = std::move(existing);
            existing = std::move(frame);
            return replaced;
        }
    }
    m_frames.push_back(std::move(frame));
    return std::nullopt;
}

const Frame* ID3v2Tag::getFrame(const std::string& id) const {
    for (const Frame& frame : m_frames) {
        if (frame.id() == id) {
            return &frame;
        }
    }
    return nullptr;
}

std::vector<const Frame*> ID3v2Tag::getFrames(const std::string& id) const {
    std::vector<const Frame*> result;
    for (const Frame& frame : m_frames) {
        if (frame.id() == id) {
            result.push_back(&frame);
        }
    }
    return result;
}

std::vector<Frame> ID3v2Tag::removeFrames(const std::string& id) {
    std::vector<Frame> removed;
    auto keep = std::stable_partition(m_frames.begin(), m_frames.end(),
                                      [&id](const Frame& frame) { return frame.id() != id; });
    std::move(keep, m_frames.end(), std::back_inserter(removed));
    m_frames.erase(keep, m_frames.end());
    return removed;
}

std::optional<std::string> ID3v2Tag::textFor(const std::string& id) const {
    const Frame* frame = getFrame(id);
    if (!frame) {
        return std::nullopt;
    }
    const Text* text = frame->get<Text>();
    if (!text) {
        return std::nullopt;
    }

    std::string joined;
    for (size_t i = 0; i < text->values.size(); ++i) {
        if (i > 0) joined += '/';
        joined += text->values[i];
    }
    return joined;
}

void ID3v2Tag::setText(const std::string& id, const std::string& value) {
    addFrame(Frame::text(id, value));
}

void ID3v2Tag::setTextValues(const std::string& id, std::vector<std::string> values) {
    addFrame(Frame::text(id, std::move(values)));
}

// ============================================================================
// Common fields
// ============================================================================

std::optional<std::string> ID3v2Tag::genreParsed() const {
    std::optional<std::string> raw = genre();
    if (!raw) {
        return std::nullopt;
    }
    const std::string& text = *raw;

    // Handle ID3v1-style genre numbers in parentheses
    if (!text.empty() && text[0] == '(') {
        size_t close_paren = text.find(')');
        if (close_paren != std::string::npos) {
            std::string reference = text.substr(1, close_paren - 1);
            std::string refinement = text.substr(close_paren + 1);
            if (!refinement.empty()) {
                return refinement;
            }
            if (reference == "RX") {
                return std::string("Remix");
            }
            if (reference == "CR") {
                return std::string("Cover");
            }
            if (std::optional<uint32_t> index = parseNumber(reference)) {
                if (std::optional<std::string> name = Genres::name(static_cast<int>(*index))) {
                    return name;
                }
            }
            return raw;
        }
    }

    if (std::optional<uint32_t> index = parseNumber(text)) {
        if (std::optional<std::string> name = Genres::name(static_cast<int>(*index))) {
            return name;
        }
    }
    return raw;
}

std::optional<int32_t> ID3v2Tag::year() const {
    if (const Frame* frame = getFrame("TDRC")) {
        if (const Timestamp* timestamp = frame->get<Timestamp>()) {
            return timestamp->year;
        }
    }
    if (std::optional<std::string> text = textFor("TYER")) {
        if (std::optional<int> value = parseDigits(*text, 0, 4)) {
            return *value;
        }
    }
    return std::nullopt;
}

void ID3v2Tag::setYear(int32_t year) {
    Timestamp timestamp = dateRecorded().value_or(Timestamp{});
    timestamp.year = year;
    setDateRecorded(timestamp);
}

void ID3v2Tag::removeYear() {
    removeDateRecorded();
}

std::pair<std::optional<uint32_t>, std::optional<uint32_t>> ID3v2Tag::parseNumberPair(const std::string& text) {
    size_t slash_pos = text.find('/');
    if (slash_pos == std::string::npos) {
        return {parseNumber(text), std::nullopt};
    }
    return {parseNumber(text.substr(0, slash_pos)), parseNumber(text.substr(slash_pos + 1))};
}

void ID3v2Tag::setNumberPair(const std::string& id, std::optional<uint32_t> number, std::optional<uint32_t> total) {
    std::string value = std::to_string(number.value_or(1));
    if (total) {
        value += "/" + std::to_string(*total);
    }
    setText(id, value);
}

std::optional<uint32_t> ID3v2Tag::track() const {
    std::optional<std::string> text = textFor("TRCK");
    return text ? parseNumberPair(*text).first : std::nullopt;
}

std::optional<uint32_t> ID3v2Tag::totalTracks() const {
    std::optional<std::string> text = textFor("TRCK");
    return text ? parseNumberPair(*text).second : std::nullopt;
}

void ID3v2Tag::setTrack(uint32_t track) {
    setNumberPair("TRCK", track, totalTracks());
}

void ID3v2Tag::setTotalTracks(uint32_t total) {
    setNumberPair("TRCK", track(), total);
}

std::optional<uint32_t> ID3v2Tag::disc() const {
    std::optional<std::string> text = textFor("TPOS");
    return text ? parseNumberPair(*text).first : std::nullopt;
}

std::optional<uint32_t> ID3v2Tag::totalDiscs() const {
    std::optional<std::string> text = textFor("TPOS");
    return text ? parseNumberPair(*text).second : std::nullopt;
}

void ID3v2Tag::setDisc(uint32_t disc) {
    setNumberPair("TPOS", disc, totalDiscs());
}

void ID3v2Tag::setTotalDiscs(uint32_t total) {
    setNumberPair("TPOS", disc(), total);
}

std::optional<Timestamp> ID3v2Tag::dateRecorded() const {
    if (const Frame* frame = getFrame("TDRC")) {
        if (const Timestamp* timestamp = frame->get<Timestamp>()) {
            return *timestamp;
        }
    }

    // ID3v2.3 spreads the date over TYER (yyyy), TDAT (DDMM) and TIME (HHMM)
    std::optional<std::string> tyer = textFor("TYER");
    if (!tyer) {
        return std::nullopt;
    }
    std::optional<int> year = parseDigits(*tyer, 0, 4);
    if (!year) {
        return std::nullopt;
    }

    Timestamp timestamp;
    timestamp.year = *year;

    std::optional<std::string> tdat = textFor("TDAT");
    if (!tdat || tdat->size() != 4) {
        return timestamp;
    }
    std::optional<int> day = parseDigits(*tdat, 0, 2);
    std::optional<int> month = parseDigits(*tdat, 2, 2);
    if (!day || !month || *month < 1 || *month > 12 || *day < 1 || *day > 31) {
        return timestamp;
    }
    timestamp.month = static_cast<uint8_t>(*month);
    timestamp.day = static_cast<uint8_t>(*day);

    std::optional<std::string> time = textFor("TIME");
    if (!time || time->size() != 4) {
        return timestamp;
    }
    std::optional<int> hour = parseDigits(*time, 0, 2);
    std::optional<int> minute = parseDigits(*time, 2, 2);
    if (hour && minute && *hour <= 23 && *minute <= 59) {
        timestamp.hour = static_cast<uint8_t>(*hour);
        timestamp.minute = static_cast<uint8_t>(*minute);
    }
    return timestamp;
}

void ID3v2Tag::setDateRecorded(const Timestamp& timestamp) {
    removeFrames("TYER");
    removeFrames("TDAT");
    removeFrames("TIME");
    addFrame(Frame("TDRC", timestamp));
}

void ID3v2Tag::removeDateRecorded() {
    removeFrames("TDRC");
    removeFrames("TYER");
    removeFrames("TDAT");
    removeFrames("TIME");
}

std::optional<Timestamp> ID3v2Tag::originalDateReleased() const {
    if (const Frame* frame = getFrame("TDOR")) {
        if (const Timestamp* timestamp = frame->get<Timestamp>()) {
            return *timestamp;
        }
    }
    if (std::optional<std::string> tory = textFor("TORY")) {
        if (std::optional<int> year = parseDigits(*tory, 0, 4)) {
            Timestamp timestamp;
            timestamp.year = *year;
            return timestamp;
        }
    }
    return std::nullopt;
}

void ID3v2Tag::setOriginalDateReleased(const Timestamp& timestamp) {
    removeFrames("TORY");
    addFrame(Frame("TDOR", timestamp));
}

void ID3v2Tag::removeOriginalDateReleased() {
    removeFrames("TDOR");
    removeFrames("TORY");
}

// ============================================================================
// Repeatable frames
// ============================================================================

std::vector<Picture> ID3v2Tag::pictures() const {
    return collect<Picture>("APIC");
}

void ID3v2Tag::addPicture(Picture picture) {
    addFrame(Frame("APIC", std::move(picture)));
}

void ID3v2Tag::removePicturesByType(PictureType type) {
    m_frames.erase(std::remove_if(m_frames.begin(), m_frames.end(), [type](const Frame& frame) {
        const Picture* picture = frame.get<Picture>();
        return frame.id() == "APIC" && picture && picture->picture_type == type;
    }), m_frames.end());
}

std::vector<Comment> ID3v2Tag::comments() const {
    return collect<Comment>("COMM");
}

void ID3v2Tag::addComment(Comment comment) {
    addFrame(Frame("COMM", std::move(comment)));
}

void ID3v2Tag::removeComment(const std::optional<std::string>& description,
                             const std::optional<std::string>& text) {
    m_frames.erase(std::remove_if(m_frames.begin(), m_frames.end(), [&](const Frame& frame) {
        const Comment* comment = frame.get<Comment>();
        if (frame.id() != "COMM" || !comment) {
            return false;
        }
        return (!description || comment->description == *description) &&
               (!text || comment->text == *text);
    }), m_frames.end());
}

std::vector<Lyrics> ID3v2Tag::lyrics() const {
    return collect<Lyrics>("USLT");
}

void ID3v2Tag::addLyrics(Lyrics lyrics) {
    addFrame(Frame("USLT", std::move(lyrics)));
}

std::vector<ExtendedText> ID3v2Tag::extendedTexts() const {
    return collect<ExtendedText>("TXXX");
}

void ID3v2Tag::addExtendedText(const std::string& description, const std::string& value) {
    addFrame(Frame("TXXX", ExtendedText{description, value}));
}

void ID3v2Tag::removeExtendedText(const std::optional<std::string>& description) {
    m_frames.erase(std::remove_if(m_frames.begin(), m_frames.end(), [&](const Frame& frame) {
        const ExtendedText* text = frame.get<ExtendedText>();
        return frame.id() == "TXXX" && text && (!description || text->description == *description);
    }), m_frames.end());
}

std::vector<ExtendedLink> ID3v2Tag::extendedLinks() const {
    return collect<ExtendedLink>("WXXX");
}

} // namespace Tag
} // namespace TagForge
