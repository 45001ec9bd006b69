/*
 * Timestamp.cpp - Partial ISO-8601 timestamps used by ID3v2.4 time frames
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

bool readDigits(const std::string& text, size_t& pos, size_t count, int32_t& value) {
    if (pos + count > text.size()) {
        return false;
    }
    value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    return true;
}

// Reads "<separator><two digits>" into field if the separator is next
bool readField(const std::string& text, size_t& pos, char separator,
               int32_t min, int32_t max, std::optional<uint8_t>& field) {
    if (pos >= text.size() || text[pos] != separator) {
        return pos >= text.size();
    }
    ++pos;
    int32_t value;
    if (!readDigits(text, pos, 2, value) || value < min || value > max) {
        return false;
    }
    field = static_cast<uint8_t>(value);
    return true;
}

} // anonymous namespace

std::optional<Timestamp> Timestamp::tryParse(const std::string& text) {
    Timestamp ts;
    size_t pos = 0;
    if (!readDigits(text, pos, 4, ts.year)) {
        return std::nullopt;
    }
    if (!readField(text, pos, '-', 1, 12, ts.month)) return std::nullopt;
    if (ts.month && !readField(text, pos, '-', 1, 31, ts.day)) return std::nullopt;
    if (ts.day && !readField(text, pos, 'T', 0, 23, ts.hour)) return std::nullopt;
    if (ts.hour && !readField(text, pos, ':', 0, 59, ts.minute)) return std::nullopt;
    if (ts.minute && !readField(text, pos, ':', 0, 59, ts.second)) return std::nullopt;
    if (pos != text.size()) {
        return std::nullopt;
    }
    return ts;
}

Timestamp Timestamp::parse(const std::string& text) {
    auto ts = tryParse(text);
    if (!ts) {
        throw Error(ErrorKind::Parsing, "invalid timestamp \"" + text + "\"");
    }
    return *ts;
}

std::string Timestamp::toString() const {
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << year;
    auto put = [&ss](char separator, const std::optional<uint8_t>& field) {
        if (!field) {
            return false;
        }
        ss << separator << std::setw(2) << static_cast<int>(*field);
        return true;
    };
    if (put('-', month) && put('-', day) && put('T', hour) && put(':', minute)) {
        put(':', second);
    }
    return ss.str();
}

bool Timestamp::operator==(const Timestamp& other) const {
    return year == other.year && month == other.month && day == other.day &&
           hour == other.hour && minute == other.minute && second == other.second;
}

} // namespace Tag
} // namespace TagForge
