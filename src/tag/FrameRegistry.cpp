/*
 * FrameRegistry.cpp - Static table of ID3v2 frame identifiers
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

const char* contentShapeName(ContentShape shape) {
    switch (shape) {
        case ContentShape::Text: return "Text";
        case ContentShape::ExtendedText: return "ExtendedText";
        case ContentShape::Link: return "Link";
        case ContentShape::ExtendedLink: return "ExtendedLink";
        case ContentShape::Comment: return "Comment";
        case ContentShape::Lyrics: return "Lyrics";
        case ContentShape::Picture: return "Picture";
        case ContentShape::Popularimeter: return "Popularimeter";
        case ContentShape::Timestamp: return "Timestamp";
        case ContentShape::Unknown: return "Unknown";
    }
    return "Unknown";
}

namespace FrameRegistry {

namespace {

using S = ContentShape;

const FrameInfo s_frames[] = {
    // Text information
    {"TALB", "TAL", S::Text, true, false, "Album"},
    {"TBPM", "TBP", S::Text, true, false, "BPM"},
    {"TCMP", "TCP", S::Text, true, false, "iTunes compilation flag"},
    {"TCOM", "TCM", S::Text, true, false, "Composer"},
    {"TCON", "TCO", S::Text, true, false, "Genre"},
    {"TCOP", "TCR", S::Text, true, false, "Copyright"},
    {"TDAT", "TDA", S::Text, true, false, "Date (DDMM)"},
    {"TDLY", "TDY", S::Text, true, false, "Playlist delay"},
    {"TENC", "TEN", S::Text, true, false, "Encoded by"},
    {"TEXT", "TXT", S::Text, true, false, "Lyricist"},
    {"TFLT", "TFT", S::Text, true, false, "File type"},
    {"TIME", "TIM", S::Text, true, false, "Time (HHMM)"},
    {"TIPL", nullptr, S::Text, true, true, "Involved people list"},
    {"TIT1", "TT1", S::Text, true, false, "Content group description"},
    {"TIT2", "TT2", S::Text, true, false, "Title"},
    {"TIT3", "TT3", S::Text, true, false, "Subtitle"},
    {"TKEY", "TKE", S::Text, true, false, "Initial key"},
    {"TLAN", "TLA", S::Text, true, false, "Language"},
    {"TLEN", "TLE", S::Text, true, false, "Length"},
    {"TMCL", nullptr, S::Text, true, true, "Musician credits list"},
    {"TMED", "TMT", S::Text, true, false, "Media type"},
    {"TMOO", nullptr, S::Text, true, true, "Mood"},
    {"TOAL", "TOT", S::Text, true, false, "Original album"},
    {"TOFN", "TOF", S::Text, true, false, "Original filename"},
    {"TOLY", "TOL", S::Text, true, false, "Original lyricist"},
    {"TOPE", "TOA", S::Text, true, false, "Original artist"},
    {"TORY", "TOR", S::Text, true, false, "Original release year"},
    {"TOWN", nullptr, S::Text, true, false, "File owner"},
    {"TPE1", "TP1", S::Text, true, false, "Artist"},
    {"TPE2", "TP2", S::Text, true, false, "Album artist"},
    {"TPE3", "TP3", S::Text, true, false, "Conductor"},
    {"TPE4", "TP4", S::Text, true, false, "Interpreted, remixed, or otherwise modified by"},
    {"TPOS", "TPA", S::Text, true, false, "Part of a set"},
    {"TPRO", nullptr, S::Text, true, true, "Produced notice"},
    {"TPUB", "TPB", S::Text, true, false, "Publisher"},
    {"TRCK", "TRK", S::Text, true, false, "Track number"},
    {"TRDA", "TRD", S::Text, true, false, "Recording dates"},
    {"TRSN", nullptr, S::Text, true, false, "Internet radio station name"},
    {"TRSO", nullptr, S::Text, true, false, "Internet radio station owner"},
    {"TSIZ", "TSI", S::Text, true, false, "Size"},
    {"TSO2", "TS2", S::Text, true, false, "iTunes album artist sort order"},
    {"TSOA", "TSA", S::Text, true, false, "Album sort order"},
    {"TSOC", "TSC", S::Text, true, false, "iTunes composer sort order"},
    {"TSOP", "TSP", S::Text, true, false, "Performer sort order"},
    {"TSOT", "TST", S::Text, true, false, "Title sort order"},
    {"TSRC", "TRC", S::Text, true, false, "ISRC"},
    {"TSSE", "TSS", S::Text, true, false, "Software/hardware and settings used for encoding"},
    {"TSST", nullptr, S::Text, true, true, "Set subtitle"},
    {"TYER", "TYE", S::Text, true, false, "Year"},
    {"TXXX", "TXX", S::ExtendedText, false, false, "User defined text information"},

    // Timestamps
    {"TDEN", nullptr, S::Timestamp, true, true, "Encoding time"},
    {"TDOR", nullptr, S::Timestamp, true, true, "Original release time"},
    {"TDRC", nullptr, S::Timestamp, true, true, "Recording time"},
    {"TDRL", nullptr, S::Timestamp, true, true, "Release time"},
    {"TDTG", nullptr, S::Timestamp, true, true, "Tagging time"},

    // URL links
    {"WCOM", "WCM", S::Link, false, false, "Commercial information"},
    {"WCOP", "WCP", S::Link, true, false, "Copyright/Legal information"},
    {"WOAF", "WAF", S::Link, true, false, "Official audio file webpage"},
    {"WOAR", "WAR", S::Link, false, false, "Official artist/performer webpage"},
    {"WOAS", "WAS", S::Link, true, false, "Official audio source webpage"},
    {"WORS", nullptr, S::Link, true, false, "Official Internet radio station homepage"},
    {"WPAY", nullptr, S::Link, true, false, "Payment"},
    {"WPUB", "WPB", S::Link, true, false, "Publishers official webpage"},
    {"WXXX", "WXX", S::ExtendedLink, false, false, "User defined URL link"},

    // Structured frames
    {"COMM", "COM", S::Comment, false, false, "Comments"},
    {"USLT", "ULT", S::Lyrics, false, false, "Unsynchronised lyrics"},
    {"APIC", "PIC", S::Picture, false, false, "Attached picture"},
    {"POPM", "POP", S::Popularimeter, false, false, "Popularimeter"},

    // Opaque frames, kept byte for byte
    {"AENC", "CRA", S::Unknown, false, false, "Audio encryption"},
    {"ASPI", nullptr, S::Unknown, true, true, "Audio seek point index"},
    {"COMR", nullptr, S::Unknown, false, false, "Commercial frame"},
    {"ENCR", nullptr, S::Unknown, false, false, "Encryption method registration"},
    {"EQU2", nullptr, S::Unknown, false, true, "Equalisation (2)"},
    {"EQUA", "EQU", S::Unknown, true, false, "Equalization"},
    {"ETCO", "ETC", S::Unknown, true, false, "Event timing codes"},
    {"GEOB", "GEO", S::Unknown, false, false, "General encapsulated object"},
    {"GRID", nullptr, S::Unknown, false, false, "Group identification registration"},
    {"IPLS", "IPL", S::Unknown, true, false, "Involved people list"},
    {"LINK", "LNK", S::Unknown, false, false, "Linked information"},
    {"MCDI", "MCI", S::Unknown, true, false, "Music CD identifier"},
    {"MLLT", "MLL", S::Unknown, true, false, "MPEG location lookup table"},
    {"OWNE", nullptr, S::Unknown, true, false, "Ownership frame"},
    {"PCNT", "CNT", S::Unknown, true, false, "Play counter"},
    {"POSS", nullptr, S::Unknown, true, false, "Position synchronisation frame"},
    {"PRIV", nullptr, S::Unknown, false, false, "Private frame"},
    {"RBUF", "BUF", S::Unknown, true, false, "Recommended buffer size"},
    {"RVA2", nullptr, S::Unknown, false, true, "Relative volume adjustment (2)"},
    {"RVAD", "RVA", S::Unknown, true, false, "Relative volume adjustment"},
    {"RVRB", "REV", S::Unknown, true, false, "Reverb"},
    {"SEEK", nullptr, S::Unknown, true, true, "Seek frame"},
    {"SIGN", nullptr, S::Unknown, false, true, "Signature frame"},
    {"SYLT", "SLT", S::Unknown, false, false, "Synchronised lyric/text"},
    {"SYTC", "STC", S::Unknown, true, false, "Synchronised tempo codes"},
    {"UFID", "UFI", S::Unknown, false, false, "Unique file identifier"},
    {"USER", nullptr, S::Unknown, false, false, "Terms of use"},
};

} // anonymous namespace

const FrameInfo* lookup(const std::string& id) {
    for (const auto& info : s_frames) {
        if (id == info.id) {
            return &info;
        }
    }
    return nullptr;
}

std::optional<std::string> canonicalFromLegacy(const std::string& legacy) {
    for (const auto& info : s_frames) {
        if (info.legacy && legacy == info.legacy) {
            return std::string(info.id);
        }
    }
    return std::nullopt;
}

std::optional<std::string> legacyFromCanonical(const std::string& id) {
    const FrameInfo* info = lookup(id);
    if (info && info->legacy) {
        return std::string(info->legacy);
    }
    return std::nullopt;
}

ContentShape contentShape(const std::string& id) {
    if (id.size() != 4) {
        return ContentShape::Unknown;
    }
    if (const FrameInfo* info = lookup(id)) {
        return info->shape;
    }
    switch (id[0]) {
        case 'T': return ContentShape::Text;
        case 'W': return ContentShape::Link;
        default: return ContentShape::Unknown;
    }
}

bool isSingular(const std::string& id) {
    if (const FrameInfo* info = lookup(id)) {
        return info->singular;
    }
    // Unlisted text and link frames behave like their listed siblings
    return id.size() == 4 && (id[0] == 'T' || id[0] == 'W');
}

bool isV24Only(const std::string& id) {
    const FrameInfo* info = lookup(id);
    return info && info->v24_only;
}

bool isValidFrameId(const std::string& id, Version version) {
    size_t expected = version == Version::ID3v22 ? 3 : 4;
    if (id.size() != expected) {
        return false;
    }
    for (char c : id) {
        if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'))) {
            return false;
        }
    }
    return true;
}

} // namespace FrameRegistry
} // namespace Tag
} // namespace TagForge
