/*
 * ID3v1v2.cpp - Operations over both tag formats at once
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
namespace ID3v1v2 {

namespace {

FormatVersion combine(bool v1, bool v2) {
    if (v1 && v2) {
        return FormatVersion::Both;
    }
    if (v1) {
        return FormatVersion::ID3v1;
    }
    return v2 ? FormatVersion::ID3v2 : FormatVersion::None;
}

void closeOrThrow(IO::File::FileIOHandler& file) {
    if (file.close() != 0) {
        throw Error(ErrorKind::Io, IO::IOHandler::getErrorMessage(file.getLastError(), "close " + file.path()));
    }
}

} // anonymous namespace

const char* formatVersionName(FormatVersion format) {
    switch (format) {
        case FormatVersion::None: return "none";
        case FormatVersion::ID3v1: return "ID3v1";
        case FormatVersion::ID3v2: return "ID3v2";
        case FormatVersion::Both: return "ID3v1+ID3v2";
    }
    return "unknown";
}

FormatVersion isCandidate(IO::IOHandler& handler) {
    bool v2 = TagCodec::isCandidate(handler);
    bool v1 = ID3v1Tag::isCandidate(handler);
    return combine(v1, v2);
}

FormatVersion isCandidatePath(const std::string& path) {
    IO::File::FileIOHandler file(path);
    return isCandidate(file);
}

ID3v2Tag readFrom(IO::IOHandler& handler, const TagCodec::DecoderOptions& options) {
    if (std::optional<ID3v2Tag> tag = TagCodec::readFromNoTagOk(handler, options)) {
        return std::move(*tag);
    }

    try {
        ID3v1Tag v1 = ID3v1Tag::readFrom(handler);
        Debug::log("tag", "ID3v1v2::readFrom: no ID3v2 tag, using ID3v1");
        return v1.toID3v2();
    } catch (const Error& e) {
        if (!noTagOk(e)) {
            throw;
        }
    }

    throw Error(ErrorKind::NoTag, "neither an ID3v2 nor an ID3v1 tag was found");
}

ID3v2Tag readFromPath(const std::string& path, const TagCodec::DecoderOptions& options) {
    IO::File::FileIOHandler file(path);
    return ID3v1v2::readFrom(file, options);
}

void writeTo(IO::IOHandler& handler, const ID3v2Tag& tag, const TagCodec::EncoderOptions& options) {
    TagCodec::writeTo(handler, tag, options);
    if (ID3v1Tag::removeFrom(handler)) {
        Debug::log("tag", "ID3v1v2::writeTo: removed stale ID3v1 tag");
    }
}

void writeTo(IO::IOHandler& handler, const ID3v2Tag& tag, Version version) {
    TagCodec::EncoderOptions options;
    options.version = version;
    ID3v1v2::writeTo(handler, tag, options);
}

void writeToPath(const std::string& path, const ID3v2Tag& tag, const TagCodec::EncoderOptions& options) {
    IO::File::FileIOHandler file(path, IO::File::FileIOHandler::Mode::ReadWrite);
    ID3v1v2::writeTo(file, tag, options);
    closeOrThrow(file);
}

void writeToPath(const std::string& path, const ID3v2Tag& tag, Version version) {
    TagCodec::EncoderOptions options;
    options.version = version;
    ID3v1v2::writeToPath(path, tag, options);
}

FormatVersion removeFrom(IO::IOHandler& handler) {
    bool v2 = TagCodec::removeFrom(handler);
    bool v1 = ID3v1Tag::removeFrom(handler);
    return combine(v1, v2);
}

FormatVersion removeFromPath(const std::string& path) {
    IO::File::FileIOHandler file(path, IO::File::FileIOHandler::Mode::ReadWrite);
    FormatVersion previous = removeFrom(file);
    closeOrThrow(file);
    return previous;
}

} // namespace ID3v1v2
} // namespace Tag
} // namespace TagForge
