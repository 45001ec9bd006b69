/*
 * TagCodec.cpp - ID3v2 tag header, frame sequence and storage entry points
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
namespace TagCodec {

namespace {

bool isFrameLevel(ErrorKind kind) {
    return kind == ErrorKind::Parsing || kind == ErrorKind::UnsupportedFeature ||
           kind == ErrorKind::StringDecoding;
}

std::string zeroPadded(int value, int width) {
    std::ostringstream ss;
    ss << std::setw(width) << std::setfill('0') << value;
    return ss.str();
}

/**
 * Replace every frame whose identifier is in `ids` by `replacement`,
 * placed where the first of them was.
 */
std::vector<Frame> replaceGroup(const std::vector<Frame>& frames,
                                const std::set<std::string>& ids,
                                const std::vector<Frame>& replacement) {
    std::vector<Frame> result;
    bool placed = false;
    for (const Frame& frame : frames) {
        if (ids.count(frame.id()) == 0) {
            result.push_back(frame);
        } else if (!placed) {
            result.insert(result.end(), replacement.begin(), replacement.end());
            placed = true;
        }
    }
    if (!placed) {
        result.insert(result.end(), replacement.begin(), replacement.end());
    }
    return result;
}

// TYER, plus TDAT and TIME when the timestamp carries them
std::vector<Frame> v23RecordingFrames(const Timestamp& recorded) {
    std::vector<Frame> frames;
    frames.push_back(Frame::text("TYER", zeroPadded(recorded.year, 4)));
    if (recorded.month && recorded.day) {
        frames.push_back(Frame::text("TDAT", zeroPadded(*recorded.day, 2) + zeroPadded(*recorded.month, 2)));
        if (recorded.hour && recorded.minute) {
            frames.push_back(Frame::text("TIME", zeroPadded(*recorded.hour, 2) + zeroPadded(*recorded.minute, 2)));
        }
    }
    return frames;
}

/**
 * True when the frames of `tag` named in `ids` hold exactly the contents
 * of `expected`, so replacing them loses nothing.
 */
bool groupMatches(const ID3v2Tag& tag, const std::set<std::string>& ids, const std::vector<Frame>& expected) {
    std::map<std::string, Content> present;
    for (const std::string& id : ids) {
        if (const Frame* frame = tag.getFrame(id)) {
            present.emplace(id, frame->content());
        }
    }
    std::map<std::string, Content> wanted;
    for (const Frame& frame : expected) {
        wanted.emplace(frame.id(), frame.content());
    }
    return present == wanted;
}

bool hasAny(const ID3v2Tag& tag, const std::set<std::string>& ids) {
    for (const std::string& id : ids) {
        if (tag.getFrame(id)) {
            return true;
        }
    }
    return false;
}

// Stops the frame walk: recorded under partial-tag-ok, thrown otherwise
void frameWalkFailed(ID3v2Tag& tag, const std::string& id, const Error& error, bool partial_tag_ok) {
    if (!partial_tag_ok) {
        throw error.withPartialTag(std::make_shared<ID3v2Tag>(tag));
    }
    Debug::log("tag", "TagCodec::decode: skipping ", id.empty() ? std::string("<header>") : id, ": ", error.what());
    tag.recordSkipped(SkippedFrame{id, error.kind(), error.description()});
}

} // anonymous namespace

TagHeader parseHeader(const uint8_t* data, size_t size) {
    if (size < HEADER_SIZE || std::memcmp(data, "ID3", 3) != 0) {
        throw Error(ErrorKind::NoTag, "no ID3v2 header");
    }

    std::optional<Version> version = versionFromMajor(data[3]);
    if (!version) {
        throw Error(ErrorKind::UnsupportedVersion, "ID3v2." + std::to_string(data[3]) + " is not supported");
    }
    if (data[4] == 0xFF) {
        throw Error(ErrorKind::UnsupportedVersion, "invalid revision 0xFF");
    }

    TagHeader header;
    header.version = *version;
    header.revision = data[4];
    header.flags = data[5];

    if (header.version == Version::ID3v22 && (header.flags & V22_FLAG_COMPRESSION) != 0) {
        throw Error(ErrorKind::UnsupportedFeature, "ID3v2.2 compression is not supported");
    }

    header.size = ID3v2Utils::decodeSynchsafeBytes(data + 6);
    return header;
}

ID3v2Tag decode(const std::vector<uint8_t>& data, const DecoderOptions& options) {
    return decode(data.data(), data.size(), options);
}

ID3v2Tag decode(const uint8_t* data, size_t size, const DecoderOptions& options) {
    TagHeader header = parseHeader(data, size);
    Version version = header.version;

    size_t body_end = HEADER_SIZE + header.size;
    if (size < body_end) {
        throw Error(ErrorKind::Parsing, "tag declares " + std::to_string(header.size) +
                    " bytes but only " + std::to_string(size - HEADER_SIZE) + " follow the header");
    }

    Debug::log("tag", "TagCodec::decode: ", versionName(version), " revision ", static_cast<int>(header.revision),
               ", flags 0x", std::hex, static_cast<int>(header.flags), std::dec, ", ", header.size, " bytes");

    std::vector<uint8_t> body(data + HEADER_SIZE, data + body_end);

    // v2.4 applies the tag flag per frame, frame sizes count unsynchronised bytes
    if (header.unsynchronised() && version != Version::ID3v24) {
        body = ID3v2Utils::decodeUnsync(body.data(), body.size());
    }

    ID3v2Tag tag(version);
    size_t pos = 0;

    if (header.hasExtendedHeader()) {
        if (body.size() < 4) {
            throw Error(ErrorKind::Parsing, "extended header truncated");
        }
        size_t extended_size;
        if (version == Version::ID3v23) {
            // Excludes its own size field
            extended_size = 4 + static_cast<size_t>(ID3v2Utils::readBE32(body.data()));
        } else {
            extended_size = ID3v2Utils::decodeSynchsafeBytes(body.data());
            if (extended_size < 6) {
                throw Error(ErrorKind::Parsing, "extended header size " + std::to_string(extended_size) + " is too small");
            }
        }
        if (extended_size > body.size()) {
            throw Error(ErrorKind::Parsing, "extended header of " + std::to_string(extended_size) +
                        " bytes overruns the tag");
        }
        tag.setExtendedHeader(std::vector<uint8_t>(body.begin(), body.begin() + extended_size));
        pos = extended_size;
    }

    const size_t frame_header_size = FrameCodec::headerSize(version);
    const bool frames_unsynchronised = version == Version::ID3v24 && header.unsynchronised();

    while (pos < body.size()) {
        std::optional<FrameCodec::FrameHeader> frame_header;
        try {
            frame_header = FrameCodec::readHeader(body.data() + pos, body.size() - pos, version);
        } catch (const Error& e) {
            // Without a valid header the next frame cannot be found
            frameWalkFailed(tag, "", e, options.partial_tag_ok);
            break;
        }
        if (!frame_header) {
            break; // Padding
        }
        pos += frame_header_size;

        if (frame_header->size > body.size() - pos) {
            Error overrun(ErrorKind::Parsing, frame_header->id + ": frame of " + std::to_string(frame_header->size) +
                          " bytes overruns the tag by " + std::to_string(frame_header->size - (body.size() - pos)) + " bytes");
            frameWalkFailed(tag, frame_header->id, overrun, options.partial_tag_ok);
            break;
        }

        try {
            tag.addFrame(FrameCodec::decodeBody(*frame_header, body.data() + pos, version, frames_unsynchronised));
        } catch (const Error& e) {
            if (!isFrameLevel(e.kind())) {
                throw;
            }
            frameWalkFailed(tag, frame_header->id, e, options.partial_tag_ok);
        }
        pos += frame_header->size;
    }

    Debug::log("tag", "TagCodec::decode: ", tag.frameCount(), " frames, ", tag.skippedFrames().size(), " skipped");
    return tag;
}

ID3v2Tag convertForVersion(const ID3v2Tag& tag, Version version) {
    static const std::set<std::string> v23_recording = {"TDRC", "TYER", "TDAT", "TIME"};
    static const std::set<std::string> v23_original = {"TDOR", "TORY"};

    std::vector<Frame> frames = tag.frames();

    if (version == Version::ID3v24) {
        // Frames without an exact v2.4 equivalent are written unchanged
        if (hasAny(tag, {"TYER", "TDAT", "TIME"})) {
            std::optional<Timestamp> recorded = tag.dateRecorded();
            if (recorded && groupMatches(tag, {"TYER", "TDAT", "TIME"}, v23RecordingFrames(*recorded))) {
                frames = replaceGroup(frames, v23_recording, {Frame("TDRC", *recorded)});
            } else {
                Debug::log("tag", "TagCodec::convertForVersion: TYER/TDAT/TIME kept, no exact TDRC equivalent");
            }
        }
        if (tag.getFrame("TORY")) {
            std::optional<Timestamp> original = tag.originalDateReleased();
            if (original && groupMatches(tag, {"TORY"}, {Frame::text("TORY", zeroPadded(original->year, 4))})) {
                frames = replaceGroup(frames, v23_original, {Frame("TDOR", *original)});
            } else {
                Debug::log("tag", "TagCodec::convertForVersion: TORY kept, no exact TDOR equivalent");
            }
        }
    } else {
        const Frame* tdrc = tag.getFrame("TDRC");
        if (tdrc && tdrc->get<Timestamp>()) {
            frames = replaceGroup(frames, v23_recording, v23RecordingFrames(*tdrc->get<Timestamp>()));
        }
        const Frame* tdor = tag.getFrame("TDOR");
        if (tdor && tdor->get<Timestamp>()) {
            std::vector<Frame> replacement{Frame::text("TORY", zeroPadded(tdor->get<Timestamp>()->year, 4))};
            frames = replaceGroup(frames, v23_original, replacement);
        }
    }

    // Rebuild through addFrame so the uniqueness rules hold
    ID3v2Tag result(version);
    for (Frame& frame : frames) {
        result.addFrame(std::move(frame));
    }
    return result;
}

std::vector<uint8_t> encode(const ID3v2Tag& tag, const EncoderOptions& options) {
    Version version = options.version;

    if (options.footer && version != Version::ID3v24) {
        throw Error(ErrorKind::UnsupportedFeature, "a footer requires ID3v2.4, not " + std::string(versionName(version)));
    }

    ID3v2Tag converted = convertForVersion(tag, version);

    FrameCodec::EncodeOptions frame_options;
    frame_options.compression = options.compression && version != Version::ID3v22;
    frame_options.unsynchronisation = options.unsynchronisation && version == Version::ID3v24;

    std::vector<uint8_t> body;
    for (const Frame& frame : converted.frames()) {
        std::vector<uint8_t> bytes = FrameCodec::encodeFrame(frame, version, frame_options);
        body.insert(body.end(), bytes.begin(), bytes.end());
    }

    uint8_t flags = 0;
    if (options.unsynchronisation) {
        flags |= FLAG_UNSYNCHRONISATION;
        if (version != Version::ID3v24) {
            body = ID3v2Utils::encodeUnsync(body.data(), body.size(), version);
        }
    }

    if (options.footer) {
        flags |= FLAG_FOOTER;
    } else {
        body.insert(body.end(), options.padding, 0x00);
    }

    if (!ID3v2Utils::canEncodeSynchsafe(static_cast<uint32_t>(std::min<size_t>(body.size(), UINT32_MAX)))) {
        throw Error(ErrorKind::Parsing, "tag body of " + std::to_string(body.size()) + " bytes is too large");
    }

    std::vector<uint8_t> out(HEADER_SIZE);
    std::memcpy(out.data(), "ID3", 3);
    out[3] = majorVersion(version);
    out[4] = 0;
    out[5] = flags;
    ID3v2Utils::encodeSynchsafeBytes(static_cast<uint32_t>(body.size()), out.data() + 6);

    out.insert(out.end(), body.begin(), body.end());

    if (options.footer) {
        uint8_t footer[HEADER_SIZE];
        std::memcpy(footer, out.data(), HEADER_SIZE);
        std::memcpy(footer, "3DI", 3);
        out.insert(out.end(), footer, footer + HEADER_SIZE);
    }

    Debug::log("tag", "TagCodec::encode: ", versionName(version), ", ", converted.frameCount(), " frames, ",
               out.size(), " bytes");
    return out;
}

// ============================================================================
// Storage
// ============================================================================

bool isCandidate(IO::IOHandler& handler) {
    IO::StorageSplicer splicer(handler);
    try {
        return splicer.probe().has_value();
    } catch (const Error& e) {
        // The magic and version matched, only the size field is corrupt
        if (e.kind() == ErrorKind::Parsing) {
            return true;
        }
        throw;
    }
}

ID3v2Tag readFrom(IO::IOHandler& handler, const DecoderOptions& options) {
    IO::StorageSplicer splicer(handler);
    IO::StorageSplicer::Region region = splicer.locate();
    return decode(splicer.readRegion(region), options);
}

std::optional<ID3v2Tag> readFromNoTagOk(IO::IOHandler& handler, const DecoderOptions& options) {
    try {
        return readFrom(handler, options);
    } catch (const Error& e) {
        if (noTagOk(e)) {
            return std::nullopt;
        }
        throw;
    }
}

void writeTo(IO::IOHandler& handler, const ID3v2Tag& tag, const EncoderOptions& options) {
    std::vector<uint8_t> bytes = encode(tag, options);
    IO::StorageSplicer splicer(handler);
    splicer.write(bytes);
}

bool removeFrom(IO::IOHandler& handler) {
    IO::StorageSplicer splicer(handler);
    return splicer.remove();
}

bool isCandidatePath(const std::string& path) {
    IO::File::FileIOHandler file(path);
    return isCandidate(file);
}

ID3v2Tag readFromPath(const std::string& path, const DecoderOptions& options) {
    IO::File::FileIOHandler file(path);
    return readFrom(file, options);
}

void writeToPath(const std::string& path, const ID3v2Tag& tag, const EncoderOptions& options) {
    IO::File::FileIOHandler file(path, IO::File::FileIOHandler::Mode::ReadWrite);
    writeTo(file, tag, options);
    if (file.close() != 0) {
        throw Error(ErrorKind::Io, IO::IOHandler::getErrorMessage(file.getLastError(), "close " + path));
    }
}

bool removeFromPath(const std::string& path) {
    IO::File::FileIOHandler file(path, IO::File::FileIOHandler::Mode::ReadWrite);
    bool removed = removeFrom(file);
    if (file.close() != 0) {
        throw Error(ErrorKind::Io, IO::IOHandler::getErrorMessage(file.getLastError(), "close " + path));
    }
    return removed;
}

} // namespace TagCodec
} // namespace Tag
} // namespace TagForge
