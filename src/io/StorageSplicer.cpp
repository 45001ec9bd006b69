/*
 * StorageSplicer.cpp - In-place replacement of the tag region of a file
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
namespace IO {

StorageSplicer::StorageSplicer(IOHandler& handler) : m_handler(handler) {
}

std::optional<StorageSplicer::Region> StorageSplicer::probe() {
    if (m_handler.seek(0, SEEK_SET) != 0) {
        fail("seek to tag header");
    }

    uint8_t header[HEADER_SIZE];
    size_t got = m_handler.read(header, 1, HEADER_SIZE);
    if (got != HEADER_SIZE) {
        if (m_handler.getLastError() != 0) {
            fail("read tag header");
        }
        return std::nullopt;
    }

    if (std::memcmp(header, "ID3", 3) != 0) {
        return std::nullopt;
    }

    uint8_t major = header[3];
    if (major < 2 || major > 4) {
        Debug::log("io", "StorageSplicer::probe() - ID3v2 header with unsupported major version ", static_cast<unsigned>(major));
        return std::nullopt;
    }

    Region region;
    region.major_version = major;
    region.has_footer = (major == 4) && (header[5] & 0x10) != 0;
    region.declared_end = static_cast<off_t>(HEADER_SIZE) +
                          static_cast<off_t>(Tag::ID3v2Utils::decodeSynchsafeBytes(header + 6));
    if (region.has_footer) {
        region.declared_end += HEADER_SIZE;
    }
    // Zeros left behind by an earlier shrink belong to the region
    region.end = skipZeroRun(region.declared_end);

    Debug::log("io", "StorageSplicer::probe() - ID3v2.", static_cast<unsigned>(major), " tag ends at ",
               region.declared_end, ", region at ", region.end, region.has_footer ? " (footer)" : "");
    return region;
}

off_t StorageSplicer::skipZeroRun(off_t offset) {
    if (m_handler.seek(offset, SEEK_SET) != 0) {
        fail("seek to " + std::to_string(offset));
    }

    std::vector<uint8_t> buffer(CHUNK_SIZE);
    off_t pos = offset;
    for (;;) {
        size_t got = m_handler.read(buffer.data(), 1, buffer.size());
        if (got == 0) {
            if (m_handler.getLastError() != 0) {
                fail("read after tag region");
            }
            return pos;
        }
        auto nonzero = std::find_if(buffer.begin(), buffer.begin() + got, [](uint8_t b) { return b != 0x00; });
        pos += static_cast<off_t>(nonzero - buffer.begin());
        if (nonzero != buffer.begin() + got) {
            return pos;
        }
    }
}

StorageSplicer::Region StorageSplicer::locate() {
    std::optional<Region> region = probe();
    if (!region) {
        throw Error(ErrorKind::NoTag, "no ID3v2 tag at the start of the file");
    }
    return *region;
}

std::vector<uint8_t> StorageSplicer::readRegion(const Region& region) {
    std::vector<uint8_t> bytes(static_cast<size_t>(region.end));

    if (m_handler.seek(0, SEEK_SET) != 0) {
        fail("seek to tag region");
    }
    size_t got = m_handler.read(bytes.data(), 1, bytes.size());
    if (got != bytes.size()) {
        if (m_handler.getLastError() != 0) {
            fail("read tag region");
        }
        throw Error(ErrorKind::Parsing, "tag region of " + std::to_string(region.end) +
                    " bytes is truncated after " + std::to_string(got) + " bytes");
    }
    return bytes;
}

void StorageSplicer::write(const std::vector<uint8_t>& tag) {
    if (tag.size() < HEADER_SIZE) {
        throw Error(ErrorKind::Parsing, "encoded tag is shorter than its header");
    }

    off_t file_size = fileSize();
    off_t old_end = 0;
    if (std::optional<Region> region = probe()) {
        old_end = std::min(region->end, file_size);
    }
    off_t new_len = static_cast<off_t>(tag.size());

    Debug::log("io", "StorageSplicer::write() - Old region ", old_end, " bytes, new tag ", new_len,
               " bytes, file ", file_size, " bytes");

    if (new_len > old_end) {
        off_t delta = new_len - old_end;
        truncateTo(file_size + delta);
        shiftTowardsEnd(old_end, file_size, delta);
    }

    // Frames first, header last
    writeAt(static_cast<off_t>(HEADER_SIZE), tag.data() + HEADER_SIZE, tag.size() - HEADER_SIZE);

    if (new_len < old_end) {
        std::vector<uint8_t> zeros(std::min(static_cast<size_t>(old_end - new_len), CHUNK_SIZE), 0x00);
        for (off_t pos = new_len; pos < old_end;) {
            size_t chunk = static_cast<size_t>(std::min(static_cast<off_t>(zeros.size()), old_end - pos));
            writeAt(pos, zeros.data(), chunk);
            pos += static_cast<off_t>(chunk);
        }
    }

    writeAt(0, tag.data(), HEADER_SIZE);
}

bool StorageSplicer::remove() {
    std::optional<Region> region = probe();
    if (!region) {
        return false;
    }

    off_t file_size = fileSize();
    off_t old_end = std::min(region->end, file_size);

    Debug::log("io", "StorageSplicer::remove() - Removing ", old_end, " bytes of ", file_size);

    shiftTowardsStart(old_end, file_size, old_end);
    truncateTo(file_size - old_end);
    return true;
}

off_t StorageSplicer::fileSize() {
    off_t size = m_handler.getFileSize();
    if (size < 0) {
        fail("query file size");
    }
    return size;
}

void StorageSplicer::readAt(off_t offset, uint8_t* buffer, size_t size) {
    if (m_handler.seek(offset, SEEK_SET) != 0) {
        fail("seek to " + std::to_string(offset));
    }
    if (m_handler.read(buffer, 1, size) != size) {
        fail("read " + std::to_string(size) + " bytes at " + std::to_string(offset));
    }
}

void StorageSplicer::writeAt(off_t offset, const uint8_t* buffer, size_t size) {
    if (size == 0) {
        return;
    }
    if (m_handler.seek(offset, SEEK_SET) != 0) {
        fail("seek to " + std::to_string(offset));
    }
    if (m_handler.write(buffer, 1, size) != size) {
        fail("write " + std::to_string(size) + " bytes at " + std::to_string(offset));
    }
}

void StorageSplicer::truncateTo(off_t length) {
    if (m_handler.truncate(length) != 0) {
        fail("resize to " + std::to_string(length) + " bytes");
    }
}

void StorageSplicer::shiftTowardsEnd(off_t begin, off_t end, off_t delta) {
    std::vector<uint8_t> buffer(CHUNK_SIZE);
    off_t pos = end;
    while (pos > begin) {
        size_t chunk = static_cast<size_t>(std::min(static_cast<off_t>(CHUNK_SIZE), pos - begin));
        pos -= static_cast<off_t>(chunk);
        readAt(pos, buffer.data(), chunk);
        writeAt(pos + delta, buffer.data(), chunk);
    }
}

void StorageSplicer::shiftTowardsStart(off_t begin, off_t end, off_t delta) {
    std::vector<uint8_t> buffer(CHUNK_SIZE);
    off_t pos = begin;
    while (pos < end) {
        size_t chunk = static_cast<size_t>(std::min(static_cast<off_t>(CHUNK_SIZE), end - pos));
        readAt(pos, buffer.data(), chunk);
        writeAt(pos - delta, buffer.data(), chunk);
        pos += static_cast<off_t>(chunk);
    }
}

void StorageSplicer::fail(const std::string& operation) const {
    int code = m_handler.getLastError();
    std::string message = code != 0
        ? IOHandler::getErrorMessage(code, operation)
        : operation + ": unexpected end of file";
    Debug::log("io", "StorageSplicer - ", message);
    throw Error(ErrorKind::Io, message);
}

} // namespace IO
} // namespace TagForge
