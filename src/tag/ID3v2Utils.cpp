/*
 * ID3v2Utils.cpp - ID3v2 integer and unsynchronisation helpers
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
namespace ID3v2Utils {

// ============================================================================
// Synchsafe Integer Functions
// ============================================================================

bool canEncodeSynchsafe(uint32_t value) {
    // Synchsafe integers can only encode 28 bits
    return value <= MAX_SYNCHSAFE;
}

uint32_t encodeSynchsafe(uint32_t value) {
    if (!canEncodeSynchsafe(value)) {
        throw Error(ErrorKind::Parsing, "value " + std::to_string(value) + " does not fit in a synchsafe integer");
    }
    uint32_t result = 0;
    result |= (value & 0x0000007F);        // Bits 0-6
    result |= (value & 0x00003F80) << 1;   // Bits 7-13 -> 8-14
    result |= (value & 0x001FC000) << 2;   // Bits 14-20 -> 16-22
    result |= (value & 0x0FE00000) << 3;   // Bits 21-27 -> 24-30
    return result;
}

uint32_t decodeSynchsafe(uint32_t synchsafe) {
    if (synchsafe & 0x80808080) {
        throw Error(ErrorKind::Parsing, "synchsafe integer has a byte with the high bit set");
    }
    uint32_t result = 0;
    result |= (synchsafe & 0x0000007F);        // Bits 0-6
    result |= (synchsafe & 0x00007F00) >> 1;   // Bits 8-14 -> 7-13
    result |= (synchsafe & 0x007F0000) >> 2;   // Bits 16-22 -> 14-20
    result |= (synchsafe & 0x7F000000) >> 3;   // Bits 24-30 -> 21-27
    return result;
}

uint32_t decodeSynchsafeBytes(const uint8_t* data) {
    return decodeSynchsafe(readBE32(data));
}

void encodeSynchsafeBytes(uint32_t value, uint8_t* out) {
    writeBE32(encodeSynchsafe(value), out);
}

// ============================================================================
// Plain Big-Endian Integers
// ============================================================================

uint32_t readBE32(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

uint32_t readBE24(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 16) |
           (static_cast<uint32_t>(data[1]) << 8) |
           static_cast<uint32_t>(data[2]);
}

void writeBE32(uint32_t value, uint8_t* out) {
    out[0] = static_cast<uint8_t>((value >> 24) & 0xFF);
    out[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
    out[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
    out[3] = static_cast<uint8_t>(value & 0xFF);
}

void writeBE24(uint32_t value, uint8_t* out) {
    out[0] = static_cast<uint8_t>((value >> 16) & 0xFF);
    out[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    out[2] = static_cast<uint8_t>(value & 0xFF);
}

// ============================================================================
// Unsynchronization Functions
// ============================================================================

std::vector<uint8_t> decodeUnsync(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return {};
    }

    std::vector<uint8_t> result;
    result.reserve(size);

    for (size_t i = 0; i < size; ++i) {
        result.push_back(data[i]);

        // Skip 0x00 byte after 0xFF (unsync marker)
        if (data[i] == 0xFF && i + 1 < size && data[i + 1] == 0x00) {
            ++i;
        }
    }

    return result;
}

namespace {

// Insertion predicate for the byte at position i (which is 0xFF)
inline bool needsZeroAfter(const uint8_t* data, size_t size, size_t i, Version version) {
    if (i + 1 < size) {
        return data[i + 1] == 0x00 || data[i + 1] >= 0xE0;
    }
    return version != Version::ID3v24;
}

} // anonymous namespace

std::vector<uint8_t> encodeUnsync(const uint8_t* data, size_t size, Version version) {
    if (!data || size == 0) {
        return {};
    }

    std::vector<uint8_t> result;
    result.reserve(size + size / 10);

    for (size_t i = 0; i < size; ++i) {
        result.push_back(data[i]);
        if (data[i] == 0xFF && needsZeroAfter(data, size, i, version)) {
            result.push_back(0x00);
        }
    }

    return result;
}

bool needsUnsync(const uint8_t* data, size_t size, Version version) {
    if (!data) {
        return false;
    }
    for (size_t i = 0; i < size; ++i) {
        if (data[i] == 0xFF && needsZeroAfter(data, size, i, version)) {
            return true;
        }
    }
    return false;
}

} // namespace ID3v2Utils
} // namespace Tag
} // namespace TagForge
