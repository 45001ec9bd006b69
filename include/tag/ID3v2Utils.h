/*
 * ID3v2Utils.h - ID3v2 integer and unsynchronisation helpers
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGFORGE_TAG_ID3V2UTILS_H
#define TAGFORGE_TAG_ID3V2UTILS_H

// No direct includes - all includes should be in tagforge.h

namespace TagForge {
namespace Tag {
namespace ID3v2Utils {

// ============================================================================
// Synchsafe Integer Functions
// ============================================================================

/**
 * @brief Largest value a 4-byte synchsafe integer can hold (2^28 - 1)
 */
constexpr uint32_t MAX_SYNCHSAFE = 0x0FFFFFFF;

/**
 * @brief Check if a value can be encoded as synchsafe (fits in 28 bits)
 */
bool canEncodeSynchsafe(uint32_t value);

/**
 * @brief Encode a 28-bit value as a synchsafe integer
 *
 * Synchsafe integers are used in ID3v2 to avoid false sync patterns.
 * Each byte uses only 7 bits (MSB is always 0), allowing 28 bits
 * of data to be stored in 4 bytes.
 *
 * @param value Value to encode
 * @return 4-byte synchsafe encoded value
 * @throws Error(Parsing) if value does not fit in 28 bits
 */
uint32_t encodeSynchsafe(uint32_t value);

/**
 * @brief Decode a synchsafe integer to a regular 28-bit value
 *
 * @param synchsafe 4-byte synchsafe encoded value
 * @return Decoded value (28-bit)
 * @throws Error(Parsing) if any byte has its high bit set
 */
uint32_t decodeSynchsafe(uint32_t synchsafe);

/**
 * @brief Decode synchsafe integer from 4 raw big-endian bytes
 * @throws Error(Parsing) if any byte has its high bit set
 */
uint32_t decodeSynchsafeBytes(const uint8_t* data);

/**
 * @brief Encode synchsafe integer to 4 raw big-endian bytes
 * @throws Error(Parsing) if value does not fit in 28 bits
 */
void encodeSynchsafeBytes(uint32_t value, uint8_t* out);

// ============================================================================
// Plain Big-Endian Integers
// ============================================================================

uint32_t readBE32(const uint8_t* data);
uint32_t readBE24(const uint8_t* data);
void writeBE32(uint32_t value, uint8_t* out);
void writeBE24(uint32_t value, uint8_t* out);

// ============================================================================
// Unsynchronization Functions
// ============================================================================

/**
 * @brief Remove unsynchronisation: every FF 00 becomes FF
 */
std::vector<uint8_t> decodeUnsync(const uint8_t* data, size_t size);

/**
 * @brief Apply unsynchronisation for a revision
 *
 * A 00 is inserted after every FF that is followed by 00 or by a byte
 * >= E0. ID3v2.2/2.3 also append a 00 after an FF that ends the buffer,
 * since the following byte is unknown; ID3v2.4 does not.
 */
std::vector<uint8_t> encodeUnsync(const uint8_t* data, size_t size, Version version);

/**
 * @brief Whether encodeUnsync() would change the buffer
 */
bool needsUnsync(const uint8_t* data, size_t size, Version version);

} // namespace ID3v2Utils
} // namespace Tag
} // namespace TagForge

#endif // TAGFORGE_TAG_ID3V2UTILS_H
