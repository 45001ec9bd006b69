/*
 * Compressor.h - Compression algorithm interface
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#ifndef TAGFORGE_CORE_COMPRESSION_COMPRESSOR_H
#define TAGFORGE_CORE_COMPRESSION_COMPRESSOR_H

#include <vector>
#include <cstdint>
#include <cstddef>

namespace TagForge {
namespace Core {
namespace Compression {

/**
 * @brief Interface for compression algorithms
 */
class Compressor {
public:
    virtual ~Compressor() = default;

    /**
     * @brief Compress data
     *
     * @param data Uncompressed data pointer
     * @param size Uncompressed data size in bytes
     * @return Compressed data
     */
    virtual std::vector<uint8_t> compress(const uint8_t* data, size_t size) = 0;
};

} // namespace Compression
} // namespace Core
} // namespace TagForge

#endif // TAGFORGE_CORE_COMPRESSION_COMPRESSOR_H
