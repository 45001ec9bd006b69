/*
 * Zlib.h - zlib (RFC 1950) Compressor and Decompressor
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

#ifndef TAGFORGE_CORE_COMPRESSION_ZLIB_H
#define TAGFORGE_CORE_COMPRESSION_ZLIB_H

#include "core/compression/Compressor.h"
#include "core/compression/Decompressor.h"

namespace TagForge {
namespace Core {
namespace Compression {

/**
 * @brief zlib-wrapped deflate compressor, as used by compressed ID3v2 frames
 */
class ZlibCompressor : public Compressor {
public:
    /**
     * @param level zlib compression level, Z_DEFAULT_COMPRESSION by default
     */
    explicit ZlibCompressor(int level = -1);

    std::vector<uint8_t> compress(const uint8_t* data, size_t size) override;

private:
    int m_level;
};

/**
 * @brief zlib-wrapped inflate decompressor
 *
 * Failures (corrupt stream, truncated input, output beyond the limit)
 * throw TagForge::Error with ErrorKind::Parsing.
 */
class ZlibDecompressor : public Decompressor {
public:
    /**
     * @param size_hint Expected decompressed size, used to size the first
     *        output block; 0 when unknown
     * @param max_output Upper bound on the decompressed size
     */
    explicit ZlibDecompressor(size_t size_hint = 0, size_t max_output = 256 * 1024 * 1024);

    std::vector<uint8_t> decompress(const uint8_t* data, size_t size) override;

private:
    size_t m_size_hint;
    size_t m_max_output;
};

} // namespace Compression
} // namespace Core
} // namespace TagForge

#endif // TAGFORGE_CORE_COMPRESSION_ZLIB_H
