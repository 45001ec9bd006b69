/*
 * Zlib.cpp - zlib (RFC 1950) Compressor and Decompressor implementation
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
namespace Core {
namespace Compression {

namespace {

std::string zlibMessage(const z_stream& z, int result) {
    std::string message = "zlib error ";
    message += std::to_string(result);
    if (z.msg) {
        message += " (";
        message += z.msg;
        message += ")";
    }
    return message;
}

// Owns an initialised z_stream and always releases it
class InflateStream {
public:
    InflateStream() {
        std::memset(&m_z, 0, sizeof(m_z));
        m_z.zalloc = Z_NULL;
        m_z.zfree = Z_NULL;
        m_z.opaque = Z_NULL;
        int result = inflateInit(&m_z);
        if (result != Z_OK) {
            throw Error(ErrorKind::Parsing, "inflateInit failed: " + zlibMessage(m_z, result));
        }
    }
    ~InflateStream() { inflateEnd(&m_z); }
    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    z_stream& get() { return m_z; }

private:
    z_stream m_z;
};

class DeflateStream {
public:
    explicit DeflateStream(int level) {
        std::memset(&m_z, 0, sizeof(m_z));
        m_z.zalloc = Z_NULL;
        m_z.zfree = Z_NULL;
        m_z.opaque = Z_NULL;
        int result = deflateInit(&m_z, level);
        if (result != Z_OK) {
            throw Error(ErrorKind::Parsing, "deflateInit failed: " + zlibMessage(m_z, result));
        }
    }
    ~DeflateStream() { deflateEnd(&m_z); }
    DeflateStream(const DeflateStream&) = delete;
    DeflateStream& operator=(const DeflateStream&) = delete;

    z_stream& get() { return m_z; }

private:
    z_stream m_z;
};

} // anonymous namespace

// ============================================================================
// ZlibCompressor
// ============================================================================

ZlibCompressor::ZlibCompressor(int level) : m_level(level) {
}

std::vector<uint8_t> ZlibCompressor::compress(const uint8_t* data, size_t size) {
    DeflateStream stream(m_level);
    z_stream& z = stream.get();

    std::vector<uint8_t> output(deflateBound(&z, static_cast<uLong>(size)));
    z.next_in = const_cast<Bytef*>(data);
    z.avail_in = static_cast<uInt>(size);
    z.next_out = output.data();
    z.avail_out = static_cast<uInt>(output.size());

    int result = deflate(&z, Z_FINISH);
    if (result != Z_STREAM_END) {
        throw Error(ErrorKind::Parsing, "deflate failed: " + zlibMessage(z, result));
    }
    output.resize(z.total_out);

    Debug::log("frame", "ZlibCompressor::compress: ", size, " -> ", output.size(), " bytes");
    return output;
}

// ============================================================================
// ZlibDecompressor
// ============================================================================

ZlibDecompressor::ZlibDecompressor(size_t size_hint, size_t max_output)
    : m_size_hint(size_hint), m_max_output(max_output) {
}

std::vector<uint8_t> ZlibDecompressor::decompress(const uint8_t* data, size_t size) {
    InflateStream stream;
    z_stream& z = stream.get();

    size_t block = m_size_hint > 0 ? std::min(m_size_hint, m_max_output) : std::max<size_t>(size * 4, 1024);
    std::vector<uint8_t> output(block);

    z.next_in = const_cast<Bytef*>(data);
    z.avail_in = static_cast<uInt>(size);

    while (true) {
        if (z.total_out == output.size()) {
            if (output.size() >= m_max_output) {
                throw Error(ErrorKind::Parsing, "decompressed data exceeds " + std::to_string(m_max_output) + " bytes");
            }
            output.resize(std::min(output.size() * 2, m_max_output));
        }
        z.next_out = output.data() + z.total_out;
        z.avail_out = static_cast<uInt>(output.size() - z.total_out);

        int result = inflate(&z, Z_NO_FLUSH);
        if (result == Z_STREAM_END) {
            break;
        }
        if (result == Z_BUF_ERROR && z.avail_in == 0 && z.avail_out > 0) {
            throw Error(ErrorKind::Parsing, "compressed data is truncated");
        }
        if (result != Z_OK && result != Z_BUF_ERROR) {
            throw Error(ErrorKind::Parsing, "inflate failed: " + zlibMessage(z, result));
        }
    }

    output.resize(z.total_out);
    Debug::log("frame", "ZlibDecompressor::decompress: ", size, " -> ", output.size(), " bytes");
    return output;
}

} // namespace Compression
} // namespace Core
} // namespace TagForge
