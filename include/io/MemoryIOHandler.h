/*
 * MemoryIOHandler.h - In-memory IOHandler implementation
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

#ifndef MEMORYIOHANDLER_H
#define MEMORYIOHANDLER_H

// No direct includes - all includes should be in tagforge.h

namespace TagForge {
namespace IO {

/**
 * @brief Memory-based IOHandler implementation
 *
 * Behaves like a file opened for update: reads and writes happen at the
 * current position, writing past the end grows the buffer, and truncate()
 * resizes it.
 */
class MemoryIOHandler : public IOHandler {
public:
    /**
     * @brief Construct empty handler
     */
    MemoryIOHandler();

    /**
     * @brief Construct from a copy of existing data
     * @param data Pointer to data
     * @param size Size of data
     */
    MemoryIOHandler(const void* data, size_t size);

    explicit MemoryIOHandler(std::vector<uint8_t> data);

    ~MemoryIOHandler() override;

    // IOHandler interface
    size_t read(void* buffer, size_t size, size_t count) override;
    size_t write(const void* buffer, size_t size, size_t count) override;
    int seek(off_t offset, int whence) override;
    off_t tell() override;
    int close() override;
    bool eof() override;
    off_t getFileSize() override;
    int truncate(off_t length) override;

    /**
     * @brief Current contents
     */
    const std::vector<uint8_t>& data() const { return m_buffer; }

    /**
     * @brief Let successful_writes more write() calls succeed, then fail
     *        every later one with ENOSPC
     *
     * Used by the tests to simulate a full disk.
     */
    void failWritesAfter(size_t successful_writes);

private:
    std::vector<uint8_t> m_buffer;
    size_t m_pos = 0;
    bool m_fail_writes = false;
    size_t m_writes_left = 0;
};

} // namespace IO
} // namespace TagForge

#endif // MEMORYIOHANDLER_H
