/*
 * MemoryIOHandler.cpp - In-memory IOHandler implementation
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

#ifndef FINAL_BUILD
#include "tagforge.h"
#endif // !FINAL_BUILD

namespace TagForge {
namespace IO {

MemoryIOHandler::MemoryIOHandler() = default;

MemoryIOHandler::MemoryIOHandler(const void* data, size_t size) {
    if (data && size > 0) {
        m_buffer.assign(static_cast<const uint8_t*>(data), static_cast<const uint8_t*>(data) + size);
    }
}

MemoryIOHandler::MemoryIOHandler(std::vector<uint8_t> data)
    : m_buffer(std::move(data)) {
}

MemoryIOHandler::~MemoryIOHandler() = default;

size_t MemoryIOHandler::read(void* buffer, size_t size, size_t count) {
    updateErrorState(0);

    if (m_closed) {
        updateErrorState(EBADF);
        return 0;
    }

    size_t bytes_requested = size * count;
    if (bytes_requested == 0) return 0;

    if (!buffer) {
        updateErrorState(EINVAL);
        return 0;
    }

    size_t available = m_pos < m_buffer.size() ? m_buffer.size() - m_pos : 0;
    // Whole elements only, as fread() reports
    size_t to_read = (std::min(bytes_requested, available) / size) * size;

    if (to_read > 0) {
        std::memcpy(buffer, m_buffer.data() + m_pos, to_read);
        m_pos += to_read;
        updatePosition(static_cast<off_t>(m_pos));
    }

    updateEofState(to_read < bytes_requested);
    return to_read / size;
}

size_t MemoryIOHandler::write(const void* buffer, size_t size, size_t count) {
    updateErrorState(0);

    if (m_closed) {
        updateErrorState(EBADF);
        return 0;
    }

    size_t bytes = size * count;
    if (bytes == 0) return 0;

    if (!buffer) {
        updateErrorState(EINVAL);
        return 0;
    }

    if (m_fail_writes) {
        if (m_writes_left == 0) {
            updateErrorState(ENOSPC, getErrorMessage(ENOSPC, "MemoryIOHandler::write"));
            return 0;
        }
        --m_writes_left;
    }

    if (m_pos + bytes > m_buffer.size()) {
        m_buffer.resize(m_pos + bytes);
    }
    std::memcpy(m_buffer.data() + m_pos, buffer, bytes);
    m_pos += bytes;
    updatePosition(static_cast<off_t>(m_pos));
    updateEofState(false);
    return count;
}

int MemoryIOHandler::seek(off_t offset, int whence) {
    updateErrorState(0);

    if (m_closed) {
        updateErrorState(EBADF);
        return -1;
    }

    off_t new_pos;
    switch (whence) {
        case SEEK_SET:
            new_pos = offset;
            break;
        case SEEK_CUR:
            new_pos = static_cast<off_t>(m_pos) + offset;
            break;
        case SEEK_END:
            new_pos = static_cast<off_t>(m_buffer.size()) + offset;
            break;
        default:
            updateErrorState(EINVAL);
            return -1;
    }

    // Seeking past the end is valid; a later write fills the gap with zeros
    if (!updatePosition(new_pos)) {
        updateErrorState(EINVAL);
        return -1;
    }

    m_pos = static_cast<size_t>(new_pos);
    updateEofState(false);
    return 0;
}

off_t MemoryIOHandler::tell() {
    if (m_closed) {
        updateErrorState(EBADF);
        return -1;
    }
    return static_cast<off_t>(m_pos);
}

int MemoryIOHandler::close() {
    updateClosedState(true);
    return 0;
}

bool MemoryIOHandler::eof() {
    return m_closed || m_eof;
}

off_t MemoryIOHandler::getFileSize() {
    if (m_closed) {
        updateErrorState(EBADF);
        return -1;
    }
    return static_cast<off_t>(m_buffer.size());
}

int MemoryIOHandler::truncate(off_t length) {
    updateErrorState(0);

    if (m_closed) {
        updateErrorState(EBADF);
        return -1;
    }

    if (length < 0) {
        updateErrorState(EINVAL);
        return -1;
    }

    m_buffer.resize(static_cast<size_t>(length), 0x00);
    return 0;
}

void MemoryIOHandler::failWritesAfter(size_t successful_writes) {
    m_fail_writes = true;
    m_writes_left = successful_writes;
}

} // namespace IO
} // namespace TagForge
