/*
 * IOHandler.cpp - Base I/O handler interface implementation
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

// IOHandler base class implementation

IOHandler::IOHandler() = default;

IOHandler::~IOHandler() = default;

size_t IOHandler::read(void* buffer, size_t size, size_t count) {
    // Default implementation returns 0 (no data read) for non-functional state
    // This follows fread-like semantics where 0 indicates EOF or error
    updateErrorState(0);

    if (m_closed) {
        updateErrorState(EBADF);
        return 0;
    }

    if (!buffer) {
        updateErrorState(EINVAL);
        return 0;
    }

    if (size == 0 || count == 0 || m_eof) {
        return 0;
    }

    // Nothing can be read in the base implementation
    updateEofState(true);
    return 0;
}

size_t IOHandler::write(const void* buffer, size_t size, size_t count) {
    updateErrorState(0);

    if (m_closed) {
        updateErrorState(EBADF);
        return 0;
    }

    if (!buffer && size != 0 && count != 0) {
        updateErrorState(EINVAL);
        return 0;
    }

    if (size == 0 || count == 0) {
        return 0;
    }

    // The base handler has no backing store
    updateErrorState(EROFS);
    return 0;
}

int IOHandler::seek(off_t offset, int whence) {
    updateErrorState(0);

    if (m_closed) {
        updateErrorState(EBADF);
        return -1;
    }

    off_t new_position = m_position;
    switch (whence) {
        case SEEK_SET:
            new_position = offset;
            break;
        case SEEK_CUR:
            new_position += offset;
            break;
        case SEEK_END:
            // Can't determine end position in base class
            updateErrorState(EINVAL);
            return -1;
        default:
            updateErrorState(EINVAL);
            return -1;
    }

    if (!updatePosition(new_position)) {
        updateErrorState(EINVAL);
        return -1;
    }

    // Clear EOF if we've moved away from the end
    updateEofState(false);
    return 0;
}

off_t IOHandler::tell() {
    updateErrorState(0);

    if (m_closed) {
        updateErrorState(EBADF);
        return -1;
    }

    return m_position;
}

int IOHandler::close() {
    updateErrorState(0);

    if (m_closed) {
        // Already closed, not an error
        return 0;
    }

    updateClosedState(true);
    updateEofState(true);
    return 0;
}

bool IOHandler::eof() {
    return m_closed || m_eof;
}

off_t IOHandler::getFileSize() {
    // Base implementation doesn't know the size
    return -1;
}

int IOHandler::truncate(off_t length) {
    updateErrorState(0);

    if (m_closed) {
        updateErrorState(EBADF);
        return -1;
    }

    if (length < 0) {
        updateErrorState(EINVAL);
        return -1;
    }

    updateErrorState(EROFS);
    return -1;
}

int IOHandler::getLastError() const {
    return m_error;
}

std::string IOHandler::getErrorMessage(int error_code, const std::string& context) {
    std::string message;

    if (!context.empty()) {
        message = context + ": ";
    }

    const char* error_str = strerror(error_code);
    if (error_str) {
        message += error_str;
    } else {
        message += "Unknown error " + std::to_string(error_code);
    }

    return message;
}

bool IOHandler::updatePosition(off_t new_position) {
    if (new_position < 0) {
        Debug::log("io", "IOHandler::updatePosition() - Position underflow prevented: ", new_position);
        return false;
    }

    m_position = new_position;
    return true;
}

void IOHandler::updateErrorState(int error_code, const std::string& error_message) {
    m_error = error_code;

    if (!error_message.empty()) {
        Debug::log("io", "IOHandler::updateErrorState() - Error ", static_cast<long>(error_code), ": ", error_message);
    }
}

} // namespace IO
} // namespace TagForge
