/*
 * FileIOHandler.cpp - Local file I/O handler
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
namespace File {

/**
 * @brief Constructs a FileIOHandler for a given local file path.
 *
 * @param path The file path to open
 * @param mode ReadOnly opens with "rb", ReadWrite with "r+b"
 * @throws Error (ErrorKind::Io) if the file cannot be opened
 */
FileIOHandler::FileIOHandler(const std::string& path, Mode mode)
    : m_file_path(path), m_mode(mode) {
    const char* fmode = (mode == Mode::ReadWrite) ? "r+b" : "rb";

    if (!m_file_handle.open(path.c_str(), fmode)) {
        m_error = errno;
        std::string errorMsg = getErrorMessage(m_error, "Could not open file: " + path);
        Debug::log("io", "FileIOHandler::FileIOHandler() - ", errorMsg);
        throw Error(ErrorKind::Io, errorMsg);
    }

    Debug::log("io", "FileIOHandler::FileIOHandler() - Opened ", path, " (", fmode, ")");
}

/**
 * @brief Destroys the FileIOHandler object.
 *
 * This ensures the underlying file handle is closed properly.
 */
FileIOHandler::~FileIOHandler() {
    if (!m_closed && close() != 0) {
        Debug::log("io", "FileIOHandler::~FileIOHandler() - Close failed for ", m_file_path);
    }
}

bool FileIOHandler::syncStreamPosition(const char* operation) {
    if (!m_file_handle) {
        updateErrorState(EBADF, std::string("Bad file descriptor in ") + operation);
        return false;
    }
    if (fseeko(m_file_handle.get(), m_position, SEEK_SET) != 0) {
        updateErrorState(errno, getErrorMessage(errno, std::string("fseeko before ") + operation));
        return false;
    }
    return true;
}

size_t FileIOHandler::read(void* buffer, size_t size, size_t count) {
    updateErrorState(0);

    if (m_closed) {
        updateErrorState(EBADF);
        return 0;
    }

    if (size == 0 || count == 0) {
        return 0;
    }

    if (!buffer) {
        updateErrorState(EINVAL);
        return 0;
    }

    if (!syncStreamPosition("read")) {
        return 0;
    }

    errno = 0;
    size_t elements_read = fread(buffer, size, count, m_file_handle.get());

    if (elements_read < count) {
        if (ferror(m_file_handle.get())) {
            int file_error = errno ? errno : EIO;
            updateErrorState(file_error, getErrorMessage(file_error, "fread on " + m_file_path));
            clearerr(m_file_handle.get());
        } else {
            updateEofState(true);
        }
    }

    // A short read may have consumed part of an element; stay on the element boundary
    updatePosition(m_position + static_cast<off_t>(elements_read * size));

    Debug::log("io", "FileIOHandler::read() - Read ", elements_read * size, " bytes, new position: ", m_position);
    return elements_read;
}

size_t FileIOHandler::write(const void* buffer, size_t size, size_t count) {
    updateErrorState(0);

    if (m_closed) {
        updateErrorState(EBADF);
        return 0;
    }

    if (size == 0 || count == 0) {
        return 0;
    }

    if (!buffer) {
        updateErrorState(EINVAL);
        return 0;
    }

    if (m_mode != Mode::ReadWrite) {
        updateErrorState(EBADF, "FileIOHandler::write() - " + m_file_path + " is open read-only");
        return 0;
    }

    if (!syncStreamPosition("write")) {
        return 0;
    }

    errno = 0;
    size_t elements_written = fwrite(buffer, size, count, m_file_handle.get());
    if (elements_written < count) {
        int file_error = errno ? errno : EIO;
        updateErrorState(file_error, getErrorMessage(file_error, "fwrite on " + m_file_path));
        clearerr(m_file_handle.get());
    }

    updatePosition(m_position + static_cast<off_t>(elements_written * size));
    updateEofState(false);
    return elements_written;
}

int FileIOHandler::seek(off_t offset, int whence) {
    updateErrorState(0);

    if (m_closed) {
        updateErrorState(EBADF);
        return -1;
    }

    off_t new_position;
    switch (whence) {
        case SEEK_SET:
            new_position = offset;
            break;
        case SEEK_CUR:
            new_position = m_position + offset;
            break;
        case SEEK_END: {
            off_t file_size = getFileSize();
            if (file_size < 0) {
                return -1;
            }
            new_position = file_size + offset;
            break;
        }
        default:
            updateErrorState(EINVAL);
            return -1;
    }

    if (!updatePosition(new_position)) {
        updateErrorState(EINVAL, "FileIOHandler::seek() - Negative position requested");
        return -1;
    }

    updateEofState(false);
    return 0;
}

off_t FileIOHandler::tell() {
    if (m_closed) {
        updateErrorState(EBADF);
        return -1;
    }
    return m_position;
}

int FileIOHandler::close() {
    updateErrorState(0);

    if (m_closed) {
        return 0;
    }

    int result = m_file_handle.close();
    if (result != 0) {
        updateErrorState(errno, getErrorMessage(errno, "fclose on " + m_file_path));
    }

    updateClosedState(true);
    updateEofState(true);
    return result;
}

bool FileIOHandler::eof() {
    return m_closed || m_eof;
}

off_t FileIOHandler::getFileSize() {
    updateErrorState(0);

    if (m_closed || !m_file_handle) {
        updateErrorState(EBADF, "Bad file descriptor in getFileSize");
        return -1;
    }

    // Buffered writes must reach the descriptor before fstat can see them
    if (fflush(m_file_handle.get()) != 0) {
        updateErrorState(errno, getErrorMessage(errno, "fflush on " + m_file_path));
        return -1;
    }

    struct stat file_stat;
    if (fstat(fileno(m_file_handle.get()), &file_stat) != 0) {
        updateErrorState(errno, getErrorMessage(errno, "fstat on " + m_file_path));
        return -1;
    }

    return file_stat.st_size;
}

int FileIOHandler::truncate(off_t length) {
    updateErrorState(0);

    if (m_closed || !m_file_handle) {
        updateErrorState(EBADF);
        return -1;
    }

    if (length < 0) {
        updateErrorState(EINVAL);
        return -1;
    }

    if (m_mode != Mode::ReadWrite) {
        updateErrorState(EBADF, "FileIOHandler::truncate() - " + m_file_path + " is open read-only");
        return -1;
    }

    if (fflush(m_file_handle.get()) != 0) {
        updateErrorState(errno, getErrorMessage(errno, "fflush on " + m_file_path));
        return -1;
    }

    if (ftruncate(fileno(m_file_handle.get()), length) != 0) {
        updateErrorState(errno, getErrorMessage(errno, "ftruncate on " + m_file_path));
        return -1;
    }

    Debug::log("io", "FileIOHandler::truncate() - ", m_file_path, " resized to ", length, " bytes");
    return 0;
}

} // namespace File
} // namespace IO
} // namespace TagForge
