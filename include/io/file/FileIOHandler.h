/*
 * FileIOHandler.h - Local file I/O handler
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

#ifndef FILEIOHANDLER_H
#define FILEIOHANDLER_H

// No direct includes - all includes should be in tagforge.h

namespace TagForge {
namespace IO {
namespace File {

/**
 * @brief Concrete IOHandler implementation for local file access
 *
 * Wraps a stdio stream with 64-bit offsets (fseeko/ftello). Opened for
 * update, the file can be written at any position and resized with
 * truncate(), which is what the storage splicer needs.
 */
class FileIOHandler : public IOHandler {
public:
    enum class Mode {
        ReadOnly,   ///< "rb"
        ReadWrite   ///< "r+b", the file must exist
    };

    /**
     * @brief Constructs a FileIOHandler for a given local file path
     * @param path The file path to open
     * @param mode Access mode
     * @throws Error (ErrorKind::Io) if the file cannot be opened
     */
    explicit FileIOHandler(const std::string& path, Mode mode = Mode::ReadOnly);

    /**
     * @brief Destroys the FileIOHandler and closes the file
     */
    ~FileIOHandler() override;

    size_t read(void* buffer, size_t size, size_t count) override;
    size_t write(const void* buffer, size_t size, size_t count) override;
    int seek(off_t offset, int whence) override;
    off_t tell() override;
    int close() override;
    bool eof() override;
    off_t getFileSize() override;

    /**
     * @brief Resize the file with ftruncate()
     * @return 0 on success, -1 on failure
     */
    int truncate(off_t length) override;

    const std::string& path() const { return m_file_path; }

private:
    /**
     * @brief Move the stdio stream to m_position
     *
     * stdio requires a positioning call between a read and a write on an
     * update stream; every transfer goes through here first.
     */
    bool syncStreamPosition(const char* operation);

    RAIIFileHandle m_file_handle;   // RAII-managed file handle for I/O operations
    std::string m_file_path;        // Original file path for error reporting
    Mode m_mode;
};

} // namespace File
} // namespace IO
} // namespace TagForge

#endif // FILEIOHANDLER_H
