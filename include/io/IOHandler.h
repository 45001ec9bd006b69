/*
 * IOHandler.h - Abstract I/O handler interface
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

#ifndef IOHANDLER_H
#define IOHANDLER_H

// No direct includes - all includes should be in tagforge.h

namespace TagForge {
namespace IO {

/**
 * @brief Base IOHandler interface for seekable byte stores
 *
 * This class provides a consistent interface over the places a tag can
 * live: local files and in-memory buffers. Calls follow the stdio
 * contract (element counts, 0/-1 status codes) and record errno-style
 * codes retrievable through getLastError(); they never throw.
 *
 * Handlers are not synchronised. A handler is used by one caller at a
 * time for the duration of a read or write.
 */
class IOHandler {
public:
    IOHandler();

    /**
     * @brief Virtual destructor for proper polymorphic cleanup
     */
    virtual ~IOHandler();

    IOHandler(const IOHandler&) = delete;
    IOHandler& operator=(const IOHandler&) = delete;

    /**
     * @brief Read data from the source with fread-like semantics
     * @param buffer Buffer to read data into
     * @param size Size of each element to read
     * @param count Number of elements to read
     * @return Number of elements successfully read
     */
    virtual size_t read(void* buffer, size_t size, size_t count);

    /**
     * @brief Write data at the current position with fwrite-like semantics
     *
     * Writing past the end extends the store.
     *
     * @return Number of elements successfully written
     */
    virtual size_t write(const void* buffer, size_t size, size_t count);

    /**
     * @brief Seek to a position in the source
     * @param offset Offset to seek to (off_t for large file support)
     * @param whence SEEK_SET, SEEK_CUR, or SEEK_END positioning mode
     * @return 0 on success, -1 on failure
     */
    virtual int seek(off_t offset, int whence);

    /**
     * @brief Get current byte offset position
     * @return Current position, -1 on failure
     */
    virtual off_t tell();

    /**
     * @brief Close the I/O source and cleanup resources
     * @return 0 on success, standard error codes on failure
     */
    virtual int close();

    /**
     * @brief Check if at end-of-stream condition
     */
    virtual bool eof();

    /**
     * @brief Get total size of the source in bytes
     * @return Size in bytes, or -1 if unknown
     */
    virtual off_t getFileSize();

    /**
     * @brief Set the length of the store
     *
     * Shrinking discards the bytes past length; growing appends zero bytes.
     * The position is left unchanged.
     *
     * @return 0 on success, -1 on failure
     */
    virtual int truncate(off_t length);

    /**
     * @brief Get the last error code
     * @return Error code (0 = no error)
     */
    virtual int getLastError() const;

    /**
     * @brief Convert an error code to a message
     * @param error_code The error code to convert
     * @param context Additional context for the error
     */
    static std::string getErrorMessage(int error_code, const std::string& context = "");

protected:
    /**
     * @brief Common state tracking for derived classes
     */
    bool m_closed = false;   // Indicates if the handler is closed
    bool m_eof = false;      // Indicates end-of-stream condition
    off_t m_position = 0;    // Current byte offset position
    int m_error = 0;         // Last error code (0 = no error)

    /**
     * @brief Position update with overflow protection
     * @return false if the position is negative
     */
    bool updatePosition(off_t new_position);

    /**
     * @brief Error state update, logged on the io channel when a message is given
     */
    void updateErrorState(int error_code, const std::string& error_message = "");

    void updateEofState(bool eof_state) { m_eof = eof_state; }
    void updateClosedState(bool closed_state) { m_closed = closed_state; }
};

} // namespace IO
} // namespace TagForge

#endif // IOHANDLER_H
