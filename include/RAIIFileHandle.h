/*
 * RAIIFileHandle.h - RAII wrapper for FILE* handles
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

#ifndef RAIIFILEHANDLE_H
#define RAIIFILEHANDLE_H

// No direct includes - all includes should be in tagforge.h

namespace TagForge {
namespace IO {

/**
 * @brief RAII wrapper for FILE* handles with automatic cleanup
 *
 * This class provides automatic resource management for FILE* handles,
 * ensuring they are properly closed even in exception scenarios.
 */
class RAIIFileHandle {
public:
    RAIIFileHandle() noexcept;

    /**
     * @brief Constructor that takes ownership of a FILE* handle
     * @param file FILE* handle to manage (can be nullptr)
     * @param take_ownership Whether to take ownership and close on destruction
     */
    explicit RAIIFileHandle(FILE* file, bool take_ownership = true) noexcept;

    RAIIFileHandle(RAIIFileHandle&& other) noexcept;
    RAIIFileHandle& operator=(RAIIFileHandle&& other) noexcept;

    /**
     * @brief Destructor - automatically closes file if owned
     */
    ~RAIIFileHandle() noexcept;

    // Delete copy constructor and copy assignment to prevent accidental copying
    RAIIFileHandle(const RAIIFileHandle&) = delete;
    RAIIFileHandle& operator=(const RAIIFileHandle&) = delete;

    /**
     * @brief Open a file with RAII management
     * @param filename Path to the file to open
     * @param mode File open mode (e.g., "rb", "r+b")
     * @return true if file was opened successfully, false otherwise (errno is set)
     */
    bool open(const char* filename, const char* mode) noexcept;

    /**
     * @brief Close the file handle if owned
     * @return 0 on success, EOF on error (same as fclose)
     */
    int close() noexcept;

    /**
     * @brief Release ownership of the file handle
     * @return The FILE* handle (caller takes ownership)
     */
    FILE* release() noexcept;

    /**
     * @brief Reset with a new file handle
     */
    void reset(FILE* file = nullptr, bool take_ownership = true) noexcept;

    FILE* get() const noexcept { return m_file; }
    bool is_valid() const noexcept { return m_file != nullptr; }
    explicit operator bool() const noexcept { return is_valid(); }

private:
    FILE* m_file;           // The managed FILE* handle
    bool m_owns_handle;     // Whether we own the handle and should close it
};

} // namespace IO
} // namespace TagForge

#endif // RAIIFILEHANDLE_H
