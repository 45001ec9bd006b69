/*
 * exceptions.h - Error type shared by the tag codecs and the storage layer.
 * This file is part of TagForge.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
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

#ifndef EXCEPTIONS_H
#define EXCEPTIONS_H

// No direct includes - all includes should be in tagforge.h

namespace TagForge {

namespace Tag {
class ID3v2Tag;
}

/**
 * @brief Classification of every failure the library reports
 */
enum class ErrorKind {
    NoTag,              ///< No recognizable tag magic at the expected place
    UnsupportedVersion, ///< Unknown ID3v2 major version or revision
    Parsing,            ///< Malformed header, frame, syncsafe value or body
    UnsupportedFeature, ///< Encrypted frame, unrepresentable frame on downgrade
    StringDecoding,     ///< Text that is not valid in its declared encoding
    Io                  ///< Failure reported by the underlying store
};

const char* errorKindName(ErrorKind kind);

inline std::ostream& operator<<(std::ostream& os, ErrorKind kind) {
    return os << errorKindName(kind);
}

// Every failure raised by the codecs and the storage splicer.
class Error : public std::exception
{
    public:
        Error(ErrorKind kind, std::string why);
        Error(ErrorKind kind, std::string why, std::shared_ptr<Tag::ID3v2Tag> partial_tag);
        ~Error() noexcept override = default;
        const char *what() const noexcept override;

        ErrorKind kind() const noexcept { return m_kind; }
        const std::string& description() const noexcept { return m_why; }

        /**
         * @brief Frames decoded before a frame-level failure, if any
         * @return The partial tag, or nullptr when none was collected
         */
        std::shared_ptr<Tag::ID3v2Tag> partialTag() const { return m_partial_tag; }
        bool hasPartialTag() const noexcept { return m_partial_tag != nullptr; }

        /**
         * @brief Copy of this error carrying the given partial tag
         */
        Error withPartialTag(std::shared_ptr<Tag::ID3v2Tag> partial_tag) const;
    protected:
    private:
        ErrorKind m_kind;
        std::string m_why;
        std::string m_what;
        std::shared_ptr<Tag::ID3v2Tag> m_partial_tag;
};

/**
 * @brief True when the error only says that no tag is present
 */
bool noTagOk(const Error& error);

/**
 * @brief True when the error is a frame-level failure that still carries
 *        the frames decoded so far
 */
bool partialTagOk(const Error& error);

} // namespace TagForge

#endif // EXCEPTIONS_H
