/*
 * tag_test_utils.h - Byte builders and error assertions shared by the tag tests
 * This file is part of TagForge.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAG_TEST_UTILS_H
#define TAG_TEST_UTILS_H

#include "tagforge.h"
#include "test_framework.h"

#include <cstdlib>

namespace TagTestUtils {

inline std::vector<uint8_t> bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

inline void append(std::vector<uint8_t>& out, const std::vector<uint8_t>& more) {
    out.insert(out.end(), more.begin(), more.end());
}

/**
 * @brief 10-byte ID3v2 header with a synchsafe size
 */
inline std::vector<uint8_t> header(uint8_t major_version, uint8_t flags, uint32_t size) {
    std::vector<uint8_t> out = {'I', 'D', '3', major_version, 0, flags, 0, 0, 0, 0};
    out[6] = static_cast<uint8_t>((size >> 21) & 0x7F);
    out[7] = static_cast<uint8_t>((size >> 14) & 0x7F);
    out[8] = static_cast<uint8_t>((size >> 7) & 0x7F);
    out[9] = static_cast<uint8_t>(size & 0x7F);
    return out;
}

/**
 * @brief A raw frame: identifier, size field for the revision, flags, body
 */
inline std::vector<uint8_t> frame(uint8_t major_version, const std::string& id,
                                  const std::vector<uint8_t>& body, uint16_t flags = 0) {
    std::vector<uint8_t> out = bytes(id);
    uint32_t size = static_cast<uint32_t>(body.size());
    if (major_version == 2) {
        out.push_back(static_cast<uint8_t>((size >> 16) & 0xFF));
        out.push_back(static_cast<uint8_t>((size >> 8) & 0xFF));
        out.push_back(static_cast<uint8_t>(size & 0xFF));
    } else if (major_version == 3) {
        out.push_back(static_cast<uint8_t>((size >> 24) & 0xFF));
        out.push_back(static_cast<uint8_t>((size >> 16) & 0xFF));
        out.push_back(static_cast<uint8_t>((size >> 8) & 0xFF));
        out.push_back(static_cast<uint8_t>(size & 0xFF));
    } else {
        out.push_back(static_cast<uint8_t>((size >> 21) & 0x7F));
        out.push_back(static_cast<uint8_t>((size >> 14) & 0x7F));
        out.push_back(static_cast<uint8_t>((size >> 7) & 0x7F));
        out.push_back(static_cast<uint8_t>(size & 0x7F));
    }
    if (major_version != 2) {
        out.push_back(static_cast<uint8_t>(flags >> 8));
        out.push_back(static_cast<uint8_t>(flags & 0xFF));
    }
    append(out, body);
    return out;
}

/**
 * @brief Latin1 text frame body: encoding byte 0 followed by the text
 */
inline std::vector<uint8_t> latin1Text(const std::string& text) {
    std::vector<uint8_t> out = {0x00};
    append(out, bytes(text));
    return out;
}

/**
 * @brief Complete tag from already built frames, optionally padded
 */
inline std::vector<uint8_t> tag(uint8_t major_version, const std::vector<std::vector<uint8_t>>& frames,
                                size_t padding = 0, uint8_t flags = 0) {
    std::vector<uint8_t> body;
    for (const auto& f : frames) {
        append(body, f);
    }
    body.insert(body.end(), padding, 0x00);
    std::vector<uint8_t> out = header(major_version, flags, static_cast<uint32_t>(body.size()));
    append(out, body);
    return out;
}

/**
 * @brief Assert that a call throws TagForge::Error of the given kind
 */
inline void assertErrorKind(std::function<void()> call, TagForge::ErrorKind expected, const std::string& message) {
    try {
        call();
    } catch (const TagForge::Error& e) {
        if (e.kind() != expected) {
            std::ostringstream oss;
            oss << message << " - Expected " << expected << " error, Got " << e.kind() << ": " << e.what();
            throw TestFramework::AssertionFailure(oss.str());
        }
        return;
    }
    throw TestFramework::AssertionFailure(message + " - no error was thrown");
}

/**
 * @brief Temporary file removed on destruction
 */
class TempFile {
public:
    explicit TempFile(const std::vector<uint8_t>& contents) {
        char name[] = "/tmp/tagforge_test_XXXXXX";
        int fd = mkstemp(name);
        if (fd < 0) {
            throw TestFramework::TestSetupFailure("mkstemp failed");
        }
        m_path = name;
        size_t written = 0;
        while (written < contents.size()) {
            ssize_t n = ::write(fd, contents.data() + written, contents.size() - written);
            if (n <= 0) {
                ::close(fd);
                throw TestFramework::TestSetupFailure("could not fill " + m_path);
            }
            written += static_cast<size_t>(n);
        }
        ::close(fd);
    }

    ~TempFile() {
        ::unlink(m_path.c_str());
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return m_path; }

    std::vector<uint8_t> contents() const {
        std::ifstream in(m_path, std::ios::binary);
        return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

private:
    std::string m_path;
};

} // namespace TagTestUtils

#endif // TAG_TEST_UTILS_H
