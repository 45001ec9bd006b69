/*
 * exceptions.cpp - Error type code
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

#ifndef FINAL_BUILD
#include "tagforge.h"
#endif // !FINAL_BUILD

namespace TagForge {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NoTag: return "NoTag";
        case ErrorKind::UnsupportedVersion: return "UnsupportedVersion";
        case ErrorKind::Parsing: return "Parsing";
        case ErrorKind::UnsupportedFeature: return "UnsupportedFeature";
        case ErrorKind::StringDecoding: return "StringDecoding";
        case ErrorKind::Io: return "Io";
    }
    return "Unknown";
}

/**
 * @brief Constructs an Error.
 *
 * @param kind The classification used by callers to decide whether the
 *             failure is fatal.
 * @param why A string describing the reason for the failure.
 */
Error::Error(ErrorKind kind, std::string why)
    : std::exception(), m_kind(kind), m_why(std::move(why)) {
  m_what = std::string(errorKindName(m_kind)) + ": " + m_why;
}

/**
 * @brief Constructs an Error that carries the frames decoded before it.
 *
 * Thrown by the tag decoder when a frame fails and the caller did not ask
 * for frame errors to be skipped.
 * @param kind The failure classification.
 * @param why A string describing the reason for the failure.
 * @param partial_tag The tag as decoded up to the failing frame.
 */
Error::Error(ErrorKind kind, std::string why, std::shared_ptr<Tag::ID3v2Tag> partial_tag)
    : Error(kind, std::move(why)) {
  m_partial_tag = std::move(partial_tag);
}

/**
 * @brief Returns the exception's explanatory string.
 * @return "<Kind>: <description>"
 */
const char *Error::what() const noexcept {
  return m_what.c_str();
}

Error Error::withPartialTag(std::shared_ptr<Tag::ID3v2Tag> partial_tag) const {
  return Error(m_kind, m_why, std::move(partial_tag));
}

bool noTagOk(const Error& error) {
  return error.kind() == ErrorKind::NoTag;
}

bool partialTagOk(const Error& error) {
  if (!error.hasPartialTag()) {
    return false;
  }
  switch (error.kind()) {
    case ErrorKind::Parsing:
    case ErrorKind::UnsupportedFeature:
    case ErrorKind::StringDecoding:
      return true;
    default:
      return false;
  }
}

} // namespace TagForge
