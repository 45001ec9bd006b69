/*
 * tagforge.h - Master include file for TagForge
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

#ifndef __TAGFORGE_H__
#define __TAGFORGE_H__

// defines
#define TAGFORGE_VERSION "1.0.0"
#define TAGFORGE_MAINTAINER "Kirn Gill II <segin2005@gmail.com>"

// C++ standard library
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

// POSIX
#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>

// Third-party
#include <zlib.h>

// Ambient
#include "debug.h"
#include "exceptions.h"
#include "core/about.h"

// Core utilities
#include "core/utility/UTF8Util.h"
#include "core/compression/Compressor.h"
#include "core/compression/Decompressor.h"
#include "core/compression/Zlib.h"

// I/O
#include "RAIIFileHandle.h"
#include "io/IOHandler.h"
#include "io/MemoryIOHandler.h"
#include "io/file/FileIOHandler.h"
#include "io/StorageSplicer.h"

// Tag codec, leaves first
#include "tag/Version.h"
#include "tag/Encoding.h"
#include "tag/ID3v2Utils.h"
#include "tag/FrameRegistry.h"
#include "tag/Timestamp.h"
#include "tag/Content.h"
#include "tag/ContentCodec.h"
#include "tag/Frame.h"
#include "tag/FrameCodec.h"
#include "tag/ID3v2Tag.h"
#include "tag/TagCodec.h"
#include "tag/Genres.h"
#include "tag/ID3v1Tag.h"
#include "tag/ID3v1v2.h"

#endif // __TAGFORGE_H__
