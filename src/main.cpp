/*
 * main.cpp - contains main(), mostly.
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

#include "tagforge.h"
#include <getopt.h>

using namespace TagForge;
using namespace TagForge::Tag;

enum class Action {
    Show,
    Detect,
    Remove,
    Write
};

struct ToolOptions {
    Action action = Action::Show;
    std::optional<std::string> title;
    std::optional<std::string> artist;
    std::optional<std::string> album;
    std::optional<std::string> genre;
    std::optional<int32_t> year;
    std::optional<Version> convert_to;
    TagCodec::EncoderOptions encoder;
    TagCodec::DecoderOptions decoder;
    std::vector<std::string> files;
};

// Long-only options
enum {
    OPT_SET_TITLE = 256,
    OPT_SET_ARTIST,
    OPT_SET_ALBUM,
    OPT_SET_GENRE,
    OPT_SET_YEAR,
    OPT_CONVERT,
    OPT_UNSYNC,
    OPT_COMPRESS,
    OPT_FOOTER,
    OPT_PADDING,
    OPT_PARTIAL,
    OPT_DEBUG,
    OPT_LOGFILE
};

static std::optional<Version> parseVersion(const char* text) {
    if (strcmp(text, "2.2") == 0) return Version::ID3v22;
    if (strcmp(text, "2.3") == 0) return Version::ID3v23;
    if (strcmp(text, "2.4") == 0) return Version::ID3v24;
    return std::nullopt;
}

static void showFile(const std::string& path, const ToolOptions& options) {
    ID3v2Tag tag = ID3v1v2::readFromPath(path, options.decoder);
    std::cout << path << ": " << tag.version() << ", " << tag.frameCount() << " frames\n";
    for (const Frame& frame : tag.frames()) {
        std::cout << "  " << frame << "\n";
    }
    for (const SkippedFrame& skipped : tag.skippedFrames()) {
        std::cout << "  skipped " << (skipped.id.empty() ? "<header>" : skipped.id)
                  << " (" << skipped.kind << "): " << skipped.message << "\n";
    }
}

static void writeFile(const std::string& path, const ToolOptions& options) {
    ID3v2Tag tag;
    {
        IO::File::FileIOHandler file(path);
        try {
            tag = ID3v1v2::readFrom(file, options.decoder);
        } catch (const Error& e) {
            if (!noTagOk(e)) {
                throw;
            }
        }
    }

    if (options.title) tag.setTitle(*options.title);
    if (options.artist) tag.setArtist(*options.artist);
    if (options.album) tag.setAlbum(*options.album);
    if (options.genre) tag.setGenre(*options.genre);
    if (options.year) tag.setYear(*options.year);

    TagCodec::EncoderOptions encoder = options.encoder;
    encoder.version = options.convert_to.value_or(tag.version());
    ID3v1v2::writeToPath(path, tag, encoder);
    std::cout << path << ": wrote " << encoder.version << "\n";
}

static bool processFile(const std::string& path, const ToolOptions& options) {
    try {
        switch (options.action) {
            case Action::Show:
                showFile(path, options);
                break;
            case Action::Detect:
                std::cout << path << ": " << ID3v1v2::isCandidatePath(path) << "\n";
                break;
            case Action::Remove:
                std::cout << path << ": removed " << ID3v1v2::removeFromPath(path) << "\n";
                break;
            case Action::Write:
                writeFile(path, options);
                break;
        }
    } catch (const Error& e) {
        std::cerr << "tagforge: " << path << ": " << e.what() << std::endl;
        if (e.hasPartialTag()) {
            std::cerr << "tagforge: " << path << ": " << e.partialTag()->frameCount()
                      << " frames decoded before the error; retry with --partial" << std::endl;
        }
        return false;
    }
    return true;
}

int main(int argc, char *argv[]) {
    ToolOptions options;
    std::string logfile;
    std::vector<std::string> channels;

    static const struct option long_options[] = {
        {"show", no_argument, 0, 's'},
        {"detect", no_argument, 0, 'D'},
        {"remove", no_argument, 0, 'r'},
        {"set-title", required_argument, 0, OPT_SET_TITLE},
        {"set-artist", required_argument, 0, OPT_SET_ARTIST},
        {"set-album", required_argument, 0, OPT_SET_ALBUM},
        {"set-genre", required_argument, 0, OPT_SET_GENRE},
        {"set-year", required_argument, 0, OPT_SET_YEAR},
        {"convert", required_argument, 0, OPT_CONVERT},
        {"unsync", no_argument, 0, OPT_UNSYNC},
        {"compress", no_argument, 0, OPT_COMPRESS},
        {"footer", no_argument, 0, OPT_FOOTER},
        {"padding", required_argument, 0, OPT_PADDING},
        {"partial", no_argument, 0, OPT_PARTIAL},
        {"debug", required_argument, 0, OPT_DEBUG},
        {"logfile", required_argument, 0, OPT_LOGFILE},
        {"help", no_argument, 0, 'h'},
        {"version", no_argument, 0, 'v'},
        {0, 0, 0, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "sDrhv", long_options, nullptr)) != -1) {
        switch (opt) {
            case 's':
                options.action = Action::Show;
                break;
            case 'D':
                options.action = Action::Detect;
                break;
            case 'r':
                options.action = Action::Remove;
                break;
            case OPT_SET_TITLE:
                options.title = optarg;
                options.action = Action::Write;
                break;
            case OPT_SET_ARTIST:
                options.artist = optarg;
                options.action = Action::Write;
                break;
            case OPT_SET_ALBUM:
                options.album = optarg;
                options.action = Action::Write;
                break;
            case OPT_SET_GENRE:
                options.genre = optarg;
                options.action = Action::Write;
                break;
            case OPT_SET_YEAR:
                options.year = atoi(optarg);
                options.action = Action::Write;
                break;
            case OPT_CONVERT:
                options.convert_to = parseVersion(optarg);
                if (!options.convert_to) {
                    std::cerr << "tagforge: unknown version '" << optarg << "' (expected 2.2, 2.3 or 2.4)" << std::endl;
                    return 2;
                }
                options.action = Action::Write;
                break;
            case OPT_UNSYNC:
                options.encoder.unsynchronisation = true;
                break;
            case OPT_COMPRESS:
                options.encoder.compression = true;
                break;
            case OPT_FOOTER:
                options.encoder.footer = true;
                break;
            case OPT_PADDING:
                options.encoder.padding = static_cast<size_t>(strtoul(optarg, nullptr, 10));
                break;
            case OPT_PARTIAL:
                options.decoder.partial_tag_ok = true;
                break;
            case OPT_DEBUG:
                channels = Debug::parseChannels(optarg);
                break;
            case OPT_LOGFILE:
                logfile = optarg;
                break;
            case 'h':
                Core::print_help();
                return 0;
            case 'v':
                Core::about_console();
                return 0;
            case '?': // Invalid option
                return 2; // getopt_long already prints an error message.
        }
    }

    // Collect non-option arguments as file paths.
    for (int i = optind; i < argc; ++i) {
        options.files.push_back(argv[i]);
    }
    if (options.files.empty()) {
        std::cerr << "tagforge: no input files" << std::endl;
        std::cerr << "Try 'tagforge --help' for more information." << std::endl;
        return 2;
    }

    Debug::init(logfile, channels);

    bool ok = true;
    for (const std::string& path : options.files) {
        ok = processFile(path, options) && ok;
    }

    Debug::shutdown();
    return ok ? 0 : 1;
}
