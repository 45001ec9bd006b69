/*
 * about.cpp - Print about and usage info to the console
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
namespace Core {

static const char _about_message[] = "This is TagForge version " TAGFORGE_VERSION ".\n"
            "\n"
            "Copyright © 2009-2025 Kirn Gill II <segin2005@gmail.com>\n"
            "\n"
            "TagForge is free software. You may redistribute and/or modify it under\n"
            "the terms of the ISC License <https://opensource.org/licenses/ISC>\n"
            "\n"
            "Permission to use, copy, modify, and/or distribute this software for any\n"
            "purpose with or without fee is hereby granted, provided that the above\n"
            "copyright notice and this permission notice appear in all copies.\n"
            "\n"
            "THE SOFTWARE IS PROVIDED \"AS IS\" AND THE AUTHOR DISCLAIMS ALL WARRANTIES\n"
            "WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF\n"
            "MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR\n"
            "ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES\n"
            "WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN\n"
            "ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF\n"
            "OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.\n"
            "\n"
            "Written by " TAGFORGE_MAINTAINER "\n";

/**
 * @brief Prints the application's about information to the standard console output.
 */
void about_console()
{
    std::cout << _about_message << std::endl;
}

/**
 * @brief Prints GNU-style help information to the standard console output.
 */
void print_help()
{
    std::cout << "Usage: tagforge [OPTION]... FILE...\n";
    std::cout << "Read, edit and remove ID3v1 and ID3v2 tags in place.\n\n";

    std::cout << "Actions (default is --show):\n";
    std::cout << "  -s, --show              print the tag of each file\n";
    std::cout << "  -D, --detect            print which tag formats each file carries\n";
    std::cout << "  -r, --remove            remove ID3v1 and ID3v2 tags\n";
    std::cout << "      --set-title=TEXT    set the title (TIT2)\n";
    std::cout << "      --set-artist=TEXT   set the artist (TPE1)\n";
    std::cout << "      --set-album=TEXT    set the album (TALB)\n";
    std::cout << "      --set-genre=TEXT    set the genre (TCON)\n";
    std::cout << "      --set-year=YEAR     set the recording year\n";
    std::cout << "      --convert=VERSION   rewrite the tag as ID3v2.VERSION (2.2, 2.3, 2.4)\n\n";

    std::cout << "Write options:\n";
    std::cout << "      --unsync            apply unsynchronisation\n";
    std::cout << "      --compress          zlib-compress every frame\n";
    std::cout << "      --footer            append an ID3v2.4 footer\n";
    std::cout << "      --padding=BYTES     zero bytes after the last frame\n\n";

    std::cout << "Other options:\n";
    std::cout << "      --partial           skip frames that fail to decode\n";
    std::cout << "      --debug=CHANNELS    enable debug output for specified channels\n";
    std::cout << "                          (comma-separated list or 'all')\n";
    std::cout << "      --logfile=FILE      write debug output to specified file\n";
    std::cout << "  -h, --help              display this help and exit\n";
    std::cout << "  -v, --version           output version information and exit\n\n";

    std::cout << "Available debug channels:\n";
    std::cout << "  frame, io, tag\n\n";

    std::cout << "Examples:\n";
    std::cout << "  tagforge song.mp3                   Show the tag\n";
    std::cout << "  tagforge --set-artist=\"High Contrast\" --convert=2.3 song.mp3\n";
    std::cout << "                                      Set the artist and write ID3v2.3\n";
    std::cout << "  tagforge --debug=tag,io --logfile=debug.log --remove song.mp3\n";
    std::cout << "                                      Remove tags with codec and I/O logging\n\n";

    std::cout << "Report bugs to: segin2005@gmail.com\n";
}

} // namespace Core
} // namespace TagForge
