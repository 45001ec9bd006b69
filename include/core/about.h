/*
 * about.h - Version, license and usage text for the command line tool
 * This file is part of TagForge.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagForge is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGFORGE_CORE_ABOUT_H
#define TAGFORGE_CORE_ABOUT_H

// No direct includes - all includes should be in tagforge.h

namespace TagForge {
namespace Core {

void about_console();
void print_help();

} // namespace Core
} // namespace TagForge

#endif // TAGFORGE_CORE_ABOUT_H
