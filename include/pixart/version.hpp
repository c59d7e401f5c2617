//===----------------------------------------------------------------------===//
//
// Part of the Pixart project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/pixart/version.hpp
// Purpose: Project version macros shared by the library and the pixart tool.
// Key invariants: Must match the VERSION in the top-level CMakeLists.txt.
// Ownership/Lifetime: N/A.
//
//===----------------------------------------------------------------------===//

#pragma once

#define PIXART_VERSION_MAJOR 0
#define PIXART_VERSION_MINOR 1
#define PIXART_VERSION_PATCH 0
#define PIXART_VERSION_STR "0.1.0"

/// @brief Font revision; bump whenever a glyph bitmap or width changes.
#define PIXART_FONT_VERSION_STR "5x5v1"
