//===----------------------------------------------------------------------===//
//
// Part of the Pixart project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/pixart/usage.hpp
// Purpose: Declarations for pixart help and version text.
// Key invariants: None.
// Ownership/Lifetime: N/A.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>

namespace pixart::tools
{

/// @brief Print usage information for the pixart command-line tool.
void printUsage(std::ostream &os);

/// @brief Print version information for pixart.
void printVersion(std::ostream &os);

} // namespace pixart::tools
