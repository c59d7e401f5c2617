//===----------------------------------------------------------------------===//
//
// Part of the Pixart project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the pixart command-line tool.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for pixart; delegates to the shared driver.

#include "cli.hpp"

#include <iostream>

/// @brief Render text from argv or one line of stdin to '0'/'1' rows.
///
/// @param argc Number of command-line arguments.
/// @param argv Array of argument strings.
/// @return Exit status: 0 after rendering or reporting a render error,
///         1 on malformed arguments or an unreadable config file.
int main(int argc, char **argv)
{
    return pixart::tools::runPixart(argc, argv, std::cin, std::cout, std::cerr);
}
