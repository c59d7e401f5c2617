//===----------------------------------------------------------------------===//
//
// Part of the Pixart project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements help text and version information for the pixart tool.
//
//===----------------------------------------------------------------------===//

#include "usage.hpp"

#include "font/Renderer.hpp"
#include "pixart/version.hpp"

namespace pixart::tools
{

void printVersion(std::ostream &os)
{
    os << "pixart v" << PIXART_VERSION_STR << "\n";
    os << "Text to pixel-art renderer\n";
    os << "Font: " << PIXART_FONT_VERSION_STR << "\n";
}

void printUsage(std::ostream &os)
{
    os << "pixart v" << PIXART_VERSION_STR << " - Text to pixel-art renderer\n"
       << "\n"
       << "Usage: pixart [options] [text...]\n"
       << "\n"
       << "Without text arguments pixart prompts for one line on standard input.\n"
       << "\n"
       << "Options:\n"
       << "  --lossy                        Draw unsupported characters as blanks\n"
       << "  --strict                       Reject unsupported characters (default)\n"
       << "  --max-length N                 Maximum characters per render (default: "
       << font::kDefaultMaxLength << ")\n"
       << "  --config FILE                  Read settings from an INI file\n"
       << "  --ink C                        Character printed for set pixels (default: 1)\n"
       << "  --paper C                      Character printed for clear pixels (default: 0)\n"
       << "  --log-level L                  debug, info, warn, error or off\n"
       << "  -h, --help                     Show this help message\n"
       << "  --version                      Show version information\n"
       << "\n"
       << "Examples:\n"
       << "  pixart Hello World\n"
       << "  pixart --lossy 'Hi!'\n"
       << "  pixart --ink '#' --paper . Pixel\n"
       << "\n"
       << "Supported characters: A-Z, a-z, and space\n";
}

} // namespace pixart::tools
