//===----------------------------------------------------------------------===//
//
// Part of the Pixart project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Formats render errors into the one-line messages shown by the pixart tool
// and used in test expectations.
//
//===----------------------------------------------------------------------===//

#include "font/RenderError.hpp"

#include "support/utf8.hpp"

#include <sstream>

namespace pixart::font
{

const char *errcName(RenderErrc code)
{
    switch (code)
    {
        case RenderErrc::CharacterNotFound:
            return "CharacterNotFound";
        case RenderErrc::TextTooLong:
            return "TextTooLong";
        case RenderErrc::EmptyText:
            return "EmptyText";
    }
    return "";
}

std::string describe(const RenderError &error)
{
    std::ostringstream os;
    switch (error.code)
    {
        case RenderErrc::CharacterNotFound:
            os << "Character '" << support::encodeUtf8(error.character) << "' not found in font";
            break;
        case RenderErrc::TextTooLong:
            os << "Text too long: " << error.length << " characters (max: " << error.limit << ")";
            break;
        case RenderErrc::EmptyText:
            os << "Text is empty";
            break;
    }
    return os.str();
}

support::Diagnostic toDiagnostic(const RenderError &error)
{
    return support::makeError(describe(error));
}

} // namespace pixart::font
