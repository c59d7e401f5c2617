//===----------------------------------------------------------------------===//
//
// Part of the Pixart project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic constructors and printer shared by the pixart
// tool and the configuration layer.  Keeping the severity wording in one
// translation unit guarantees that every user-visible message is formatted the
// same way regardless of which subsystem produced it.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Diagnostic helpers: constructors, severity names and printing.

#include "support/diagnostics.hpp"

#include <utility>

namespace pixart::support
{

/// @brief Build an error diagnostic with the provided message.
/// @param msg Human-readable description of the problem.
/// @return Diagnostic populated with error severity.
Diagnostic makeError(std::string msg)
{
    return Diagnostic{Severity::Error, std::move(msg)};
}

/// @brief Build a note diagnostic, used for follow-up hints after an error.
Diagnostic makeNote(std::string msg)
{
    return Diagnostic{Severity::Note, std::move(msg)};
}

/// @brief Map a diagnostic severity to a lowercase string used for printing.
///
/// @details New severity enumerators should extend this switch to keep the
///          wording predictable across the command-line tool.
const char *severityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details Emits "<severity>: <message>" followed by a newline so multiple
///          diagnostics appear as a contiguous block.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
void printDiag(const Diagnostic &diag, std::ostream &os)
{
    os << severityToString(diag.severity) << ": " << diag.message << '\n';
}

} // namespace pixart::support
