//===----------------------------------------------------------------------===//
//
// Part of the Pixart project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares diagnostic records and their textual printer.
// Key invariants: None.
// Ownership/Lifetime: Diagnostics own their message text.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>
#include <string>

namespace pixart::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Single user-facing diagnostic message.
struct Diagnostic
{
    Severity severity;   ///< Message severity
    std::string message; ///< Human-readable text
};

/// @brief Create an error diagnostic carrying @p msg.
Diagnostic makeError(std::string msg);

/// @brief Create a note diagnostic carrying @p msg.
Diagnostic makeNote(std::string msg);

/// @brief Convert diagnostic severity to lowercase string.
const char *severityToString(Severity severity);

/// @brief Print a single diagnostic as "<severity>: <message>" plus newline.
/// @param diag Diagnostic to format.
/// @param os Output stream receiving the text.
void printDiag(const Diagnostic &diag, std::ostream &os);

} // namespace pixart::support
