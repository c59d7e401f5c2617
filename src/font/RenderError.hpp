//===----------------------------------------------------------------------===//
//
// Part of the Pixart project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: font/RenderError.hpp
// Purpose: Closed error taxonomy reported by validation and rendering.
// Key invariants: Only the payload field relevant to @c code is meaningful.
// Ownership/Lifetime: Value type.
// Links: docs/font.md#errors
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/expected.hpp"

#include <cstddef>
#include <string>

namespace pixart::font
{

/// @brief Reason a render or validation request was rejected.
enum class RenderErrc
{
    CharacterNotFound, ///< Input holds a character outside the font (strict mode).
    TextTooLong,       ///< Input exceeds the configured maximum character count.
    EmptyText          ///< Input has zero characters.
};

/// @brief Error payload carried by failed render results.
struct RenderError
{
    RenderErrc code;
    char32_t character = 0;  ///< Offending character for CharacterNotFound.
    std::size_t length = 0;  ///< Character count for TextTooLong.
    std::size_t limit = 0;   ///< Configured maximum for TextTooLong.

    static RenderError characterNotFound(char32_t ch)
    {
        return RenderError{RenderErrc::CharacterNotFound, ch, 0, 0};
    }

    static RenderError textTooLong(std::size_t length, std::size_t limit)
    {
        return RenderError{RenderErrc::TextTooLong, 0, length, limit};
    }

    static RenderError emptyText()
    {
        return RenderError{RenderErrc::EmptyText, 0, 0, 0};
    }

    friend bool operator==(const RenderError &, const RenderError &) = default;
};

/// @brief Result of an operation that yields @p T or a RenderError.
template <class T> using RenderResult = support::Expected<T, RenderError>;

/// @brief Short name of @p code ("CharacterNotFound", ...).
const char *errcName(RenderErrc code);

/// @brief One-line human-readable description of @p error.
std::string describe(const RenderError &error);

/// @brief Wrap describe(@p error) in an error-severity diagnostic.
support::Diagnostic toDiagnostic(const RenderError &error);

} // namespace pixart::font
