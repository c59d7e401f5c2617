//===----------------------------------------------------------------------===//
//
// Part of the Pixart project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: font/GlyphTable.hpp
// Purpose: Read-only lookup from supported characters to built-in glyphs.
// Key invariants: Exactly 53 entries ('A'-'Z', 'a'-'z', ' '); upper and lower
//                 case are independent; space is a non-empty blank glyph.
// Ownership/Lifetime: The built-in table is constexpr data with static storage
//                     duration; there is no mutation API.
// Links: docs/font.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "font/Glyph.hpp"

#include <optional>
#include <string>

namespace pixart::font
{

/// @brief Immutable character-to-glyph mapping for the built-in font.
/// @details All instances view the same compiled-in dataset, so concurrent
///          reads need no synchronization.
class GlyphTable
{
  public:
    /// @brief Access the process-wide built-in table.
    static const GlyphTable &builtin();

    /// @brief Look up the glyph for @p ch.
    /// @return The glyph when @p ch is supported, std::nullopt otherwise.
    std::optional<GlyphPattern> lookup(char32_t ch) const;

    /// @brief True iff lookup(@p ch) would succeed.
    bool supports(char32_t ch) const;

    /// @brief Blank glyph used for ' ' and as the lossy substitute.
    const GlyphPattern &space() const;

    /// @brief Every supported character in table order (A-Z, a-z, space).
    std::string supportedCharacters() const;

    /// @brief Number of entries in the table.
    std::size_t size() const;

  private:
    GlyphTable() = default;
};

} // namespace pixart::font
