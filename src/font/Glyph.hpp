//===----------------------------------------------------------------------===//
//
// File: src/font/Glyph.hpp
// Purpose: Variable-width 5-row glyph bitmap used by the built-in font.
//
// Key invariants:
//   - Every glyph has exactly kGlyphHeight rows.
//   - Width is in [1, kMaxGlyphWidth]; each row uses only its low `width` bits.
//   - The most significant used bit of a row is the leftmost pixel.
//
// Ownership/Lifetime:
//   - Plain value type; the built-in table stores glyphs as constexpr data and
//     lookups hand out copies.
//
// Links: src/font/GlyphTable.cpp (dataset)
//
//===----------------------------------------------------------------------===//
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace pixart::font
{

/// @brief Fixed number of pixel rows in every glyph.
inline constexpr std::size_t kGlyphHeight = 5;

/// @brief Widest glyph in the built-in font.
inline constexpr std::size_t kMaxGlyphWidth = 5;

/// @brief One character's bitmap: a width and one bitmask per row.
class GlyphPattern
{
  public:
    using Rows = std::array<std::uint8_t, kGlyphHeight>;

    constexpr GlyphPattern(std::uint8_t width, Rows rows) : width_(width), rows_(rows) {}

    /// @brief Number of pixel columns.
    constexpr std::size_t width() const
    {
        return width_;
    }

    /// @brief Number of pixel rows (always kGlyphHeight).
    constexpr std::size_t height() const
    {
        return kGlyphHeight;
    }

    /// @brief Raw bitmask of row @p row; bit (width - 1) is column 0.
    constexpr std::uint8_t rowBits(std::size_t row) const
    {
        return rows_[row];
    }

    /// @brief Test the pixel at (@p row, @p col); both must be in range.
    constexpr bool pixel(std::size_t row, std::size_t col) const
    {
        return ((rows_[row] >> (width_ - 1 - col)) & 1u) != 0;
    }

    /// @brief Check the width range and that no row has bits beyond width.
    constexpr bool wellFormed() const
    {
        if (width_ < 1 || width_ > kMaxGlyphWidth)
        {
            return false;
        }
        for (std::uint8_t bits : rows_)
        {
            if ((bits >> width_) != 0)
            {
                return false;
            }
        }
        return true;
    }

    friend constexpr bool operator==(const GlyphPattern &, const GlyphPattern &) = default;

  private:
    std::uint8_t width_;
    Rows rows_;
};

} // namespace pixart::font
