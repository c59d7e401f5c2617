//===----------------------------------------------------------------------===//
//
// Part of the Pixart project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: font/Renderer.hpp
// Purpose: Validate text and compose built-in glyphs into a bordered bitmap
//          serialized as rows of '0'/'1'.
// Key invariants: A successful render has kBitmapHeight rows of equal length;
//                 failures produce no partial output.
// Ownership/Lifetime: Functions are pure; each call returns an owned result.
// Links: docs/font.md#rendering
//
//===----------------------------------------------------------------------===//

#pragma once

#include "font/Glyph.hpp"
#include "font/RenderError.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace pixart::font
{

/// @brief Blank columns between consecutive glyphs.
inline constexpr std::size_t kSpacingColumns = 1;

/// @brief Blank pixels surrounding the composed bitmap on each side.
inline constexpr std::size_t kBorderPixels = 1;

/// @brief Row count of every rendered bitmap.
inline constexpr std::size_t kBitmapHeight = kGlyphHeight + 2 * kBorderPixels;

/// @brief Default maximum number of characters accepted per request.
inline constexpr std::size_t kDefaultMaxLength = 100;

/// @brief How unsupported characters are treated.
enum class FallbackPolicy
{
    Strict, ///< Reject the text with CharacterNotFound.
    Lossy   ///< Substitute the space glyph.
};

/// @brief Per-call rendering knobs.
struct RenderOptions
{
    std::size_t maxLength = kDefaultMaxLength;
    FallbackPolicy fallback = FallbackPolicy::Strict;
};

/// @brief Rendered rows, top to bottom; each row is a string over {'0','1'}.
using PixelArt = std::vector<std::string>;

/// @brief Pixel dimensions of a rendered bitmap.
struct Extent
{
    std::size_t width = 0;
    std::size_t height = 0;

    friend bool operator==(const Extent &, const Extent &) = default;
};

/// @brief Check @p text against the length limit, the empty-text rule and,
///        under the strict policy, glyph coverage.
/// @details Checks run in that order; the first unsupported character (left to
///          right) is reported.
RenderResult<void> validate(std::string_view text, const RenderOptions &options = {});

/// @brief Render @p text using the fallback policy named in @p options.
RenderResult<PixelArt> compose(std::string_view text, const RenderOptions &options = {});

/// @brief Render @p text, rejecting unsupported characters.
RenderResult<PixelArt> render(std::string_view text, const RenderOptions &options = {});

/// @brief Render @p text, drawing unsupported characters as blank space.
RenderResult<PixelArt> renderLossy(std::string_view text, const RenderOptions &options = {});

/// @brief Dimensions compose(@p text, @p options) would produce.
RenderResult<Extent> measure(std::string_view text, const RenderOptions &options = {});

} // namespace pixart::font
