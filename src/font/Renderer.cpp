//===----------------------------------------------------------------------===//
//
// Part of the Pixart project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements text validation and glyph composition.  Input is decoded from
// UTF-8 once, validated, resolved to glyphs, and blitted left to right into a
// zeroed bitmap that already includes the one-pixel border.  Strict and lossy
// rendering share one code path selected by FallbackPolicy.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Validation, layout and serialization of rendered text.

#include "font/Renderer.hpp"

#include "font/GlyphTable.hpp"
#include "support/utf8.hpp"

#include <cstdint>
#include <stdexcept>
#include <utility>

namespace pixart::font
{

namespace
{

/// @brief Zero-initialized bit grid stored row-major.
class Bitmap
{
  public:
    Bitmap(std::size_t width, std::size_t height)
        : width_(width), height_(height), bits_(width * height, 0)
    {
    }

    void set(std::size_t row, std::size_t col)
    {
        bits_[row * width_ + col] = 1;
    }

    /// @brief Copy every row of @p glyph with its top-left pixel at (@p row, @p col).
    void blit(const GlyphPattern &glyph, std::size_t row, std::size_t col)
    {
        for (std::size_t r = 0; r < glyph.height(); ++r)
        {
            for (std::size_t c = 0; c < glyph.width(); ++c)
            {
                if (glyph.pixel(r, c))
                {
                    set(row + r, col + c);
                }
            }
        }
    }

    PixelArt serialize() const
    {
        PixelArt rows;
        rows.reserve(height_);
        for (std::size_t r = 0; r < height_; ++r)
        {
            std::string line(width_, '0');
            for (std::size_t c = 0; c < width_; ++c)
            {
                if (bits_[r * width_ + c] != 0)
                {
                    line[c] = '1';
                }
            }
            rows.push_back(std::move(line));
        }
        return rows;
    }

  private:
    std::size_t width_;
    std::size_t height_;
    std::vector<std::uint8_t> bits_;
};

RenderResult<void> validateDecoded(const std::u32string &chars, const RenderOptions &options)
{
    if (chars.size() > options.maxLength)
    {
        return RenderError::textTooLong(chars.size(), options.maxLength);
    }
    if (chars.empty())
    {
        return RenderError::emptyText();
    }
    if (options.fallback == FallbackPolicy::Strict)
    {
        const GlyphTable &table = GlyphTable::builtin();
        for (char32_t ch : chars)
        {
            if (!table.supports(ch))
            {
                return RenderError::characterNotFound(ch);
            }
        }
    }
    return {};
}

/// @brief Resolve every character to its glyph under @p policy.
/// @throws std::logic_error if a strict lookup fails after validation passed.
std::vector<GlyphPattern> resolveGlyphs(const std::u32string &chars, FallbackPolicy policy)
{
    const GlyphTable &table = GlyphTable::builtin();
    std::vector<GlyphPattern> glyphs;
    glyphs.reserve(chars.size());
    for (char32_t ch : chars)
    {
        if (auto glyph = table.lookup(ch))
        {
            glyphs.push_back(*glyph);
        }
        else if (policy == FallbackPolicy::Lossy)
        {
            glyphs.push_back(table.space());
        }
        else
        {
            throw std::logic_error("validated character has no glyph");
        }
    }
    return glyphs;
}

Extent extentOf(const std::vector<GlyphPattern> &glyphs)
{
    std::size_t content = 0;
    for (const GlyphPattern &g : glyphs)
    {
        content += g.width();
    }
    content += (glyphs.size() - 1) * kSpacingColumns;
    return Extent{content + 2 * kBorderPixels, kBitmapHeight};
}

} // namespace

RenderResult<void> validate(std::string_view text, const RenderOptions &options)
{
    return validateDecoded(support::decodeUtf8(text), options);
}

RenderResult<PixelArt> compose(std::string_view text, const RenderOptions &options)
{
    const std::u32string chars = support::decodeUtf8(text);
    if (auto ok = validateDecoded(chars, options); !ok)
    {
        return ok.error();
    }

    const std::vector<GlyphPattern> glyphs = resolveGlyphs(chars, options.fallback);
    const Extent extent = extentOf(glyphs);

    Bitmap bitmap(extent.width, extent.height);
    std::size_t col = kBorderPixels;
    for (const GlyphPattern &glyph : glyphs)
    {
        bitmap.blit(glyph, kBorderPixels, col);
        col += glyph.width() + kSpacingColumns;
    }
    return bitmap.serialize();
}

RenderResult<PixelArt> render(std::string_view text, const RenderOptions &options)
{
    RenderOptions strict = options;
    strict.fallback = FallbackPolicy::Strict;
    return compose(text, strict);
}

RenderResult<PixelArt> renderLossy(std::string_view text, const RenderOptions &options)
{
    RenderOptions lossy = options;
    lossy.fallback = FallbackPolicy::Lossy;
    return compose(text, lossy);
}

RenderResult<Extent> measure(std::string_view text, const RenderOptions &options)
{
    const std::u32string chars = support::decodeUtf8(text);
    if (auto ok = validateDecoded(chars, options); !ok)
    {
        return ok.error();
    }
    return extentOf(resolveGlyphs(chars, options.fallback));
}

} // namespace pixart::font
