//===----------------------------------------------------------------------===//
//
// Part of the Pixart project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_renderer.cpp
// Purpose: Verify validation, strict and lossy composition, and bitmap layout.
// Key invariants: Rendered bitmaps have 7 rows of width
//                 sum(widths) + (n - 1) + 2, framed by a zero border.
// Ownership/Lifetime: Test owns all rendered rows.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "font/GlyphTable.hpp"
#include "font/Renderer.hpp"

#include <string>
#include <vector>

using namespace pixart::font;

namespace
{
std::size_t expectedWidth(const std::string &text)
{
    std::size_t width = 0;
    for (char c : text)
    {
        width += GlyphTable::builtin().lookup(static_cast<unsigned char>(c))->width();
    }
    return width + (text.size() - 1) + 2;
}
} // namespace

TEST(Validate, AcceptsSupportedText)
{
    EXPECT_TRUE(validate("Hello World").hasValue());
    EXPECT_TRUE(validate("a").hasValue());
    EXPECT_TRUE(validate("   ").hasValue());
}

TEST(Validate, ReportsFirstUnsupportedCharacter)
{
    auto result = validate("Hello!");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, RenderErrc::CharacterNotFound);
    EXPECT_EQ(result.error().character, U'!');

    auto second = validate("Hi?!");
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error(), RenderError::characterNotFound(U'?'));
}

TEST(Validate, CountsMultiByteCharactersOnce)
{
    auto result = validate("caf\xC3\xA9");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().character, U'\u00E9');

    RenderOptions opts;
    opts.maxLength = 4;
    opts.fallback = FallbackPolicy::Lossy;
    EXPECT_TRUE(validate("caf\xC3\xA9", opts).hasValue());
}

TEST(Validate, EnforcesMaximumLength)
{
    const std::string atLimit(kDefaultMaxLength, 'a');
    EXPECT_TRUE(validate(atLimit).hasValue());

    const std::string overLimit(kDefaultMaxLength + 1, 'a');
    auto result = validate(overLimit);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), RenderError::textTooLong(kDefaultMaxLength + 1, kDefaultMaxLength));
}

TEST(Validate, LengthIsCheckedBeforeCharacters)
{
    RenderOptions opts;
    opts.maxLength = 3;
    auto result = validate("ab!d", opts);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, RenderErrc::TextTooLong);
    EXPECT_EQ(result.error().length, 4u);
    EXPECT_EQ(result.error().limit, 3u);
}

TEST(Validate, EmptyTextIsRejected)
{
    auto result = validate("");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, RenderErrc::EmptyText);

    auto rendered = render("");
    ASSERT_FALSE(rendered);
    EXPECT_EQ(rendered.error().code, RenderErrc::EmptyText);

    auto lossy = renderLossy("");
    ASSERT_FALSE(lossy);
    EXPECT_EQ(lossy.error().code, RenderErrc::EmptyText);
}

TEST(Render, NarrowGlyphsWithSinglePixelSpacing)
{
    auto result = render("ill");
    ASSERT_TRUE(result);
    const std::vector<std::string> expected = {
        "0000000",
        "0101010",
        "0001010",
        "0101010",
        "0101010",
        "0101010",
        "0000000",
    };
    EXPECT_EQ(result.value(), expected);
}

TEST(Render, SingleGlyphIsFramedByBorder)
{
    auto result = render("A");
    ASSERT_TRUE(result);
    const std::vector<std::string> expected = {
        "0000000",
        "0011100",
        "0100010",
        "0111110",
        "0100010",
        "0100010",
        "0000000",
    };
    EXPECT_EQ(result.value(), expected);
}

TEST(Render, RowsShareTheComputedWidth)
{
    for (const std::string text : {"Hello World", "Aa", "il", "mw", "The quick brown fox"})
    {
        auto result = render(text);
        ASSERT_TRUE(result) << text;
        const PixelArt &rows = result.value();
        ASSERT_EQ(rows.size(), kBitmapHeight);
        for (const std::string &row : rows)
        {
            EXPECT_EQ(row.size(), expectedWidth(text)) << text;
            EXPECT_EQ(row.find_first_not_of("01"), std::string::npos);
        }
    }
    EXPECT_EQ(render("Hello World").value().front().size(), 47u);
}

TEST(Render, BorderRowsAndColumnsStayClear)
{
    auto result = render("WMQZ");
    ASSERT_TRUE(result);
    const PixelArt &rows = result.value();
    EXPECT_EQ(rows.front().find('1'), std::string::npos);
    EXPECT_EQ(rows.back().find('1'), std::string::npos);
    for (const std::string &row : rows)
    {
        EXPECT_EQ(row.front(), '0');
        EXPECT_EQ(row.back(), '0');
    }
}

TEST(Render, ColumnsDecodeBackToGlyphs)
{
    const std::string text = "Hello";
    auto result = render(text);
    ASSERT_TRUE(result);
    const PixelArt &rows = result.value();

    std::size_t col = kBorderPixels;
    for (char c : text)
    {
        const GlyphPattern glyph = *GlyphTable::builtin().lookup(static_cast<unsigned char>(c));
        for (std::size_t r = 0; r < kGlyphHeight; ++r)
        {
            for (std::size_t k = 0; k < glyph.width(); ++k)
            {
                EXPECT_EQ(rows[r + kBorderPixels][col + k] == '1', glyph.pixel(r, k))
                    << "char '" << c << "' row " << r << " col " << k;
            }
        }
        col += glyph.width();
        if (col < rows.front().size() - kBorderPixels)
        {
            for (std::size_t r = 0; r < kBitmapHeight; ++r)
            {
                EXPECT_EQ(rows[r][col], '0');
            }
            col += kSpacingColumns;
        }
    }
    EXPECT_EQ(col + kBorderPixels, rows.front().size());
}

TEST(Render, IsDeterministic)
{
    auto first = render("Pixel Art");
    auto second = render("Pixel Art");
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.value(), second.value());
}

TEST(Render, StrictModeRejectsUnsupportedCharacters)
{
    auto result = render("Hi!");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), RenderError::characterNotFound(U'!'));
}

TEST(RenderLossy, SubstitutesSpaceForUnsupportedCharacters)
{
    auto result = renderLossy("Hi!");
    ASSERT_TRUE(result);
    const PixelArt &rows = result.value();
    ASSERT_EQ(rows.size(), kBitmapHeight);
    // H(5) + i(1) + blank(3) + 2 spacing + 2 border
    ASSERT_EQ(rows.front().size(), 13u);
    EXPECT_EQ(rows[1], "0100010100000");
    for (const std::string &row : rows)
    {
        EXPECT_EQ(row.substr(9, 3), "000");
    }
    EXPECT_EQ(renderLossy("Hi ").value(), rows);
}

TEST(RenderLossy, StillEnforcesMaximumLength)
{
    RenderOptions opts;
    opts.maxLength = 2;
    auto result = renderLossy("!!!", opts);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), RenderError::textTooLong(3, 2));
}

TEST(Compose, FollowsFallbackPolicyInOptions)
{
    RenderOptions opts;
    opts.fallback = FallbackPolicy::Lossy;
    EXPECT_TRUE(compose("a-b", opts).hasValue());
    opts.fallback = FallbackPolicy::Strict;
    EXPECT_FALSE(compose("a-b", opts).hasValue());
    // render() is strict regardless of the options it is handed.
    opts.fallback = FallbackPolicy::Lossy;
    EXPECT_FALSE(render("a-b", opts).hasValue());
}

TEST(Measure, MatchesRenderedDimensions)
{
    auto extent = measure("Hello World");
    ASSERT_TRUE(extent);
    EXPECT_EQ(extent.value(), (Extent{47, kBitmapHeight}));

    RenderOptions lossy;
    lossy.fallback = FallbackPolicy::Lossy;
    auto art = compose("x?y", lossy);
    auto measured = measure("x?y", lossy);
    ASSERT_TRUE(art);
    ASSERT_TRUE(measured);
    EXPECT_EQ(measured.value().width, art.value().front().size());

    auto failed = measure("x?y");
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, RenderErrc::CharacterNotFound);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
