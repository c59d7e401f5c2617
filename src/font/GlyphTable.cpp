//===----------------------------------------------------------------------===//
//
// Part of the Pixart project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Holds the built-in variable-width font and the lookup over it.  Glyphs are
// authored by hand: narrow letters (i, l, j, f, k, r, t, I) are 1-3 columns,
// most lowercase letters are 4 and most uppercase letters plus m/w are 5.
// The table is laid out as A-Z, a-z, space so a character maps to its slot
// with simple arithmetic and no runtime construction is needed.
//
//===----------------------------------------------------------------------===//

#include "font/GlyphTable.hpp"

#include <array>

namespace pixart::font
{

namespace
{
constexpr std::size_t kUpperBase = 0;
constexpr std::size_t kLowerBase = 26;
constexpr std::size_t kSpaceIndex = 52;
constexpr std::size_t kGlyphCount = 53;

// clang-format off
constexpr std::array<GlyphPattern, kGlyphCount> kGlyphs{{
    {5, {0b01110, 0b10001, 0b11111, 0b10001, 0b10001}}, // A
    {5, {0b11110, 0b10001, 0b11110, 0b10001, 0b11110}}, // B
    {5, {0b01110, 0b10001, 0b10000, 0b10001, 0b01110}}, // C
    {5, {0b11110, 0b10001, 0b10001, 0b10001, 0b11110}}, // D
    {5, {0b11111, 0b10000, 0b11110, 0b10000, 0b11111}}, // E
    {5, {0b11111, 0b10000, 0b11110, 0b10000, 0b10000}}, // F
    {5, {0b01110, 0b10000, 0b10111, 0b10001, 0b01110}}, // G
    {5, {0b10001, 0b10001, 0b11111, 0b10001, 0b10001}}, // H
    {3, {0b111, 0b010, 0b010, 0b010, 0b111}}, // I
    {5, {0b11111, 0b00010, 0b00010, 0b10010, 0b01100}}, // J
    {5, {0b10010, 0b10100, 0b11000, 0b10100, 0b10010}}, // K
    {5, {0b10000, 0b10000, 0b10000, 0b10000, 0b11111}}, // L
    {5, {0b10001, 0b11011, 0b10101, 0b10001, 0b10001}}, // M
    {5, {0b10001, 0b11001, 0b10101, 0b10011, 0b10001}}, // N
    {5, {0b01110, 0b10001, 0b10001, 0b10001, 0b01110}}, // O
    {5, {0b11110, 0b10001, 0b11110, 0b10000, 0b10000}}, // P
    {5, {0b01110, 0b10001, 0b10101, 0b10011, 0b01111}}, // Q
    {5, {0b11110, 0b10001, 0b11110, 0b10100, 0b10010}}, // R
    {5, {0b01110, 0b10000, 0b01110, 0b00001, 0b01110}}, // S
    {5, {0b11111, 0b00100, 0b00100, 0b00100, 0b00100}}, // T
    {5, {0b10001, 0b10001, 0b10001, 0b10001, 0b01110}}, // U
    {5, {0b10001, 0b10001, 0b10001, 0b01010, 0b00100}}, // V
    {5, {0b10001, 0b10001, 0b10101, 0b11011, 0b10001}}, // W
    {5, {0b10001, 0b01010, 0b00100, 0b01010, 0b10001}}, // X
    {5, {0b10001, 0b01010, 0b00100, 0b00100, 0b00100}}, // Y
    {5, {0b11111, 0b00010, 0b00100, 0b01000, 0b11111}}, // Z

    {4, {0b0000, 0b0110, 0b0001, 0b0111, 0b0111}}, // a
    {4, {0b1000, 0b1000, 0b1110, 0b1001, 0b1110}}, // b
    {4, {0b0000, 0b0110, 0b1000, 0b1000, 0b0110}}, // c
    {4, {0b0001, 0b0001, 0b0111, 0b1001, 0b0111}}, // d
    {4, {0b0000, 0b0110, 0b1111, 0b1000, 0b0110}}, // e
    {3, {0b011, 0b010, 0b110, 0b010, 0b010}}, // f
    {4, {0b0000, 0b0111, 0b1001, 0b0111, 0b0001}}, // g
    {4, {0b1000, 0b1000, 0b1110, 0b1001, 0b1001}}, // h
    {1, {0b1, 0b0, 0b1, 0b1, 0b1}}, // i
    {2, {0b01, 0b00, 0b01, 0b01, 0b10}}, // j
    {3, {0b100, 0b101, 0b110, 0b110, 0b101}}, // k
    {1, {0b1, 0b1, 0b1, 0b1, 0b1}}, // l
    {5, {0b00000, 0b11010, 0b10101, 0b10101, 0b10101}}, // m
    {4, {0b0000, 0b1110, 0b1001, 0b1001, 0b1001}}, // n
    {4, {0b0000, 0b0110, 0b1001, 0b1001, 0b0110}}, // o
    {4, {0b0000, 0b1110, 0b1001, 0b1110, 0b1000}}, // p
    {4, {0b0000, 0b0111, 0b1001, 0b0111, 0b0001}}, // q
    {3, {0b000, 0b101, 0b110, 0b100, 0b100}}, // r
    {4, {0b0000, 0b0110, 0b0100, 0b0010, 0b1100}}, // s
    {3, {0b010, 0b111, 0b010, 0b010, 0b001}}, // t
    {4, {0b0000, 0b1001, 0b1001, 0b1001, 0b0111}}, // u
    {4, {0b0000, 0b1001, 0b1001, 0b0110, 0b0010}}, // v
    {5, {0b00000, 0b10001, 0b10101, 0b10101, 0b01010}}, // w
    {4, {0b0000, 0b1001, 0b0110, 0b0010, 0b1001}}, // x
    {4, {0b0000, 0b1001, 0b1001, 0b0111, 0b0001}}, // y
    {4, {0b0000, 0b1111, 0b0010, 0b0100, 0b1111}}, // z

    {3, {0b000, 0b000, 0b000, 0b000, 0b000}}, // space
}};
// clang-format on

constexpr bool allWellFormed()
{
    for (const GlyphPattern &g : kGlyphs)
    {
        if (!g.wellFormed())
        {
            return false;
        }
    }
    return true;
}

static_assert(allWellFormed(), "built-in glyph rows must fit their width");

/// @brief Table slot for @p ch, or kGlyphCount when unsupported.
constexpr std::size_t slotFor(char32_t ch)
{
    if (ch >= U'A' && ch <= U'Z')
    {
        return kUpperBase + (ch - U'A');
    }
    if (ch >= U'a' && ch <= U'z')
    {
        return kLowerBase + (ch - U'a');
    }
    if (ch == U' ')
    {
        return kSpaceIndex;
    }
    return kGlyphCount;
}
} // namespace

const GlyphTable &GlyphTable::builtin()
{
    static const GlyphTable table;
    return table;
}

std::optional<GlyphPattern> GlyphTable::lookup(char32_t ch) const
{
    const std::size_t slot = slotFor(ch);
    if (slot == kGlyphCount)
    {
        return std::nullopt;
    }
    return kGlyphs[slot];
}

bool GlyphTable::supports(char32_t ch) const
{
    return slotFor(ch) != kGlyphCount;
}

const GlyphPattern &GlyphTable::space() const
{
    return kGlyphs[kSpaceIndex];
}

std::string GlyphTable::supportedCharacters() const
{
    std::string chars;
    chars.reserve(kGlyphCount);
    for (char c = 'A'; c <= 'Z'; ++c)
    {
        chars.push_back(c);
    }
    for (char c = 'a'; c <= 'z'; ++c)
    {
        chars.push_back(c);
    }
    chars.push_back(' ');
    return chars;
}

std::size_t GlyphTable::size() const
{
    return kGlyphs.size();
}

} // namespace pixart::font
