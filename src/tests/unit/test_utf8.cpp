//===----------------------------------------------------------------------===//
//
// Part of the Pixart project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_utf8.cpp
// Purpose: Verify UTF-8 decoding of input text and encoding for messages.
// Key invariants: Malformed sequences decode to U+FFFD per byte.
// Ownership/Lifetime: Test owns decoded strings.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "support/utf8.hpp"

using pixart::support::decodeUtf8;
using pixart::support::encodeUtf8;
using pixart::support::kReplacementChar;

TEST(Utf8, DecodesAsciiAndMultiByte)
{
    EXPECT_EQ(decodeUtf8("Hi"), U"Hi");
    EXPECT_EQ(decodeUtf8("caf\xC3\xA9"), U"caf\u00E9");
    EXPECT_EQ(decodeUtf8("\xE4\xBD\xA0"), U"\u4F60");
    EXPECT_EQ(decodeUtf8("\xF0\x9F\x98\x80"), U"\U0001F600");
    EXPECT_TRUE(decodeUtf8("").empty());
}

TEST(Utf8, OverlongFormBecomesReplacementPerByte)
{
    const std::u32string s = decodeUtf8("\xC0\xAF");
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s[0], kReplacementChar);
    EXPECT_EQ(s[1], kReplacementChar);
}

TEST(Utf8, SurrogatesAndOutOfRangeAreRejected)
{
    EXPECT_EQ(decodeUtf8("\xED\xA0\x80"), std::u32string(3, kReplacementChar));
    EXPECT_EQ(decodeUtf8("\xF4\x90\x80\x80"), std::u32string(4, kReplacementChar));
}

TEST(Utf8, TruncatedSequenceKeepsFollowingText)
{
    EXPECT_EQ(decodeUtf8("\xE4" "A"), std::u32string(U"\uFFFDA"));
    EXPECT_EQ(decodeUtf8("ab\xC3"), std::u32string(U"ab\uFFFD"));
    EXPECT_EQ(decodeUtf8("\x80x"), std::u32string(U"\uFFFDx"));
}

TEST(Utf8, EncodeRoundTripsValidCodePoints)
{
    EXPECT_EQ(encodeUtf8(U'!'), "!");
    EXPECT_EQ(encodeUtf8(U'\u00E9'), "\xC3\xA9");
    EXPECT_EQ(encodeUtf8(U'\u4F60'), "\xE4\xBD\xA0");
    EXPECT_EQ(encodeUtf8(U'\U0001F600'), "\xF0\x9F\x98\x80");
    EXPECT_EQ(encodeUtf8(0xD800), "\xEF\xBF\xBD");
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
