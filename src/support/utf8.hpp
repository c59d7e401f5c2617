// File: src/support/utf8.hpp
// Purpose: UTF-8 decoding and encoding helpers for user-supplied text.
// Key invariants: Malformed input never throws; each offending byte decodes
//                 to U+FFFD.
// Ownership/Lifetime: Functions return owned strings.
// Links: https://www.unicode.org/versions/Unicode15.0.0/ch03.pdf (Table 3-7)
#pragma once

#include <string>
#include <string_view>

namespace pixart::support
{

/// @brief Replacement character substituted for malformed sequences.
inline constexpr char32_t kReplacementChar = 0xFFFD;

/// @brief Decode UTF-8 bytes into code points.
/// @details Overlong forms, surrogates, values above U+10FFFF and truncated
///          sequences produce one U+FFFD per consumed byte.
std::u32string decodeUtf8(std::string_view bytes);

/// @brief Encode a single code point as UTF-8.
/// @details Invalid code points are encoded as U+FFFD.
std::string encodeUtf8(char32_t cp);

} // namespace pixart::support
