//===----------------------------------------------------------------------===//
//
// Part of the Pixart project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements UTF-8 decoding for input text.  Rendering counts and reports
// characters, not bytes, so a multi-byte character such as U+00E9 is one
// character for length limits and error messages.
//
//===----------------------------------------------------------------------===//

#include "support/utf8.hpp"

#include <cstdint>

namespace pixart::support
{

namespace
{
bool isContinuation(unsigned char b)
{
    return (b & 0xC0) == 0x80;
}

/// @brief Sequence length implied by a lead byte, or 0 for an invalid lead.
std::size_t sequenceLength(unsigned char lead)
{
    if (lead < 0x80)
        return 1;
    if ((lead & 0xE0) == 0xC0)
        return 2;
    if ((lead & 0xF0) == 0xE0)
        return 3;
    if ((lead & 0xF8) == 0xF0)
        return 4;
    return 0;
}
} // namespace

std::u32string decodeUtf8(std::string_view bytes)
{
    std::u32string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    while (i < bytes.size())
    {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        const std::size_t len = sequenceLength(lead);
        if (len == 1)
        {
            out.push_back(lead);
            ++i;
            continue;
        }
        if (len == 0 || i + len > bytes.size())
        {
            out.push_back(kReplacementChar);
            ++i;
            continue;
        }

        bool wellFormed = true;
        for (std::size_t k = 1; k < len; ++k)
        {
            if (!isContinuation(static_cast<unsigned char>(bytes[i + k])))
            {
                wellFormed = false;
                break;
            }
        }
        if (!wellFormed)
        {
            out.push_back(kReplacementChar);
            ++i;
            continue;
        }

        std::uint32_t cp = lead & (0x7F >> len);
        for (std::size_t k = 1; k < len; ++k)
        {
            cp = (cp << 6) | (static_cast<unsigned char>(bytes[i + k]) & 0x3F);
        }

        static constexpr std::uint32_t kMinForLength[] = {0, 0, 0x80, 0x800, 0x10000};
        const bool overlong = cp < kMinForLength[len];
        const bool surrogate = cp >= 0xD800 && cp <= 0xDFFF;
        if (overlong || surrogate || cp > 0x10FFFF)
        {
            out.append(len, kReplacementChar);
        }
        else
        {
            out.push_back(static_cast<char32_t>(cp));
        }
        i += len;
    }
    return out;
}

std::string encodeUtf8(char32_t cp)
{
    if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
    {
        cp = kReplacementChar;
    }
    std::string out;
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return out;
}

} // namespace pixart::support
