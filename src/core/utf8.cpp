#include "core/utf8.h"

#include <cstdint>

namespace ink
{
namespace utf8
{
void Append(char32_t cp, std::string& out)
{
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        cp = 0xFFFD;

    if (cp <= 0x7F)
    {
        out.push_back((char)cp);
        return;
    }
    if (cp <= 0x7FF)
    {
        out.push_back((char)(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
        return;
    }
    if (cp <= 0xFFFF)
    {
        out.push_back((char)(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
        return;
    }
    out.push_back((char)(0xF0 | ((cp >> 18) & 0x07)));
    out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back((char)(0x80 | (cp & 0x3F)));
}

std::string Encode(char32_t cp)
{
    std::string s;
    Append(cp, s);
    return s;
}

namespace
{
// Decodes one sequence starting at bytes[i]. Returns the number of bytes consumed, or 0
// when the sequence is truncated or not well-formed (stray continuation, invalid lead
// byte, overlong form, surrogate or a value past U+10FFFF).
static size_t DecodeAt(std::string_view bytes, size_t i, char32_t& out_cp)
{
    const std::uint8_t c = (std::uint8_t)bytes[i];
    if (c < 0x80)
    {
        out_cp = c;
        return 1;
    }

    size_t length = 0;
    char32_t cp = 0;
    char32_t min_cp = 0;
    if (c >= 0xC2 && c <= 0xDF)
    {
        length = 2;
        cp = c & 0x1F;
        min_cp = 0x80;
    }
    else if (c >= 0xE0 && c <= 0xEF)
    {
        length = 3;
        cp = c & 0x0F;
        min_cp = 0x800;
    }
    else if (c >= 0xF0 && c <= 0xF4)
    {
        length = 4;
        cp = c & 0x07;
        min_cp = 0x10000;
    }
    else
    {
        // 0x80-0xBF continuation, 0xC0/0xC1 always overlong, 0xF5+ beyond U+10FFFF.
        return 0;
    }

    if (i + length > bytes.size())
        return 0;
    for (size_t j = 1; j < length; ++j)
    {
        const std::uint8_t cc = (std::uint8_t)bytes[i + j];
        if ((cc & 0xC0) != 0x80)
            return 0;
        cp = (cp << 6) | (cc & 0x3F);
    }

    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        return 0;
    out_cp = cp;
    return length;
}
} // namespace

void DecodeBestEffort(std::string_view bytes, std::vector<char32_t>& out_codepoints)
{
    out_codepoints.clear();

    size_t i = 0;
    if (bytes.size() >= 3 && (std::uint8_t)bytes[0] == 0xEF && (std::uint8_t)bytes[1] == 0xBB &&
        (std::uint8_t)bytes[2] == 0xBF)
        i = 3;

    while (i < bytes.size())
    {
        char32_t cp = 0;
        const size_t used = DecodeAt(bytes, i, cp);
        if (used == 0)
        {
            // Resynchronize on the next byte.
            ++i;
            continue;
        }
        out_codepoints.push_back(cp);
        i += used;
    }
}

bool DecodeSingle(std::string_view bytes, char32_t& out_cp)
{
    std::vector<char32_t> cps;
    DecodeBestEffort(bytes, cps);
    if (cps.size() != 1)
        return false;
    out_cp = cps[0];
    return true;
}
} // namespace utf8
} // namespace ink
