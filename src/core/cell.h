// Character cell: the atomic unit stored by ink::Grid.

#pragma once

#include <cstdint>

#include <unicode/uchar.h>

namespace ink
{
// Per-cell style bitmask.
using CellStyle = std::uint8_t;
enum CellStyleBit : CellStyle
{
    Style_None      = 0,
    Style_Bold      = 1u << 0,
    Style_Italic    = 1u << 1,
    Style_Underline = 1u << 2,
    Style_Highlight = 1u << 3,
};

// Unicode White_Space property.
inline bool IsWhitespace(char32_t cp)
{
    return u_isUWhiteSpace((UChar32)cp) != 0;
}

struct Cell
{
    char32_t ch = U' ';
    CellStyle style = Style_None;

    Cell() = default;
    Cell(char32_t c) : ch(c) {}
    Cell(char32_t c, CellStyle s) : ch(c), style(s) {}

    // "Empty" is the default blank; "visible" is anything that draws ink.
    bool IsEmpty() const { return ch == U' '; }
    bool IsVisible() const { return !IsWhitespace(ch); }

    bool HasStyle(CellStyleBit bit) const { return (style & bit) != 0; }

    void Clear()
    {
        ch = U' ';
        style = Style_None;
    }

    void SetChar(char32_t c) { ch = c; }

    bool operator==(const Cell& o) const { return ch == o.ch && style == o.style; }
    bool operator!=(const Cell& o) const { return !(*this == o); }
};
} // namespace ink
