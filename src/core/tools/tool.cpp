#include "core/tools/tool.h"

#include "core/tools/arrow_tool.h"
#include "core/tools/diamond_tool.h"
#include "core/tools/eraser_tool.h"
#include "core/tools/freehand_tool.h"
#include "core/tools/line_tool.h"
#include "core/tools/rectangle_tool.h"
#include "core/tools/select_tool.h"
#include "core/tools/text_tool.h"

#include <cctype>
#include <string>

namespace ink
{
static std::string ToLowerAscii(std::string_view s)
{
    std::string out(s);
    for (char& c : out)
        c = (char)std::tolower((unsigned char)c);
    return out;
}

// ---------------------------------------------------------------------------
// Tool ids
// ---------------------------------------------------------------------------

const std::vector<ToolId>& AllToolIds()
{
    static const std::vector<ToolId> ids = {
        ToolId::Rectangle, ToolId::Line,     ToolId::Arrow,  ToolId::Diamond,
        ToolId::Text,      ToolId::Freehand, ToolId::Select, ToolId::Eraser,
    };
    return ids;
}

std::string_view ToolName(ToolId id)
{
    switch (id)
    {
        case ToolId::Rectangle: return "Rectangle";
        case ToolId::Line:      return "Line";
        case ToolId::Arrow:     return "Arrow";
        case ToolId::Diamond:   return "Diamond";
        case ToolId::Text:      return "Text";
        case ToolId::Freehand:  return "Freehand";
        case ToolId::Select:    return "Select";
        case ToolId::Eraser:    return "Eraser";
    }
    return "Rectangle";
}

char ToolShortcut(ToolId id)
{
    switch (id)
    {
        case ToolId::Rectangle: return 'R';
        case ToolId::Line:      return 'L';
        case ToolId::Arrow:     return 'A';
        case ToolId::Diamond:   return 'D';
        case ToolId::Text:      return 'T';
        case ToolId::Freehand:  return 'F';
        case ToolId::Select:    return 'V';
        case ToolId::Eraser:    return 'E';
    }
    return 'R';
}

std::optional<ToolId> ToolIdFromShortcut(char32_t key)
{
    if (key >= U'a' && key <= U'z')
        key = key - U'a' + U'A';
    for (ToolId id : AllToolIds())
    {
        if ((char32_t)ToolShortcut(id) == key)
            return id;
    }
    return std::nullopt;
}

std::optional<ToolId> ParseToolId(std::string_view name)
{
    const std::string n = ToLowerAscii(name);
    if (n.empty())
        return std::nullopt;
    if (n == "rect")
        return ToolId::Rectangle;
    if (n.size() == 1)
        return ToolIdFromShortcut((char32_t)(unsigned char)n[0]);
    for (ToolId id : AllToolIds())
    {
        if (ToLowerAscii(ToolName(id)) == n)
            return id;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Border styles
// ---------------------------------------------------------------------------

BorderGlyphs GetBorderGlyphs(BorderStyle style)
{
    BorderGlyphs g;
    switch (style)
    {
        case BorderStyle::Single:
            break;
        case BorderStyle::Double:
            g = {U'╔', U'╗', U'╚', U'╝', U'═', U'║'};
            break;
        case BorderStyle::Heavy:
            g = {U'┏', U'┓', U'┗', U'┛', U'━', U'┃'};
            break;
        case BorderStyle::Rounded:
            g = {U'╭', U'╮', U'╰', U'╯', U'─', U'│'};
            break;
        case BorderStyle::Ascii:
            g = {U'+', U'+', U'+', U'+', U'-', U'|'};
            break;
        case BorderStyle::Dotted:
            g = {U'*', U'*', U'*', U'*', U'*', U'*'};
            break;
    }
    return g;
}

std::string_view BorderStyleName(BorderStyle style)
{
    switch (style)
    {
        case BorderStyle::Single:  return "single";
        case BorderStyle::Double:  return "double";
        case BorderStyle::Heavy:   return "heavy";
        case BorderStyle::Rounded: return "rounded";
        case BorderStyle::Ascii:   return "ascii";
        case BorderStyle::Dotted:  return "dotted";
    }
    return "single";
}

std::optional<BorderStyle> ParseBorderStyle(std::string_view name)
{
    const std::string n = ToLowerAscii(name);
    static const BorderStyle kAll[] = {
        BorderStyle::Single, BorderStyle::Double, BorderStyle::Heavy,
        BorderStyle::Rounded, BorderStyle::Ascii, BorderStyle::Dotted,
    };
    for (BorderStyle s : kAll)
    {
        if (BorderStyleName(s) == n)
            return s;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Factory
// ---------------------------------------------------------------------------

std::unique_ptr<Tool> MakeTool(ToolId id, const ToolOptions& options)
{
    switch (id)
    {
        case ToolId::Rectangle: return std::make_unique<RectangleTool>();
        case ToolId::Line:      return std::make_unique<LineTool>();
        case ToolId::Arrow:     return std::make_unique<ArrowTool>();
        case ToolId::Diamond:   return std::make_unique<DiamondTool>();
        case ToolId::Text:      return std::make_unique<TextTool>();
        case ToolId::Freehand:  return std::make_unique<FreehandTool>(options.freehand_glyph);
        case ToolId::Select:    return std::make_unique<SelectTool>();
        case ToolId::Eraser:    return std::make_unique<EraserTool>(options.eraser_size);
    }
    return std::make_unique<RectangleTool>();
}
} // namespace ink
