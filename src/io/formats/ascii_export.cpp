#include "io/formats/ascii_export.h"

#include "core/utf8.h"

#include <algorithm>
#include <cstdio>
#include <fstream>

namespace formats
{
namespace ascii
{
namespace
{
static char32_t ExportableChar(const ink::Cell& c)
{
    return (c.ch < 0x20) ? U' ' : c.ch;
}

static void TrimTrailingSpaces(std::u32string& line)
{
    while (!line.empty() && line.back() == U' ')
        line.pop_back();
}

// Renders row `y` over columns [x0, x1], applying numbering, trimming and width limit.
static std::string RenderRow(const ink::Grid& grid, int y, int x0, int x1, bool trim, const ExportOptions& options)
{
    std::u32string line;
    if (options.line_numbers)
    {
        char prefix[32];
        std::snprintf(prefix, sizeof(prefix), "%4d | ", y + 1);
        for (const char* p = prefix; *p; ++p)
            line.push_back((char32_t)(unsigned char)*p);
    }
    for (int x = x0; x <= x1; ++x)
    {
        const std::optional<ink::Cell> c = grid.Get(x, y);
        line.push_back(c ? ExportableChar(*c) : U' ');
    }

    if (trim)
        TrimTrailingSpaces(line);
    if (options.max_width > 0 && line.size() > options.max_width)
        line.resize(options.max_width);

    std::string out;
    out.reserve(line.size());
    for (char32_t cp : line)
        ink::utf8::Append(cp, out);
    return out;
}
} // namespace

std::optional<ink::CellBounds> FindContentBounds(const ink::Grid& grid)
{
    bool found = false;
    ink::CellBounds b;
    grid.ForEachCell([&](int x, int y, const ink::Cell& c) {
        if (!c.IsVisible())
            return;
        if (!found)
        {
            b.min_x = b.max_x = x;
            b.min_y = b.max_y = y;
            found = true;
            return;
        }
        b.min_x = std::min(b.min_x, x);
        b.min_y = std::min(b.min_y, y);
        b.max_x = std::max(b.max_x, x);
        b.max_y = std::max(b.max_y, y);
    });
    if (!found)
        return std::nullopt;
    return b;
}

std::string ExportGrid(const ink::Grid& grid, const ExportOptions& options)
{
    std::string out;
    if (grid.GetWidth() <= 0 || grid.GetHeight() <= 0)
        return out;

    ink::CellBounds b;
    if (options.trim_borders)
    {
        const std::optional<ink::CellBounds> content = FindContentBounds(grid);
        if (!content)
            return out;
        b = *content;
    }
    else
    {
        b.min_x = 0;
        b.min_y = 0;
        b.max_x = grid.GetWidth() - 1;
        b.max_y = grid.GetHeight() - 1;
    }

    for (int y = b.min_y; y <= b.max_y; ++y)
    {
        if (y != b.min_y)
            out.push_back('\n');
        out += RenderRow(grid, y, b.min_x, b.max_x, options.trim_borders, options);
    }
    return out;
}

std::string ExportRegion(const ink::Grid& grid, int x1, int y1, int x2, int y2)
{
    std::string out;
    const int min_x = std::max(std::min(x1, x2), 0);
    const int min_y = std::max(std::min(y1, y2), 0);
    const int max_x = std::min(std::max(x1, x2), grid.GetWidth() - 1);
    const int max_y = std::min(std::max(y1, y2), grid.GetHeight() - 1);
    if (min_x > max_x || min_y > max_y)
        return out;

    const ExportOptions plain;
    for (int y = min_y; y <= max_y; ++y)
    {
        if (y != min_y)
            out.push_back('\n');
        out += RenderRow(grid, y, min_x, max_x, true, plain);
    }
    return out;
}

size_t CountContent(const ink::Grid& grid)
{
    return (size_t)std::count_if(grid.Cells().begin(), grid.Cells().end(),
                                 [](const ink::Cell& c) { return c.IsVisible(); });
}

bool ExportGridToFile(const std::string& path,
                      const ink::Grid& grid,
                      std::string& err,
                      const ExportOptions& options)
{
    err.clear();
    const std::string text = ExportGrid(grid, options);

    std::ofstream out(path, std::ios::binary);
    if (!out)
    {
        err = "Failed to open file for writing: " + path;
        return false;
    }
    if (!text.empty())
        out.write(text.data(), (std::streamsize)text.size());
    if (!out)
    {
        err = "Failed to write file contents: " + path;
        return false;
    }
    return true;
}
} // namespace ascii
} // namespace formats
