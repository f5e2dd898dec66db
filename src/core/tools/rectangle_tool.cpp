#include "core/tools/rectangle_tool.h"

#include <algorithm>

namespace ink
{
DrawOps BuildRectangleOps(int x1, int y1, int x2, int y2, BorderStyle style)
{
    const BorderGlyphs g = GetBorderGlyphs(style);
    const int min_x = std::min(x1, x2);
    const int max_x = std::max(x1, x2);
    const int min_y = std::min(y1, y2);
    const int max_y = std::max(y1, y2);

    DrawOps ops;
    if (min_x == max_x && min_y == max_y)
    {
        ops.emplace_back(min_x, min_y, Cell(g.top_left));
        return ops;
    }
    if (min_y == max_y)
    {
        for (int x = min_x; x <= max_x; ++x)
            ops.emplace_back(x, min_y, Cell(g.horizontal));
        return ops;
    }
    if (min_x == max_x)
    {
        for (int y = min_y; y <= max_y; ++y)
            ops.emplace_back(min_x, y, Cell(g.vertical));
        return ops;
    }

    ops.reserve((size_t)(2 * (max_x - min_x + 1) + 2 * (max_y - min_y - 1)));
    ops.emplace_back(min_x, min_y, Cell(g.top_left));
    ops.emplace_back(max_x, min_y, Cell(g.top_right));
    ops.emplace_back(min_x, max_y, Cell(g.bottom_left));
    ops.emplace_back(max_x, max_y, Cell(g.bottom_right));

    for (int x = min_x + 1; x < max_x; ++x)
    {
        ops.emplace_back(x, min_y, Cell(g.horizontal));
        ops.emplace_back(x, max_y, Cell(g.horizontal));
    }
    for (int y = min_y + 1; y < max_y; ++y)
    {
        ops.emplace_back(min_x, y, Cell(g.vertical));
        ops.emplace_back(max_x, y, Cell(g.vertical));
    }
    return ops;
}
} // namespace ink
