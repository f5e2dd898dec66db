#include "core/tools/arrow_tool.h"

#include "core/tools/raster.h"

#include <algorithm>
#include <cstdlib>

namespace ink
{
int ArrowSlopeRatio(int dx, int dy)
{
    return std::abs(dx) * 10 / std::max(std::abs(dy), 1);
}

char32_t ArrowBodyGlyph(int dx, int dy)
{
    if (dx == 0)
        return U'│';
    if (dy == 0)
        return U'─';

    const int ratio = ArrowSlopeRatio(dx, dy);
    if (ratio < 3)
        return U'│';
    if (ratio > 7)
        return U'─';
    return (Sign(dx) == Sign(dy)) ? U'\\' : U'/';
}

char32_t ArrowHeadGlyph(int dx, int dy)
{
    if (dx == 0 && dy == 0)
        return U'•';
    if (dx == 0)
        return (dy > 0) ? U'▼' : U'▲';
    if (dy == 0)
        return (dx > 0) ? U'►' : U'◄';

    const int ratio = ArrowSlopeRatio(dx, dy);
    if (ratio < 3)
        return (Sign(dx) == Sign(dy)) ? U'╲' : U'╱';
    if (ratio > 7)
        return (dx > 0) ? U'►' : U'◄';
    return (dx > 0) ? U'>' : U'<';
}

DrawOps BuildArrowOps(int x1, int y1, int x2, int y2)
{
    const int total_dx = x2 - x1;
    const int total_dy = y2 - y1;

    DrawOps ops;
    for (const GridPoint& p : RasterizeLine(x1, y1, x2, y2))
    {
        int dx = x2 - p.x;
        int dy = y2 - p.y;
        if (dx == 0 && dy == 0)
        {
            dx = total_dx;
            dy = total_dy;
        }
        ops.emplace_back(p.x, p.y, Cell(ArrowBodyGlyph(dx, dy)));
    }
    ops.emplace_back(x2, y2, Cell(ArrowHeadGlyph(total_dx, total_dy)));
    return ops;
}
} // namespace ink
