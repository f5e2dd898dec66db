#include "core/tools/raster.h"

#include <algorithm>
#include <cstdlib>

namespace ink
{
static void BresenhamWalk(int x0, int y0, int x1, int y1, std::vector<GridPoint>& out)
{
    const int dx = std::abs(x1 - x0);
    const int dy = std::abs(y1 - y0);
    const int sx = (x0 < x1) ? 1 : -1;
    const int sy = (y0 < y1) ? 1 : -1;
    int err = dx - dy;

    int x = x0;
    int y = y0;
    for (;;)
    {
        out.push_back({x, y});
        if (x == x1 && y == y1)
            break;
        const int e2 = 2 * err;
        if (e2 > -dy)
        {
            err -= dy;
            x += sx;
        }
        if (e2 < dx)
        {
            err += dx;
            y += sy;
        }
    }
}

std::vector<GridPoint> RasterizeLine(int x1, int y1, int x2, int y2)
{
    std::vector<GridPoint> pts;
    pts.reserve((size_t)std::max(std::abs(x2 - x1), std::abs(y2 - y1)) + 1);

    const bool reversed = (x2 < x1) || (x2 == x1 && y2 < y1);
    if (!reversed)
    {
        BresenhamWalk(x1, y1, x2, y2, pts);
        return pts;
    }
    BresenhamWalk(x2, y2, x1, y1, pts);
    std::reverse(pts.begin(), pts.end());
    return pts;
}
} // namespace ink
