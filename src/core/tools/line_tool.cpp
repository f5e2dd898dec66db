#include "core/tools/line_tool.h"

#include "core/tools/raster.h"

namespace ink
{
char32_t LineGlyph(int dx, int dy)
{
    if (dx == 0)
        return U'│';
    if (dy == 0)
        return U'─';
    // Screen y grows downwards.
    return (Sign(dx) == Sign(dy)) ? U'\\' : U'/';
}

DrawOps BuildLineOps(int x1, int y1, int x2, int y2)
{
    const Cell cell(LineGlyph(x2 - x1, y2 - y1));
    DrawOps ops;
    for (const GridPoint& p : RasterizeLine(x1, y1, x2, y2))
        ops.emplace_back(p.x, p.y, cell);
    return ops;
}
} // namespace ink
