#include "core/tools/diamond_tool.h"

#include "core/tools/raster.h"

#include <algorithm>
#include <cstdlib>

namespace ink
{
namespace
{
// `opposite` when the x and y steps point in opposite directions, `same` otherwise.
static void AppendHalfDiagonal(int x0, int y0, int x1, int y1, char32_t opposite, char32_t same,
                               DrawOps& out)
{
    const int sx = (x0 < x1) ? 1 : -1;
    const int sy = (y0 < y1) ? 1 : -1;
    const Cell cell((sx != sy) ? opposite : same);
    for (const GridPoint& p : RasterizeLine(x0, y0, x1, y1))
        out.emplace_back(p.x, p.y, cell);
}
} // namespace

DrawOps BuildDiamondOps(int x1, int y1, int x2, int y2)
{
    const int cx = (x1 + x2) / 2;
    const int cy = (y1 + y2) / 2;
    const int half_w = std::abs(x2 - x1) / 2;
    const int half_h = std::abs(y2 - y1) / 2;

    DrawOps ops;
    if (half_w == 0 && half_h == 0)
    {
        ops.emplace_back(cx, cy, Cell(U'◆'));
        return ops;
    }

    // Top and right share one glyph pair; bottom and left use it swapped.
    AppendHalfDiagonal(cx, cy, cx, cy - half_h, U'/', U'\\', ops); // top
    AppendHalfDiagonal(cx, cy, cx + half_w, cy, U'/', U'\\', ops); // right
    AppendHalfDiagonal(cx, cy, cx, cy + half_h, U'\\', U'/', ops); // bottom
    AppendHalfDiagonal(cx, cy, cx - half_w, cy, U'\\', U'/', ops); // left

    std::stable_sort(ops.begin(), ops.end(), [](const DrawOp& a, const DrawOp& b) {
        return (a.y != b.y) ? (a.y < b.y) : (a.x < b.x);
    });
    ops.erase(std::unique(ops.begin(), ops.end(),
                          [](const DrawOp& a, const DrawOp& b) { return a.x == b.x && a.y == b.y; }),
              ops.end());
    return ops;
}
} // namespace ink
