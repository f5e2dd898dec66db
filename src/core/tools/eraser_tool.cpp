#include "core/tools/eraser_tool.h"

#include "core/tools/raster.h"

#include <utility>

namespace ink
{
DrawOps BuildErasePatch(int x, int y, int size, const ToolContext& ctx)
{
    if (size < 1)
        size = 1;
    DrawOps ops;
    for (int dy = -size + 1; dy < size; ++dy)
    {
        for (int dx = -size + 1; dx < size; ++dx)
        {
            const int px = x + dx;
            const int py = y + dy;
            if (px < 0 || py < 0 || px >= ctx.grid_width || py >= ctx.grid_height)
                continue;
            ops.emplace_back(px, py, Cell{});
        }
    }
    return ops;
}

ToolResult EraserTool::OnPointerDown(int x, int y, const ToolContext& ctx)
{
    ClampToGrid(x, y, ctx);
    m_erasing = true;
    m_last_x = x;
    m_last_y = y;
    m_stroke.clear();

    ToolResult r;
    DrawOps patch = BuildErasePatch(x, y, m_size, ctx);
    m_stroke = patch;
    r.SetOps(std::move(patch));
    return r;
}

ToolResult EraserTool::OnPointerMove(int x, int y, const ToolContext& ctx)
{
    ToolResult r;
    if (!m_erasing)
        return r;
    ClampToGrid(x, y, ctx);
    if (x == m_last_x && y == m_last_y)
        return r;

    DrawOps segment;
    for (const GridPoint& p : RasterizeLine(m_last_x, m_last_y, x, y))
    {
        const DrawOps patch = BuildErasePatch(p.x, p.y, m_size, ctx);
        segment.insert(segment.end(), patch.begin(), patch.end());
    }
    m_stroke.insert(m_stroke.end(), segment.begin(), segment.end());
    m_last_x = x;
    m_last_y = y;

    r.SetOps(std::move(segment));
    return r;
}

ToolResult EraserTool::OnPointerUp(int x, int y, const ToolContext& ctx)
{
    (void)x;
    (void)y;
    (void)ctx;

    ToolResult r;
    if (!m_erasing)
        return r;
    r.SetOps(std::move(m_stroke));
    r.Finish();
    Reset();
    return r;
}

void EraserTool::Reset()
{
    m_erasing = false;
    m_last_x = 0;
    m_last_y = 0;
    m_stroke.clear();
}
} // namespace ink
