#include "core/tools/freehand_tool.h"

#include "core/tools/raster.h"

#include <utility>

namespace ink
{
ToolResult FreehandTool::OnPointerDown(int x, int y, const ToolContext& ctx)
{
    ClampToGrid(x, y, ctx);
    m_drawing = true;
    m_last_x = x;
    m_last_y = y;
    m_stroke.clear();

    ToolResult r;
    const DrawOp op(x, y, Cell(m_glyph));
    m_stroke.push_back(op);
    r.AddOp(op);
    return r;
}

ToolResult FreehandTool::OnPointerMove(int x, int y, const ToolContext& ctx)
{
    ToolResult r;
    if (!m_drawing)
        return r;
    ClampToGrid(x, y, ctx);
    if (x == m_last_x && y == m_last_y)
        return r;

    DrawOps segment;
    for (const GridPoint& p : RasterizeLine(m_last_x, m_last_y, x, y))
        segment.emplace_back(p.x, p.y, Cell(m_glyph));
    m_stroke.insert(m_stroke.end(), segment.begin(), segment.end());
    m_last_x = x;
    m_last_y = y;

    r.SetOps(std::move(segment));
    return r;
}

ToolResult FreehandTool::OnPointerUp(int x, int y, const ToolContext& ctx)
{
    (void)x;
    (void)y;
    (void)ctx;

    ToolResult r;
    if (!m_drawing)
        return r;
    r.SetOps(std::move(m_stroke));
    r.Finish();
    Reset();
    return r;
}

void FreehandTool::Reset()
{
    m_drawing = false;
    m_last_x = 0;
    m_last_y = 0;
    m_stroke.clear();
}
} // namespace ink
