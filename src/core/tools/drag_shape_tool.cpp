#include "core/tools/drag_shape_tool.h"

namespace ink
{
ToolResult DragShapeTool::OnPointerDown(int x, int y, const ToolContext& ctx)
{
    ClampToGrid(x, y, ctx);
    m_dragging = true;
    m_start_x = x;
    m_start_y = y;
    return {};
}

ToolResult DragShapeTool::OnPointerMove(int x, int y, const ToolContext& ctx)
{
    ToolResult r;
    if (!m_dragging)
        return r;
    ClampToGrid(x, y, ctx);
    r.SetOps(BuildShape(m_start_x, m_start_y, x, y, ctx));
    return r;
}

ToolResult DragShapeTool::OnPointerUp(int x, int y, const ToolContext& ctx)
{
    ToolResult r;
    if (!m_dragging)
        return r;
    ClampToGrid(x, y, ctx);
    r.SetOps(BuildShape(m_start_x, m_start_y, x, y, ctx));
    r.Finish();
    Reset();
    return r;
}

void DragShapeTool::Reset()
{
    m_dragging = false;
    m_start_x = 0;
    m_start_y = 0;
}
} // namespace ink
