#include "core/tools/select_tool.h"

namespace ink
{
ToolResult SelectTool::OnPointerDown(int x, int y, const ToolContext& ctx)
{
    ClampToGrid(x, y, ctx);
    m_anchor_x = x;
    m_anchor_y = y;

    if (m_selection && m_selection->Contains(x, y))
    {
        m_moving = true;
        m_selecting = false;
        return {};
    }

    m_selecting = true;
    m_moving = false;
    m_selection.reset();
    return {};
}

ToolResult SelectTool::OnPointerMove(int x, int y, const ToolContext& ctx)
{
    if (m_selecting)
    {
        ClampToGrid(x, y, ctx);
        m_selection = Selection(m_anchor_x, m_anchor_y, x, y);
    }
    return {};
}

ToolResult SelectTool::OnPointerUp(int x, int y, const ToolContext& ctx)
{
    ClampToGrid(x, y, ctx);

    ToolResult r;
    if (m_selecting)
    {
        m_selecting = false;
        m_selection = Selection(m_anchor_x, m_anchor_y, x, y);
        return r;
    }

    if (m_moving)
    {
        m_moving = false;
        const int dx = x - m_anchor_x;
        const int dy = y - m_anchor_y;
        if (m_selection && (dx != 0 || dy != 0))
        {
            r.move = SelectionMove{*m_selection, dx, dy};
            m_selection->Translate(dx, dy);
            r.Finish();
        }
    }
    return r;
}

void SelectTool::Reset()
{
    m_selection.reset();
    m_selecting = false;
    m_moving = false;
    m_anchor_x = 0;
    m_anchor_y = 0;
}

void SelectTool::SetSelection(const std::optional<Selection>& selection)
{
    m_selection = selection;
    m_selecting = false;
    m_moving = false;
}
} // namespace ink
