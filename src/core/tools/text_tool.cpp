#include "core/tools/text_tool.h"

#include <utility>

namespace ink
{
static bool IsControlKey(char32_t key)
{
    return key < 0x20 || (key >= 0x7F && key <= 0x9F);
}

std::optional<GridPoint> TextTool::GetCursor() const
{
    if (!m_has_cursor)
        return std::nullopt;
    return GridPoint{m_cursor_x, m_cursor_y};
}

ToolResult TextTool::Emit(int x, int y, char32_t ch)
{
    const DrawOp op(x, y, Cell(ch));
    m_staged.push_back(op);

    ToolResult r;
    r.AddOp(op);
    r.Finish();
    return r;
}

ToolResult TextTool::OnPointerDown(int x, int y, const ToolContext& ctx)
{
    ClampToGrid(x, y, ctx);

    ToolResult r;
    if (!m_staged.empty())
    {
        r.SetOps(std::move(m_staged));
        r.Finish();
    }
    m_staged.clear();
    m_line.clear();

    m_has_cursor = true;
    m_cursor_x = m_start_x = x;
    m_cursor_y = m_start_y = y;
    return r;
}

ToolResult TextTool::OnPointerMove(int, int, const ToolContext&)
{
    return {};
}

ToolResult TextTool::OnPointerUp(int, int, const ToolContext&)
{
    return {};
}

ToolResult TextTool::OnKey(char32_t key, const ToolContext& ctx)
{
    if (!m_has_cursor)
        return {};

    const int index = m_cursor_x - m_start_x;

    if (key == keys::kNewline || key == keys::kReturn)
    {
        m_cursor_x = m_start_x;
        m_cursor_y += 1;
        m_line.clear();
        return {};
    }

    if (key == keys::kBackspace)
    {
        if (m_cursor_x <= m_start_x || m_line.empty())
            return {};
        const size_t i = (size_t)(index - 1);
        if (i + 1 == m_line.size())
            m_line.pop_back();
        else if (i < m_line.size())
            m_line[i] = U' ';
        m_cursor_x -= 1;
        return Emit(m_cursor_x, m_cursor_y, U' ');
    }

    if (key == keys::kDelete)
    {
        if (index < 0 || (size_t)index >= m_line.size())
            return {};
        if ((size_t)index + 1 == m_line.size())
            m_line.pop_back();
        else
            m_line[(size_t)index] = U' ';
        return Emit(m_cursor_x, m_cursor_y, U' ');
    }

    if (key == keys::kArrowLeft)
    {
        if (m_cursor_x > m_start_x)
            m_cursor_x -= 1;
        return {};
    }
    if (key == keys::kArrowRight)
    {
        if ((size_t)index < m_line.size())
            m_cursor_x += 1;
        return {};
    }

    if (IsControlKey(key))
        return {};

    // Keep the cursor on the grid: never type into (or past) the last column.
    if (m_cursor_x >= ctx.grid_width - 1 || m_start_x >= ctx.grid_width - 1)
        return {};
    if (m_cursor_y < 0 || m_cursor_y >= ctx.grid_height)
        return {};

    if ((size_t)index < m_line.size())
        m_line[(size_t)index] = key;
    else
        m_line.push_back(key);

    const int x = m_cursor_x;
    m_cursor_x += 1;
    return Emit(x, m_cursor_y, key);
}

void TextTool::Reset()
{
    m_has_cursor = false;
    m_cursor_x = m_cursor_y = 0;
    m_start_x = m_start_y = 0;
    m_line.clear();
    m_staged.clear();
}
} // namespace ink
