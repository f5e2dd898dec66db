#include "core/commands/draw_command.h"

#include <utility>

namespace ink
{
DrawCommand::DrawCommand(DrawOps ops)
    : Command(CommandKind::DrawBatch), m_ops(std::move(ops))
{
    RefreshDescription();
}

void DrawCommand::RefreshDescription()
{
    if (m_ops.size() == 1)
        m_description = "Draw";
    else
        m_description = "Draw " + std::to_string(m_ops.size()) + " cells";
}

void DrawCommand::Apply(Grid& grid)
{
    // An empty batch never becomes "applied", so it can still absorb merges.
    if (m_applied || m_ops.empty())
        return;

    m_previous.clear();
    m_previous.reserve(m_ops.size());
    for (const DrawOp& op : m_ops)
    {
        const std::optional<Cell> prev = grid.Get(op.x, op.y);
        if (!prev)
            continue;
        m_previous.push_back({op.x, op.y, *prev});
        grid.Set(op.x, op.y, op.cell);
    }
    m_applied = true;
}

void DrawCommand::Undo(Grid& grid)
{
    if (!m_applied)
        return;
    for (auto it = m_previous.rbegin(); it != m_previous.rend(); ++it)
        grid.Set(it->x, it->y, it->cell);
    m_previous.clear();
    m_applied = false;
}

bool DrawCommand::CanMerge(const DrawCommand& other) const
{
    if (m_applied)
        return false;
    return m_ops.size() + other.m_ops.size() < kMaxMergedOps;
}

void DrawCommand::Merge(const DrawCommand& other)
{
    if (m_applied)
        return;
    m_ops.insert(m_ops.end(), other.m_ops.begin(), other.m_ops.end());
    RefreshDescription();
}
} // namespace ink
