#include "core/commands/command.h"

#include "core/commands/draw_command.h"

#include <utility>

namespace ink
{
bool CanMergeCommands(const Command& into, const Command& next)
{
    if (into.Kind() != CommandKind::DrawBatch || next.Kind() != CommandKind::DrawBatch)
        return false;
    return static_cast<const DrawCommand&>(into).CanMerge(static_cast<const DrawCommand&>(next));
}

bool MergeCommands(Command& into, const Command& next)
{
    if (!CanMergeCommands(into, next))
        return false;
    static_cast<DrawCommand&>(into).Merge(static_cast<const DrawCommand&>(next));
    return true;
}

// ---------------------------------------------------------------------------
// SetCell / ClearCell
// ---------------------------------------------------------------------------

void SetCellCommand::Apply(Grid& grid)
{
    if (m_applied)
        return;
    // Out of range: nothing captured, nothing written.
    m_previous = grid.Get(m_x, m_y);
    if (m_previous)
        grid.Set(m_x, m_y, m_cell);
    m_applied = true;
}

void SetCellCommand::Undo(Grid& grid)
{
    if (!m_applied)
        return;
    if (m_previous)
        grid.Set(m_x, m_y, *m_previous);
    m_previous.reset();
    m_applied = false;
}

void ClearCellCommand::Apply(Grid& grid)
{
    if (m_applied)
        return;
    m_previous = grid.Get(m_x, m_y);
    if (m_previous)
        grid.ClearCell(m_x, m_y);
    m_applied = true;
}

void ClearCellCommand::Undo(Grid& grid)
{
    if (!m_applied)
        return;
    if (m_previous)
        grid.Set(m_x, m_y, *m_previous);
    m_previous.reset();
    m_applied = false;
}

// ---------------------------------------------------------------------------
// ClearGrid / Resize
// ---------------------------------------------------------------------------

GridSnapshot GridSnapshot::Capture(const Grid& grid)
{
    GridSnapshot s;
    s.cells = grid.Cells();
    s.width = grid.GetWidth();
    s.height = grid.GetHeight();
    return s;
}

std::optional<Grid> GridSnapshot::Restore()
{
    return Grid::FromCells(std::move(cells), width, height);
}

void ClearGridCommand::Apply(Grid& grid)
{
    if (m_applied)
        return;
    m_snapshot = GridSnapshot::Capture(grid);
    grid.Clear();
    m_applied = true;
}

void ClearGridCommand::Undo(Grid& grid)
{
    if (!m_applied)
        return;
    if (grid.GetWidth() == m_snapshot.width && grid.GetHeight() == m_snapshot.height)
    {
        if (std::optional<Grid> restored = m_snapshot.Restore())
            grid = std::move(*restored);
    }
    m_snapshot = GridSnapshot{};
    m_applied = false;
}

void ResizeCommand::Apply(Grid& grid)
{
    if (m_applied)
        return;
    m_snapshot = GridSnapshot::Capture(grid);
    grid.Resize(m_width, m_height);
    m_applied = true;
}

void ResizeCommand::Undo(Grid& grid)
{
    if (!m_applied)
        return;
    if (std::optional<Grid> restored = m_snapshot.Restore())
        grid = std::move(*restored);
    m_snapshot = GridSnapshot{};
    m_applied = false;
}

std::string ResizeCommand::Description() const
{
    return "Resize to " + std::to_string(m_width) + "x" + std::to_string(m_height);
}
} // namespace ink
