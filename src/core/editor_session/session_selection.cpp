#include "core/editor_session.h"

#include "core/commands/composite_command.h"
#include "core/commands/draw_command.h"

#include <utility>

namespace ink
{
// ---------------------------------------------------------------------------
// Selection
// ---------------------------------------------------------------------------

void EditorSession::NotifySelection()
{
    if (m_observer)
        m_observer->OnSelectionChanged(m_selection);
}

void EditorSession::SyncSelectionFromTool()
{
    if (m_tool_id != ToolId::Select)
        return;
    const std::optional<Selection> sel = m_tool->GetSelection();
    if (sel == m_selection)
        return;
    m_selection = sel;
    NotifySelection();
}

void EditorSession::SetSelection(const std::optional<Selection>& selection)
{
    if (m_tool_id == ToolId::Select)
        m_tool->SetSelection(selection);
    if (selection == m_selection)
        return;
    m_selection = selection;
    NotifySelection();
}

void EditorSession::SelectAll()
{
    if (m_grid.GetWidth() <= 0 || m_grid.GetHeight() <= 0)
        return;
    if (m_tool_id != ToolId::Select)
        SetTool(ToolId::Select);
    SetSelection(Selection(0, 0, m_grid.GetWidth() - 1, m_grid.GetHeight() - 1));
}

// ---------------------------------------------------------------------------
// Clipboard
// ---------------------------------------------------------------------------

bool EditorSession::CopySelection()
{
    if (!m_selection)
        return false;
    if (!CaptureSelection(m_grid, *m_selection, m_clipboard))
        return false;
    if (m_observer)
        m_observer->OnClipboardChanged(m_clipboard);
    return true;
}

bool EditorSession::CutSelection()
{
    if (!CopySelection())
        return false;
    // An already blank region is still "cut" (copied); only the edit is skipped.
    const DrawOps blank = BuildBlankOps(m_grid, *m_selection);
    if (Commit(blank))
        m_dirty.RequestFullRedraw();
    SetSelection(std::nullopt);
    return true;
}

bool EditorSession::Paste()
{
    if (m_clipboard.IsEmpty())
        return false;
    if (m_selection)
    {
        const CellBounds b = m_selection->Bounds();
        return PasteAt(b.min_x, b.min_y);
    }
    return PasteAt(m_clipboard.origin_x, m_clipboard.origin_y);
}

bool EditorSession::PasteAt(int x, int y)
{
    if (m_clipboard.IsEmpty())
        return false;
    return Commit(BuildPasteOps(m_grid, m_clipboard, x, y));
}

bool EditorSession::DeleteSelection()
{
    if (!m_selection)
        return false;
    return Commit(BuildBlankOps(m_grid, *m_selection));
}

bool EditorSession::MoveSelection(const SelectionMove& move)
{
    if (move.dx == 0 && move.dy == 0)
        return false;

    SelectionClipboard moved;
    if (!CaptureSelection(m_grid, move.source, moved))
        return false;

    const CellBounds b = move.source.Bounds();
    const DrawOps blank = BuildBlankOps(m_grid, move.source);
    const DrawOps paste = BuildPasteOps(m_grid, moved, b.min_x + move.dx, b.min_y + move.dy);

    auto blank_cmd = std::make_unique<DrawCommand>(blank);
    auto paste_cmd = std::make_unique<DrawCommand>(paste);
    CommandPtr cmd;
    if (MergeCommands(*blank_cmd, *paste_cmd))
    {
        cmd = std::move(blank_cmd);
    }
    else
    {
        auto group = std::make_unique<CompositeCommand>("Move selection");
        group->Add(std::move(blank_cmd));
        group->Add(std::move(paste_cmd));
        cmd = std::move(group);
    }

    MarkOpsDirty(blank);
    MarkOpsDirty(paste);
    const bool committed = CommitCommand(std::move(cmd), false);

    SetSelection(move.source.Translated(move.dx, move.dy));
    return committed;
}
} // namespace ink
