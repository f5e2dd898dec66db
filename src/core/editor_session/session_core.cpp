#include "core/editor_session.h"

#include "core/commands/draw_command.h"
#include "io/session/editor_settings.h"

#include <algorithm>
#include <utility>

namespace ink
{
// ---------------------------------------------------------------------------
// Construction / state
// ---------------------------------------------------------------------------

EditorSession::EditorSession(int width, int height)
    : m_grid(width, height)
    , m_tool(MakeTool(ToolId::Rectangle))
{
    m_dirty.RequestFullRedraw();
}

EditorSession::EditorSession(const EditorSettings& settings)
    : m_grid(settings.grid_width, settings.grid_height)
    , m_history(settings.undo_limit)
    , m_tool_id(settings.default_tool)
    , m_border_style(settings.border_style)
    , m_tool_options(settings.tools)
    , m_export_options(settings.export_options)
{
    m_tool = MakeTool(m_tool_id, m_tool_options);
    m_dirty.RequestFullRedraw();
}

ToolContext EditorSession::MakeToolContext() const
{
    ToolContext ctx;
    ctx.grid_width = m_grid.GetWidth();
    ctx.grid_height = m_grid.GetHeight();
    ctx.border_style = m_border_style;
    return ctx;
}

void EditorSession::SetTool(ToolId id)
{
    if (m_tool)
        m_tool->Reset();
    ClearPreview();

    const ToolId prev = m_tool_id;
    if (id != ToolId::Select && m_selection)
    {
        m_selection.reset();
        NotifySelection();
    }

    m_tool = MakeTool(id, m_tool_options);
    m_tool_id = id;
    if (id == ToolId::Select)
        m_tool->SetSelection(m_selection);

    if (m_observer)
        m_observer->OnToolChanged(prev, id);
}

void EditorSession::SetToolOptions(const ToolOptions& options)
{
    m_tool_options = options;
    if (m_tool_options.eraser_size < 1)
        m_tool_options.eraser_size = 1;
    SetTool(m_tool_id);
}

// ---------------------------------------------------------------------------
// Preview / dirty bookkeeping
// ---------------------------------------------------------------------------

void EditorSession::MarkOpsDirty(const DrawOps& ops)
{
    for (const DrawOp& op : ops)
    {
        if (m_grid.InBounds(op.x, op.y))
            m_dirty.MarkDirty(op.x, op.y);
    }
}

void EditorSession::SetPreview(DrawOps ops)
{
    // Old preview cells must be repainted from the grid.
    MarkOpsDirty(m_preview);
    m_preview = std::move(ops);
    MarkOpsDirty(m_preview);
}

void EditorSession::ClearPreview()
{
    if (m_preview.empty())
        return;
    MarkOpsDirty(m_preview);
    m_preview.clear();
}

RedrawRequest EditorSession::TakeDirtyRegion()
{
    RedrawRequest r;
    r.full = m_dirty.NeedsFullRedraw();
    if (!r.full)
    {
        r.rect = m_dirty.GetDirtyRect();
        r.rect.Clamp(m_grid.GetWidth(), m_grid.GetHeight());
        if (r.rect.IsEmpty())
            r.full = true;
    }
    if (r.full)
        r.rect = DirtyRect::Full(m_grid.GetWidth(), m_grid.GetHeight());
    m_dirty.Clear();
    return r;
}

// ---------------------------------------------------------------------------
// Committing
// ---------------------------------------------------------------------------

bool EditorSession::WouldChangeGrid(const DrawOps& ops) const
{
    for (const DrawOp& op : ops)
    {
        const std::optional<Cell> cur = m_grid.Get(op.x, op.y);
        if (cur && *cur != op.cell)
            return true;
    }
    return false;
}

bool EditorSession::CommitCommand(CommandPtr command, bool full_redraw)
{
    if (!command)
        return false;
    command->Apply(m_grid);
    if (!command->IsApplied())
        return false;

    const Command& pushed = *command;
    m_history.Push(std::move(command));
    if (full_redraw)
        m_dirty.RequestFullRedraw();
    if (m_observer)
        m_observer->OnCommandPushed(pushed, m_history.UndoCount(), m_history.RedoCount());
    return true;
}

bool EditorSession::Commit(const DrawOps& ops)
{
    if (ops.empty() || !WouldChangeGrid(ops))
        return false;
    MarkOpsDirty(ops);
    return CommitCommand(std::make_unique<DrawCommand>(ops), false);
}

bool EditorSession::Undo()
{
    const std::optional<std::string> desc = m_history.UndoDescription();
    if (!m_history.Undo(m_grid))
        return false;
    m_tool->OnHistoryChanged();
    m_dirty.RequestFullRedraw();
    if (m_observer)
        m_observer->OnUndo(desc.value_or(std::string()));
    return true;
}

bool EditorSession::Redo()
{
    const std::optional<std::string> desc = m_history.RedoDescription();
    if (!m_history.Redo(m_grid))
        return false;
    m_tool->OnHistoryChanged();
    m_dirty.RequestFullRedraw();
    if (m_observer)
        m_observer->OnRedo(desc.value_or(std::string()));
    return true;
}

bool EditorSession::ClearCanvas()
{
    CancelGesture();

    const std::vector<Cell>& cells = m_grid.Cells();
    const bool blank = std::all_of(cells.begin(), cells.end(), [](const Cell& c) { return c == Cell{}; });
    if (blank)
        return false;
    return CommitCommand(std::make_unique<ClearGridCommand>(), true);
}

bool EditorSession::Resize(int width, int height)
{
    if (width <= 0 || height <= 0)
        return false;
    if (width == m_grid.GetWidth() && height == m_grid.GetHeight())
        return false;

    CancelGesture();
    SetSelection(std::nullopt);

    if (!CommitCommand(std::make_unique<ResizeCommand>(width, height), true))
        return false;
    if (m_observer)
        m_observer->OnGridResized(m_grid.GetWidth(), m_grid.GetHeight());
    return true;
}

void EditorSession::Reset()
{
    m_tool->Reset();
    m_preview.clear();
    m_grid.Clear();
    m_history.Clear();
    m_clipboard.Clear();
    SetSelection(std::nullopt);
    m_dirty.Clear();
    m_dirty.RequestFullRedraw();
    if (m_observer)
        m_observer->OnHistoryCleared();
}

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

std::string EditorSession::ExportAscii() const
{
    return ExportAscii(m_export_options);
}

std::string EditorSession::ExportAscii(const formats::ascii::ExportOptions& options) const
{
    return formats::ascii::ExportGrid(m_grid, options);
}

std::string EditorSession::ExportSelection() const
{
    if (!m_selection)
        return std::string();
    const CellBounds b = m_selection->Bounds();
    return formats::ascii::ExportRegion(m_grid, b.min_x, b.min_y, b.max_x, b.max_y);
}
} // namespace ink
