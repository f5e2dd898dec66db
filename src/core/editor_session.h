// Editor session: the single owner of the grid, history, dirty tracker and active tool.
//
// The host feeds it pointer events (already in grid coordinates) and key events; the
// session routes them to the active tool, keeps the tool's live preview separate from
// the grid, and commits finished results as undoable commands. Rendering pulls the
// grid, the preview ops and the dirty region; nothing here paints or logs.
//
// Implementation is split across src/core/editor_session/*.cpp.

#pragma once

#include "core/commands/command.h"
#include "core/dirty_region.h"
#include "core/draw_op.h"
#include "core/grid.h"
#include "core/history.h"
#include "core/selection.h"
#include "core/tools/tool.h"
#include "io/formats/ascii_export.h"

#include <memory>
#include <optional>
#include <string>

namespace ink
{
struct EditorSettings;

// Observable state changes. The session holds a non-owning pointer; the observer
// must outlive it (or be detached with SetObserver(nullptr)).
class ISessionObserver
{
public:
    virtual ~ISessionObserver() = default;

    virtual void OnCommandPushed(const Command& command, size_t undo_count, size_t redo_count)
    {
        (void)command;
        (void)undo_count;
        (void)redo_count;
    }
    virtual void OnUndo(const std::string& description) { (void)description; }
    virtual void OnRedo(const std::string& description) { (void)description; }
    virtual void OnHistoryCleared() {}
    virtual void OnToolChanged(ToolId from, ToolId to)
    {
        (void)from;
        (void)to;
    }
    virtual void OnSelectionChanged(const std::optional<Selection>& selection) { (void)selection; }
    virtual void OnClipboardChanged(const SelectionClipboard& clipboard) { (void)clipboard; }
    virtual void OnGridResized(int width, int height)
    {
        (void)width;
        (void)height;
    }
};

// Key-down event. `key` is either one UTF-8 character or a key name:
// "Escape", "Enter", "Backspace", "Delete", "ArrowLeft", "ArrowRight", "Tab".
struct KeyEvent
{
    std::string key;
    bool ctrl = false;
    bool shift = false;
    bool alt = false;
};

// What the host should repaint, drained by EditorSession::TakeDirtyRegion().
struct RedrawRequest
{
    bool full = false;
    // Valid (and clamped to the grid) when !full.
    DirtyRect rect;
};

class EditorSession
{
public:
    EditorSession(int width, int height);
    explicit EditorSession(const EditorSettings& settings);

    EditorSession(const EditorSession&) = delete;
    EditorSession& operator=(const EditorSession&) = delete;

    void SetObserver(ISessionObserver* observer) { m_observer = observer; }

    // ---------------------------------------------------------------------
    // State access
    // ---------------------------------------------------------------------
    const Grid& GetGrid() const { return m_grid; }
    const History& GetHistory() const { return m_history; }
    const DirtyTracker& GetDirtyTracker() const { return m_dirty; }
    // Uncommitted ops to overlay on the grid; never part of the grid or history.
    const DrawOps& GetPreviewOps() const { return m_preview; }
    const std::optional<Selection>& GetSelection() const { return m_selection; }
    const SelectionClipboard& GetClipboard() const { return m_clipboard; }

    ToolId GetToolId() const { return m_tool_id; }
    const Tool& GetTool() const { return *m_tool; }
    BorderStyle GetBorderStyle() const { return m_border_style; }
    const ToolOptions& GetToolOptions() const { return m_tool_options; }
    const formats::ascii::ExportOptions& GetExportOptions() const { return m_export_options; }
    ToolContext MakeToolContext() const;

    // ---------------------------------------------------------------------
    // Tools
    // ---------------------------------------------------------------------
    // Resets the outgoing tool and drops its preview. The selection survives only
    // when switching to Select.
    void SetTool(ToolId id);
    void SetBorderStyle(BorderStyle style) { m_border_style = style; }
    // Applies to tools created from now on, and to the active one (rebuilt).
    void SetToolOptions(const ToolOptions& options);

    // ---------------------------------------------------------------------
    // Input
    // ---------------------------------------------------------------------
    void OnPointerDown(int x, int y);
    void OnPointerMove(int x, int y);
    void OnPointerUp(int x, int y);
    // Returns true when the key was consumed.
    bool OnKeyDown(const KeyEvent& ev);
    // Escape: abandon the gesture in progress; nothing is committed.
    void CancelGesture();

    // ---------------------------------------------------------------------
    // Edits (each one is a single history entry)
    // ---------------------------------------------------------------------
    // Returns false for an empty batch or one that would not change any cell.
    bool Commit(const DrawOps& ops);
    bool Undo();
    bool Redo();
    // Undoable. Returns false when the grid is already blank.
    bool ClearCanvas();
    bool Resize(int width, int height);
    // Wipes grid, history, clipboard and selection (new document). Not undoable.
    void Reset();

    // ---------------------------------------------------------------------
    // Selection & clipboard
    // ---------------------------------------------------------------------
    void SetSelection(const std::optional<Selection>& selection);
    void SelectAll();
    bool CopySelection();
    bool CutSelection();
    // Pastes at the selection's top-left when there is a selection, else where the
    // clipboard was copied from.
    bool Paste();
    bool PasteAt(int x, int y);
    bool DeleteSelection();
    // Relocates the selected cells by (dx,dy) as one history entry.
    bool MoveSelection(const SelectionMove& move);

    // ---------------------------------------------------------------------
    // Output
    // ---------------------------------------------------------------------
    // Uses the session's export options (from EditorSettings, or SetExportOptions).
    std::string ExportAscii() const;
    std::string ExportAscii(const formats::ascii::ExportOptions& options) const;
    void SetExportOptions(const formats::ascii::ExportOptions& options) { m_export_options = options; }
    // Selected cells as text (trailing spaces trimmed per row); empty without a selection.
    std::string ExportSelection() const;
    // Returns the pending redraw and clears the tracker.
    RedrawRequest TakeDirtyRegion();

private:
    void HandleToolResult(ToolResult result, bool pointer_up);
    void SetPreview(DrawOps ops);
    void ClearPreview();
    bool CommitCommand(CommandPtr command, bool full_redraw);
    bool WouldChangeGrid(const DrawOps& ops) const;
    void MarkOpsDirty(const DrawOps& ops);
    void SyncSelectionFromTool();
    void NotifySelection();

    Grid m_grid;
    History m_history;
    DirtyTracker m_dirty;

    std::unique_ptr<Tool> m_tool;
    ToolId m_tool_id = ToolId::Rectangle;
    BorderStyle m_border_style = BorderStyle::Single;
    ToolOptions m_tool_options;
    formats::ascii::ExportOptions m_export_options;

    DrawOps m_preview;
    std::optional<Selection> m_selection;
    SelectionClipboard m_clipboard;

    ISessionObserver* m_observer = nullptr;
};
} // namespace ink
