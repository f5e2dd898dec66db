#include "core/editor_session.h"

#include "core/utf8.h"

#include <utility>

namespace ink
{
namespace
{
// Maps a key event to the code delivered to Tool::OnKey(); false if it has none.
static bool TranslateToolKey(const KeyEvent& ev, char32_t& out)
{
    const std::string& k = ev.key;
    if (k == "Enter")
        out = keys::kNewline;
    else if (k == "Backspace")
        out = keys::kBackspace;
    else if (k == "Delete")
        out = keys::kDelete;
    else if (k == "ArrowLeft")
        out = keys::kArrowLeft;
    else if (k == "ArrowRight")
        out = keys::kArrowRight;
    else if (k == "Tab")
        out = U'\t';
    else
        return utf8::DecodeSingle(k, out);
    return true;
}

static char32_t ToLowerAscii(char32_t c)
{
    return (c >= U'A' && c <= U'Z') ? (c - U'A' + U'a') : c;
}
} // namespace

// ---------------------------------------------------------------------------
// Pointer
// ---------------------------------------------------------------------------

void EditorSession::OnPointerDown(int x, int y)
{
    // A new gesture never inherits a stale preview.
    ClearPreview();
    HandleToolResult(m_tool->OnPointerDown(x, y, MakeToolContext()), false);
    SyncSelectionFromTool();
}

void EditorSession::OnPointerMove(int x, int y)
{
    HandleToolResult(m_tool->OnPointerMove(x, y, MakeToolContext()), false);
    SyncSelectionFromTool();
}

void EditorSession::OnPointerUp(int x, int y)
{
    HandleToolResult(m_tool->OnPointerUp(x, y, MakeToolContext()), true);
    SyncSelectionFromTool();
}

void EditorSession::HandleToolResult(ToolResult result, bool pointer_up)
{
    if (result.move)
    {
        ClearPreview();
        MoveSelection(*result.move);
        return;
    }

    if (result.finished)
    {
        ClearPreview();
        if (result.modified)
            Commit(result.ops);
        return;
    }

    if (pointer_up)
    {
        ClearPreview();
        return;
    }

    if (!result.modified)
        return;

    if (m_tool->AccumulatesPreview() && !m_preview.empty())
    {
        MarkOpsDirty(result.ops);
        m_preview.insert(m_preview.end(), result.ops.begin(), result.ops.end());
        return;
    }
    SetPreview(std::move(result.ops));
}

void EditorSession::CancelGesture()
{
    m_tool->Reset();
    ClearPreview();
    SyncSelectionFromTool();
}

// ---------------------------------------------------------------------------
// Keyboard
// ---------------------------------------------------------------------------

bool EditorSession::OnKeyDown(const KeyEvent& ev)
{
    if (ev.key == "Escape")
    {
        CancelGesture();
        return true;
    }

    if (ev.ctrl && !ev.alt)
    {
        char32_t c = 0;
        if (!utf8::DecodeSingle(ev.key, c))
            return false;
        switch (ToLowerAscii(c))
        {
            case U'z':
                if (ev.shift)
                    Redo();
                else
                    Undo();
                return true;
            case U'y':
                Redo();
                return true;
            case U'c':
                CopySelection();
                return true;
            case U'x':
                CutSelection();
                return true;
            case U'v':
                Paste();
                return true;
            case U'a':
                SelectAll();
                return true;
            default:
                return false;
        }
    }

    if (m_tool_id == ToolId::Select && (ev.key == "Delete" || ev.key == "Backspace"))
    {
        DeleteSelection();
        return true;
    }

    if (m_tool_id == ToolId::Text && m_tool->IsActive() && !ev.alt)
    {
        char32_t key = 0;
        if (!TranslateToolKey(ev, key))
            return false;
        HandleToolResult(m_tool->OnKey(key, MakeToolContext()), false);
        return true;
    }

    if (!ev.ctrl && !ev.alt && !m_tool->IsActive())
    {
        char32_t c = 0;
        if (!utf8::DecodeSingle(ev.key, c))
            return false;
        const std::optional<ToolId> id = ToolIdFromShortcut(c);
        if (!id)
            return false;
        SetTool(*id);
        return true;
    }
    return false;
}
} // namespace ink
