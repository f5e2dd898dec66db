#include "app/session_log.h"

#include <string>

namespace app
{
void SessionLog::OnCommandPushed(const ink::Command& command, size_t undo_count, size_t redo_count)
{
    if (!out_)
        return;
    const std::string desc = command.Description();
    std::fprintf(out_, "[history] push: %s (undo=%zu redo=%zu)\n", desc.c_str(), undo_count, redo_count);
}

void SessionLog::OnUndo(const std::string& description)
{
    if (out_)
        std::fprintf(out_, "[history] undo: %s\n", description.c_str());
}

void SessionLog::OnRedo(const std::string& description)
{
    if (out_)
        std::fprintf(out_, "[history] redo: %s\n", description.c_str());
}

void SessionLog::OnHistoryCleared()
{
    if (out_)
        std::fprintf(out_, "[history] cleared\n");
}

void SessionLog::OnToolChanged(ink::ToolId from, ink::ToolId to)
{
    if (!out_)
        return;
    const std::string a(ink::ToolName(from));
    const std::string b(ink::ToolName(to));
    std::fprintf(out_, "[tool] %s -> %s\n", a.c_str(), b.c_str());
}

void SessionLog::OnSelectionChanged(const std::optional<ink::Selection>& selection)
{
    if (!out_)
        return;
    if (!selection)
    {
        std::fprintf(out_, "[selection] cleared\n");
        return;
    }
    const ink::CellBounds b = selection->Bounds();
    std::fprintf(out_, "[selection] %d,%d %dx%d\n", b.min_x, b.min_y, b.Width(), b.Height());
}

void SessionLog::OnClipboardChanged(const ink::SelectionClipboard& clipboard)
{
    if (out_)
        std::fprintf(out_, "[clipboard] captured %dx%d (%zu cells)\n",
                     clipboard.width, clipboard.height, clipboard.cells.size());
}

void SessionLog::OnGridResized(int width, int height)
{
    if (out_)
        std::fprintf(out_, "[grid] resized to %dx%d\n", width, height);
}
} // namespace app
