#pragma once

#include "core/editor_session.h"

#include <cstdio>

namespace app
{
// Logs session events as "[tag] message" lines (tags: history, tool, selection,
// clipboard, grid). Attach with EditorSession::SetObserver().
class SessionLog : public ink::ISessionObserver
{
public:
    explicit SessionLog(std::FILE* out = stderr) : out_(out) {}

    void OnCommandPushed(const ink::Command& command, size_t undo_count, size_t redo_count) override;
    void OnUndo(const std::string& description) override;
    void OnRedo(const std::string& description) override;
    void OnHistoryCleared() override;
    void OnToolChanged(ink::ToolId from, ink::ToolId to) override;
    void OnSelectionChanged(const std::optional<ink::Selection>& selection) override;
    void OnClipboardChanged(const ink::SelectionClipboard& clipboard) override;
    void OnGridResized(int width, int height) override;

private:
    std::FILE* out_ = nullptr;
};
} // namespace app
