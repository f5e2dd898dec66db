#pragma once

#include "core/tools/tool.h"

namespace ink
{
// Rectangular selection. Dragging outside the current selection starts a new one;
// dragging from inside it moves the content: pointer-up then returns a finished
// result carrying a SelectionMove, and the selection follows the content. The tool
// never edits cells itself.
class SelectTool : public Tool
{
public:
    ToolId Id() const override { return ToolId::Select; }

    ToolResult OnPointerDown(int x, int y, const ToolContext& ctx) override;
    ToolResult OnPointerMove(int x, int y, const ToolContext& ctx) override;
    ToolResult OnPointerUp(int x, int y, const ToolContext& ctx) override;

    // Drops the selection as well as any drag in progress.
    void Reset() override;
    bool IsActive() const override { return m_selecting || m_moving; }

    std::optional<Selection> GetSelection() const override { return m_selection; }
    void SetSelection(const std::optional<Selection>& selection) override;

    bool IsSelecting() const { return m_selecting; }
    bool IsMoving() const { return m_moving; }

private:
    std::optional<Selection> m_selection;
    bool m_selecting = false;
    bool m_moving = false;
    // Drag start (selecting) or grab point (moving).
    int m_anchor_x = 0;
    int m_anchor_y = 0;
};
} // namespace ink
