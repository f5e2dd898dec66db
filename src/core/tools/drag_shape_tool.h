#pragma once

#include "core/tools/tool.h"

namespace ink
{
// Shared Idle -> Dragging -> Idle machine for the anchor-to-pointer shapes
// (rectangle, line, arrow, diamond). Moves return the whole shape as a preview;
// pointer-up returns it finished and goes back to idle.
class DragShapeTool : public Tool
{
public:
    ToolResult OnPointerDown(int x, int y, const ToolContext& ctx) override;
    ToolResult OnPointerMove(int x, int y, const ToolContext& ctx) override;
    ToolResult OnPointerUp(int x, int y, const ToolContext& ctx) override;

    void Reset() override;
    bool IsActive() const override { return m_dragging; }

protected:
    virtual DrawOps BuildShape(int x1, int y1, int x2, int y2, const ToolContext& ctx) const = 0;

private:
    bool m_dragging = false;
    int m_start_x = 0;
    int m_start_y = 0;
};
} // namespace ink
