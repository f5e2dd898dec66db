#pragma once

#include "core/tools/tool.h"

namespace ink
{
// Square patch of blank cells, side 2*size-1, centred on (x,y) and clipped to the grid.
DrawOps BuildErasePatch(int x, int y, int size, const ToolContext& ctx);

// Same gesture model as FreehandTool, but every path point expands to an erase patch.
class EraserTool : public Tool
{
public:
    explicit EraserTool(int size = 1) { SetSize(size); }

    ToolId Id() const override { return ToolId::Eraser; }

    ToolResult OnPointerDown(int x, int y, const ToolContext& ctx) override;
    ToolResult OnPointerMove(int x, int y, const ToolContext& ctx) override;
    ToolResult OnPointerUp(int x, int y, const ToolContext& ctx) override;

    void Reset() override;
    bool IsActive() const override { return m_erasing; }
    bool AccumulatesPreview() const override { return true; }

    int GetSize() const { return m_size; }
    // Clamped to >= 1.
    void SetSize(int size) { m_size = (size < 1) ? 1 : size; }

private:
    int m_size = 1;
    bool m_erasing = false;
    int m_last_x = 0;
    int m_last_y = 0;
    DrawOps m_stroke;
};
} // namespace ink
