#pragma once

#include "core/tools/drag_shape_tool.h"

namespace ink
{
// Four half-diagonals from the box centre to the midpoints of its top, right, bottom
// and left edges. Cells hit more than once keep their first glyph; output is sorted
// by (y,x). A zero-extent box yields one '◆' at the centre.
DrawOps BuildDiamondOps(int x1, int y1, int x2, int y2);

class DiamondTool : public DragShapeTool
{
public:
    ToolId Id() const override { return ToolId::Diamond; }

protected:
    DrawOps BuildShape(int x1, int y1, int x2, int y2, const ToolContext&) const override
    {
        return BuildDiamondOps(x1, y1, x2, y2);
    }
};
} // namespace ink
