#pragma once

#include "core/tools/drag_shape_tool.h"

namespace ink
{
// Angle bucket used by both the arrow body and head: |dx|*10 / max(|dy|,1).
//   ratio < 3  : steep
//   ratio > 7  : shallow
//   otherwise  : diagonal band
int ArrowSlopeRatio(int dx, int dy);

// Body glyph for a cell whose remaining delta to the arrow tip is (dx,dy).
char32_t ArrowBodyGlyph(int dx, int dy);

// Head glyph for an arrow with overall delta (dx,dy).
//   zero length -> '•', axis-aligned -> ▲▼◄►, steep -> ╲/╱,
//   shallow -> ◄/►, diagonal band -> '<'/'>'.
char32_t ArrowHeadGlyph(int dx, int dy);

// Rasterized body (one op per cell, start->end) followed by one head op at the tip.
DrawOps BuildArrowOps(int x1, int y1, int x2, int y2);

class ArrowTool : public DragShapeTool
{
public:
    ToolId Id() const override { return ToolId::Arrow; }

protected:
    DrawOps BuildShape(int x1, int y1, int x2, int y2, const ToolContext&) const override
    {
        return BuildArrowOps(x1, y1, x2, y2);
    }
};
} // namespace ink
