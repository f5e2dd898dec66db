#pragma once

#include "core/tools/drag_shape_tool.h"

namespace ink
{
// Box outline in the given border style.
// - start == end: a single top-left corner glyph
// - one degenerate axis: a straight run of the horizontal/vertical glyph
// - otherwise: 4 corners, then top/bottom and left/right runs strictly between them
DrawOps BuildRectangleOps(int x1, int y1, int x2, int y2, BorderStyle style);

class RectangleTool : public DragShapeTool
{
public:
    ToolId Id() const override { return ToolId::Rectangle; }

protected:
    DrawOps BuildShape(int x1, int y1, int x2, int y2, const ToolContext& ctx) const override
    {
        return BuildRectangleOps(x1, y1, x2, y2, ctx.border_style);
    }
};
} // namespace ink
