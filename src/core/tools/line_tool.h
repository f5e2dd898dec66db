#pragma once

#include "core/tools/drag_shape_tool.h"

namespace ink
{
// Glyph for a segment with the given overall delta:
// '─' horizontal, '│' vertical, '\' for down-right/up-left, '/' for up-right/down-left.
char32_t LineGlyph(int dx, int dy);

DrawOps BuildLineOps(int x1, int y1, int x2, int y2);

class LineTool : public DragShapeTool
{
public:
    ToolId Id() const override { return ToolId::Line; }

protected:
    DrawOps BuildShape(int x1, int y1, int x2, int y2, const ToolContext&) const override
    {
        return BuildLineOps(x1, y1, x2, y2);
    }
};
} // namespace ink
