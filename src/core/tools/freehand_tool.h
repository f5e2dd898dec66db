#pragma once

#include "core/tools/tool.h"

namespace ink
{
// Pencil: stamps a fixed glyph along the pointer path.
// Moves return the newly stamped segment as a preview; pointer-up returns the
// whole stroke as one finished batch.
class FreehandTool : public Tool
{
public:
    explicit FreehandTool(char32_t glyph = U'*') : m_glyph(glyph) {}

    ToolId Id() const override { return ToolId::Freehand; }

    ToolResult OnPointerDown(int x, int y, const ToolContext& ctx) override;
    ToolResult OnPointerMove(int x, int y, const ToolContext& ctx) override;
    ToolResult OnPointerUp(int x, int y, const ToolContext& ctx) override;

    void Reset() override;
    bool IsActive() const override { return m_drawing; }
    bool AccumulatesPreview() const override { return true; }

private:
    char32_t m_glyph = U'*';
    bool m_drawing = false;
    int m_last_x = 0;
    int m_last_y = 0;
    DrawOps m_stroke;
};
} // namespace ink
