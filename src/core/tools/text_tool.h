#pragma once

#include "core/tools/raster.h"
#include "core/tools/tool.h"

#include <vector>

namespace ink
{
// Keyboard-driven text entry.
//
// A click places the cursor (and the line's start column). Typed characters are written
// in place (overwrite) and the cursor advances; every accepted key returns a finished
// result so each keystroke is its own undo step. A new click first re-emits the text
// staged since the previous click as a finished batch.
//
// Keys:
// - '\n' / '\r'        : cursor to (start column, row + 1)
// - keys::kBackspace   : blank the cell left of the cursor and step back (not past start)
// - keys::kDelete      : blank the buffered cell under the cursor; cursor stays
// - kArrowLeft / Right : move within [start, start + buffered length]
// - other controls     : ignored
class TextTool : public Tool
{
public:
    ToolId Id() const override { return ToolId::Text; }

    ToolResult OnPointerDown(int x, int y, const ToolContext& ctx) override;
    ToolResult OnPointerMove(int x, int y, const ToolContext& ctx) override;
    ToolResult OnPointerUp(int x, int y, const ToolContext& ctx) override;
    ToolResult OnKey(char32_t key, const ToolContext& ctx) override;

    void Reset() override;
    // Stays active across pointer-up while a cursor is placed.
    bool IsActive() const override { return m_has_cursor; }
    void OnHistoryChanged() override { m_staged.clear(); }

    std::optional<GridPoint> GetCursor() const;
    // Characters of the current line, starting at the start column.
    const std::vector<char32_t>& GetLineBuffer() const { return m_line; }

private:
    ToolResult Emit(int x, int y, char32_t ch);

    bool m_has_cursor = false;
    int m_cursor_x = 0;
    int m_cursor_y = 0;
    int m_start_x = 0;
    int m_start_y = 0;
    std::vector<char32_t> m_line;
    DrawOps m_staged;
};
} // namespace ink
