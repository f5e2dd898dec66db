#include "core/selection.h"

#include <algorithm>
#include <cstdlib>
#include <utility>

namespace ink
{
// ---------------------------------------------------------------------------
// Selection
// ---------------------------------------------------------------------------

CellBounds Selection::Bounds() const
{
    CellBounds b;
    b.min_x = std::min(x1, x2);
    b.min_y = std::min(y1, y2);
    b.max_x = std::max(x1, x2);
    b.max_y = std::max(y1, y2);
    return b;
}

int Selection::Width() const
{
    return std::abs(x2 - x1) + 1;
}

int Selection::Height() const
{
    return std::abs(y2 - y1) + 1;
}

bool Selection::Contains(int x, int y) const
{
    const CellBounds b = Bounds();
    return x >= b.min_x && x <= b.max_x && y >= b.min_y && y <= b.max_y;
}

void Selection::Translate(int dx, int dy)
{
    x1 += dx;
    x2 += dx;
    y1 += dy;
    y2 += dy;
}

Selection Selection::Translated(int dx, int dy) const
{
    Selection s = *this;
    s.Translate(dx, dy);
    return s;
}

// ---------------------------------------------------------------------------
// Clipboard
// ---------------------------------------------------------------------------

void SelectionClipboard::Clear()
{
    cells.clear();
    width = 0;
    height = 0;
    origin_x = 0;
    origin_y = 0;
}

bool CaptureSelection(const Grid& grid, const Selection& sel, SelectionClipboard& out)
{
    const CellBounds b = sel.Bounds();

    SelectionClipboard clip;
    clip.width = b.Width();
    clip.height = b.Height();
    clip.origin_x = b.min_x;
    clip.origin_y = b.min_y;
    for (int y = b.min_y; y <= b.max_y; ++y)
    {
        for (int x = b.min_x; x <= b.max_x; ++x)
        {
            const std::optional<Cell> c = grid.Get(x, y);
            if (!c)
                continue;
            clip.cells.push_back({x - b.min_x, y - b.min_y, *c});
        }
    }

    if (clip.cells.empty())
        return false;
    out = std::move(clip);
    return true;
}

DrawOps BuildPasteOps(const Grid& grid, const SelectionClipboard& clip, int x, int y)
{
    DrawOps ops;
    ops.reserve(clip.cells.size());
    for (const SelectionClipboard::Entry& e : clip.cells)
    {
        const int px = x + e.rel_x;
        const int py = y + e.rel_y;
        if (!grid.InBounds(px, py))
            continue;
        ops.emplace_back(px, py, e.cell);
    }
    return ops;
}

DrawOps BuildBlankOps(const Grid& grid, const Selection& sel)
{
    DrawOps ops;
    const CellBounds b = sel.Bounds();
    for (int y = b.min_y; y <= b.max_y; ++y)
        for (int x = b.min_x; x <= b.max_x; ++x)
            if (grid.InBounds(x, y))
                ops.emplace_back(x, y, Cell{});
    return ops;
}
} // namespace ink
