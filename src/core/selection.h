#pragma once

#include "core/draw_op.h"
#include "core/grid.h"

#include <vector>

namespace ink
{
// Rectangular selection. Corners are stored as dragged (not normalized);
// every query normalizes through min/max.
struct Selection
{
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;

    Selection() = default;
    Selection(int ax, int ay, int bx, int by) : x1(ax), y1(ay), x2(bx), y2(by) {}

    CellBounds Bounds() const;
    // Inclusive extents.
    int Width() const;
    int Height() const;
    int Area() const { return Width() * Height(); }
    bool Contains(int x, int y) const;
    // Both corners coincide (a single-cell selection).
    bool IsEmpty() const { return x1 == x2 && y1 == y2; }

    void Translate(int dx, int dy);
    Selection Translated(int dx, int dy) const;

    bool operator==(const Selection& o) const
    {
        return x1 == o.x1 && y1 == o.y1 && x2 == o.x2 && y2 == o.y2;
    }
    bool operator!=(const Selection& o) const { return !(*this == o); }
};

// Cells captured from a selection, positioned relative to its top-left corner.
struct SelectionClipboard
{
    struct Entry
    {
        int rel_x = 0;
        int rel_y = 0;
        Cell cell;
    };

    std::vector<Entry> cells;
    int width = 0;
    int height = 0;
    // Top-left of the source region (paste-in-place target).
    int origin_x = 0;
    int origin_y = 0;

    bool IsEmpty() const { return cells.empty(); }
    void Clear();
};

// Copies the in-grid part of `sel` into `out` (previous contents are replaced).
// Returns false (leaving `out` untouched) when no selected cell lies inside the grid.
bool CaptureSelection(const Grid& grid, const Selection& sel, SelectionClipboard& out);

// Ops writing `clip` with its top-left at (x,y). Cells landing outside the grid are dropped.
DrawOps BuildPasteOps(const Grid& grid, const SelectionClipboard& clip, int x, int y);

// Ops blanking every in-grid cell of `sel`.
DrawOps BuildBlankOps(const Grid& grid, const Selection& sel);
} // namespace ink
