// Fixed-size character grid (row-major) owned by an EditorSession.

#pragma once

#include "core/cell.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace ink
{
// Inclusive, normalized cell rectangle.
struct CellBounds
{
    int min_x = 0;
    int min_y = 0;
    int max_x = 0;
    int max_y = 0;

    int Width() const { return max_x - min_x + 1; }
    int Height() const { return max_y - min_y + 1; }

    bool operator==(const CellBounds& o) const
    {
        return min_x == o.min_x && min_y == o.min_y && max_x == o.max_x && max_y == o.max_y;
    }
};

class Grid
{
public:
    explicit Grid(int width = 0, int height = 0);

    // Rebuilds a grid from a flat row-major snapshot.
    // Empty if cells.size() != width*height.
    static std::optional<Grid> FromCells(std::vector<Cell> cells, int width, int height);

    int GetWidth() const { return m_width; }
    int GetHeight() const { return m_height; }
    size_t GetCellCount() const { return m_cells.size(); }

    // ---------------------------------------------------------------------
    // Coordinates
    // ---------------------------------------------------------------------
    bool InBounds(int x, int y) const { return x >= 0 && y >= 0 && x < m_width && y < m_height; }
    // Callers must pass in-bounds coordinates.
    size_t IndexOf(int x, int y) const { return (size_t)y * (size_t)m_width + (size_t)x; }
    void CoordsOf(size_t index, int& out_x, int& out_y) const;

    // ---------------------------------------------------------------------
    // Cell access (all bounds-checked; out-of-range never mutates)
    // ---------------------------------------------------------------------
    std::optional<Cell> Get(int x, int y) const;
    bool Set(int x, int y, const Cell& cell);
    bool SetChar(int x, int y, char32_t ch);
    bool ClearCell(int x, int y);

    // Resets every cell to the default blank.
    void Clear();

    // Writes `ch` into every in-range cell of the normalized rectangle.
    void FillRect(int x1, int y1, int x2, int y2, char32_t ch);

    // Copies the normalized rectangle clipped to the grid, row-major.
    // Empty when the rectangle does not intersect the grid.
    std::vector<Cell> GetRegion(int x1, int y1, int x2, int y2) const;

    // Lossy: keeps the overlapping top-left sub-rectangle.
    void Resize(int width, int height);

    const std::vector<Cell>& Cells() const { return m_cells; }
    void ForEachCell(const std::function<void(int x, int y, const Cell& cell)>& fn) const;

    bool operator==(const Grid& o) const
    {
        return m_width == o.m_width && m_height == o.m_height && m_cells == o.m_cells;
    }
    bool operator!=(const Grid& o) const { return !(*this == o); }

private:
    int m_width = 0;
    int m_height = 0;
    std::vector<Cell> m_cells;
};
} // namespace ink
