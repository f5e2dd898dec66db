#include "core/grid.h"

#include <algorithm>
#include <utility>

namespace ink
{
Grid::Grid(int width, int height)
    : m_width(std::max(0, width))
    , m_height(std::max(0, height))
    , m_cells((size_t)m_width * (size_t)m_height)
{
}

std::optional<Grid> Grid::FromCells(std::vector<Cell> cells, int width, int height)
{
    if (width < 0 || height < 0)
        return std::nullopt;
    if (cells.size() != (size_t)width * (size_t)height)
        return std::nullopt;
    Grid g;
    g.m_width = width;
    g.m_height = height;
    g.m_cells = std::move(cells);
    return g;
}

void Grid::CoordsOf(size_t index, int& out_x, int& out_y) const
{
    if (m_width <= 0)
    {
        out_x = 0;
        out_y = 0;
        return;
    }
    out_x = (int)(index % (size_t)m_width);
    out_y = (int)(index / (size_t)m_width);
}

std::optional<Cell> Grid::Get(int x, int y) const
{
    if (!InBounds(x, y))
        return std::nullopt;
    return m_cells[IndexOf(x, y)];
}

bool Grid::Set(int x, int y, const Cell& cell)
{
    if (!InBounds(x, y))
        return false;
    m_cells[IndexOf(x, y)] = cell;
    return true;
}

bool Grid::SetChar(int x, int y, char32_t ch)
{
    if (!InBounds(x, y))
        return false;
    m_cells[IndexOf(x, y)].SetChar(ch);
    return true;
}

bool Grid::ClearCell(int x, int y)
{
    if (!InBounds(x, y))
        return false;
    m_cells[IndexOf(x, y)].Clear();
    return true;
}

void Grid::Clear()
{
    for (Cell& c : m_cells)
        c.Clear();
}

void Grid::FillRect(int x1, int y1, int x2, int y2, char32_t ch)
{
    const int min_x = std::min(x1, x2);
    const int max_x = std::max(x1, x2);
    const int min_y = std::min(y1, y2);
    const int max_y = std::max(y1, y2);

    // Clip up front; per-cell SetChar would reject the rest anyway.
    const int cx0 = std::max(min_x, 0);
    const int cy0 = std::max(min_y, 0);
    const int cx1 = std::min(max_x, m_width - 1);
    const int cy1 = std::min(max_y, m_height - 1);
    for (int y = cy0; y <= cy1; ++y)
        for (int x = cx0; x <= cx1; ++x)
            SetChar(x, y, ch);
}

std::vector<Cell> Grid::GetRegion(int x1, int y1, int x2, int y2) const
{
    std::vector<Cell> out;
    const int min_x = std::max(std::min(x1, x2), 0);
    const int min_y = std::max(std::min(y1, y2), 0);
    const int max_x = std::min(std::max(x1, x2), m_width - 1);
    const int max_y = std::min(std::max(y1, y2), m_height - 1);
    if (min_x > max_x || min_y > max_y)
        return out;

    out.reserve((size_t)(max_x - min_x + 1) * (size_t)(max_y - min_y + 1));
    for (int y = min_y; y <= max_y; ++y)
        for (int x = min_x; x <= max_x; ++x)
            out.push_back(m_cells[IndexOf(x, y)]);
    return out;
}

void Grid::Resize(int width, int height)
{
    width = std::max(0, width);
    height = std::max(0, height);
    if (width == m_width && height == m_height)
        return;

    std::vector<Cell> next((size_t)width * (size_t)height);
    const int copy_w = std::min(width, m_width);
    const int copy_h = std::min(height, m_height);
    for (int y = 0; y < copy_h; ++y)
    {
        const size_t src = (size_t)y * (size_t)m_width;
        const size_t dst = (size_t)y * (size_t)width;
        std::copy(m_cells.begin() + (std::ptrdiff_t)src,
                  m_cells.begin() + (std::ptrdiff_t)(src + (size_t)copy_w),
                  next.begin() + (std::ptrdiff_t)dst);
    }

    m_cells = std::move(next);
    m_width = width;
    m_height = height;
}

void Grid::ForEachCell(const std::function<void(int x, int y, const Cell& cell)>& fn) const
{
    if (!fn)
        return;
    for (size_t i = 0; i < m_cells.size(); ++i)
    {
        int x = 0;
        int y = 0;
        CoordsOf(i, x, y);
        fn(x, y, m_cells[i]);
    }
}
} // namespace ink
