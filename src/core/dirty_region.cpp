#include "core/dirty_region.h"

#include <algorithm>
#include <limits>

namespace ink
{
DirtyRect::DirtyRect()
    : x1(std::numeric_limits<int>::max())
    , y1(std::numeric_limits<int>::max())
    , x2(std::numeric_limits<int>::min())
    , y2(std::numeric_limits<int>::min())
{
}

DirtyRect DirtyRect::Single(int x, int y)
{
    DirtyRect r;
    r.x1 = r.x2 = x;
    r.y1 = r.y2 = y;
    return r;
}

DirtyRect DirtyRect::FromPoints(int ax, int ay, int bx, int by)
{
    DirtyRect r;
    r.x1 = std::min(ax, bx);
    r.y1 = std::min(ay, by);
    r.x2 = std::max(ax, bx);
    r.y2 = std::max(ay, by);
    return r;
}

DirtyRect DirtyRect::Full(int width, int height)
{
    if (width <= 0 || height <= 0)
        return DirtyRect();
    return FromPoints(0, 0, width - 1, height - 1);
}

bool DirtyRect::IsFull(int width, int height) const
{
    if (IsEmpty())
        return false;
    return x1 <= 0 && y1 <= 0 && x2 >= width - 1 && y2 >= height - 1;
}

void DirtyRect::Include(int x, int y)
{
    x1 = std::min(x1, x);
    y1 = std::min(y1, y);
    x2 = std::max(x2, x);
    y2 = std::max(y2, y);
}

void DirtyRect::Union(const DirtyRect& other)
{
    if (other.IsEmpty())
        return;
    if (IsEmpty())
    {
        *this = other;
        return;
    }
    x1 = std::min(x1, other.x1);
    y1 = std::min(y1, other.y1);
    x2 = std::max(x2, other.x2);
    y2 = std::max(y2, other.y2);
}

void DirtyRect::Clamp(int width, int height)
{
    if (IsEmpty())
        return;
    if (width <= 0 || height <= 0)
    {
        *this = DirtyRect();
        return;
    }
    const int nx1 = std::max(x1, 0);
    const int ny1 = std::max(y1, 0);
    const int nx2 = std::min(x2, width - 1);
    const int ny2 = std::min(y2, height - 1);
    if (nx1 > nx2 || ny1 > ny2)
    {
        *this = DirtyRect();
        return;
    }
    x1 = nx1;
    y1 = ny1;
    x2 = nx2;
    y2 = ny2;
}

bool DirtyRect::Contains(int x, int y) const
{
    return !IsEmpty() && x >= x1 && x <= x2 && y >= y1 && y <= y2;
}

void DirtyRect::ForEachCell(const std::function<void(int x, int y)>& fn) const
{
    if (IsEmpty() || !fn)
        return;
    for (int y = y1; y <= y2; ++y)
        for (int x = x1; x <= x2; ++x)
            fn(x, y);
}

void DirtyTracker::Clear()
{
    m_rect = DirtyRect();
    m_full_redraw = false;
}
} // namespace ink
