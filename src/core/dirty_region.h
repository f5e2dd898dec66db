// Dirty-region bookkeeping for incremental redraw.
//
// The tracker accumulates the bounding union of every cell touched since the host
// last drained it. A sticky "full redraw" flag supersedes the rectangle.

#pragma once

#include <functional>

namespace ink
{
// Inclusive rectangle of dirty cells. The empty rect uses inverted sentinels so that
// Include()/Union() can grow it with plain min/max.
struct DirtyRect
{
    int x1;
    int y1;
    int x2;
    int y2;

    DirtyRect();

    static DirtyRect Empty() { return DirtyRect(); }
    static DirtyRect Single(int x, int y);
    static DirtyRect FromPoints(int ax, int ay, int bx, int by);
    static DirtyRect Full(int width, int height);

    bool IsEmpty() const { return x1 > x2 || y1 > y2; }
    bool IsFull(int width, int height) const;

    int Width() const { return IsEmpty() ? 0 : x2 - x1 + 1; }
    int Height() const { return IsEmpty() ? 0 : y2 - y1 + 1; }
    long long Area() const { return (long long)Width() * (long long)Height(); }

    void Include(int x, int y);
    void Union(const DirtyRect& other);
    // Intersects with [0,width-1]x[0,height-1]; may become empty.
    void Clamp(int width, int height);
    bool Contains(int x, int y) const;

    void ForEachCell(const std::function<void(int x, int y)>& fn) const;

    bool operator==(const DirtyRect& o) const { return x1 == o.x1 && y1 == o.y1 && x2 == o.x2 && y2 == o.y2; }
    bool operator!=(const DirtyRect& o) const { return !(*this == o); }
};

class DirtyTracker
{
public:
    void MarkDirty(int x, int y) { m_rect.Include(x, y); }
    void MarkRegionDirty(const DirtyRect& rect) { m_rect.Union(rect); }
    void RequestFullRedraw() { m_full_redraw = true; }

    // An empty rect with no explicit request also counts as "full": the initial,
    // never-rendered state is treated conservatively.
    bool NeedsFullRedraw() const { return m_full_redraw || m_rect.IsEmpty(); }
    bool FullRedrawRequested() const { return m_full_redraw; }
    const DirtyRect& GetDirtyRect() const { return m_rect; }

    void Clear();

private:
    DirtyRect m_rect;
    bool m_full_redraw = false;
};
} // namespace ink
