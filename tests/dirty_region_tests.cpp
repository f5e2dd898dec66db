#include <gtest/gtest.h>

#include "core/dirty_region.h"

using ink::DirtyRect;
using ink::DirtyTracker;

// Test a fresh tracker is conservatively "full"
TEST(DirtyTrackerTest, FreshTrackerNeedsFullRedraw)
{
    DirtyTracker t;
    EXPECT_TRUE(t.GetDirtyRect().IsEmpty());
    EXPECT_FALSE(t.FullRedrawRequested());
    EXPECT_TRUE(t.NeedsFullRedraw());
}

// Test marks grow the bounding rectangle
TEST(DirtyTrackerTest, MarksGrowBoundingRect)
{
    DirtyTracker t;
    t.MarkDirty(2, 3);
    t.MarkDirty(5, 1);
    EXPECT_FALSE(t.NeedsFullRedraw());
    EXPECT_EQ(t.GetDirtyRect(), DirtyRect::FromPoints(2, 1, 5, 3));
    EXPECT_EQ(t.GetDirtyRect().Width(), 4);
    EXPECT_EQ(t.GetDirtyRect().Height(), 3);
    EXPECT_EQ(t.GetDirtyRect().Area(), 12);

    t.MarkRegionDirty(DirtyRect::FromPoints(8, 8, 7, 0));
    EXPECT_EQ(t.GetDirtyRect(), DirtyRect::FromPoints(2, 0, 8, 8));
}

// Test the full-redraw flag is sticky until cleared
TEST(DirtyTrackerTest, FullRedrawIsSticky)
{
    DirtyTracker t;
    t.RequestFullRedraw();
    t.MarkDirty(1, 1);
    t.MarkRegionDirty(DirtyRect::Single(4, 4));
    EXPECT_TRUE(t.NeedsFullRedraw());

    t.Clear();
    EXPECT_FALSE(t.FullRedrawRequested());
    EXPECT_TRUE(t.GetDirtyRect().IsEmpty());
}

// Test union with empty operands
TEST(DirtyRectTest, UnionWithEmpty)
{
    DirtyRect r = DirtyRect::Single(3, 3);
    r.Union(DirtyRect::Empty());
    EXPECT_EQ(r, DirtyRect::Single(3, 3));

    DirtyRect e;
    e.Union(DirtyRect::FromPoints(1, 2, 3, 4));
    EXPECT_EQ(e, DirtyRect::FromPoints(1, 2, 3, 4));
    EXPECT_EQ(DirtyRect().Area(), 0);
    EXPECT_EQ(DirtyRect().Width(), 0);
}

// Test clamping and full detection
TEST(DirtyRectTest, ClampAndFull)
{
    DirtyRect r = DirtyRect::FromPoints(-3, -3, 20, 2);
    r.Clamp(10, 5);
    EXPECT_EQ(r, DirtyRect::FromPoints(0, 0, 9, 2));
    EXPECT_FALSE(r.IsFull(10, 5));

    EXPECT_TRUE(DirtyRect::Full(10, 5).IsFull(10, 5));
    EXPECT_TRUE(DirtyRect::Full(0, 5).IsEmpty());

    DirtyRect outside = DirtyRect::FromPoints(12, 12, 15, 15);
    outside.Clamp(10, 5);
    EXPECT_TRUE(outside.IsEmpty());
}

// Test containment and iteration
TEST(DirtyRectTest, ContainsAndIterates)
{
    const DirtyRect r = DirtyRect::FromPoints(1, 1, 3, 2);
    EXPECT_TRUE(r.Contains(1, 1));
    EXPECT_TRUE(r.Contains(3, 2));
    EXPECT_FALSE(r.Contains(0, 1));
    EXPECT_FALSE(DirtyRect().Contains(0, 0));

    int visited = 0;
    r.ForEachCell([&](int x, int y) {
        EXPECT_TRUE(r.Contains(x, y));
        ++visited;
    });
    EXPECT_EQ(visited, 6);
}
