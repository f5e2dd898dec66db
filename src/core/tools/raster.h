#pragma once

#include <vector>

namespace ink
{
struct GridPoint
{
    int x = 0;
    int y = 0;

    bool operator==(const GridPoint& o) const { return x == o.x && y == o.y; }
    bool operator!=(const GridPoint& o) const { return !(*this == o); }
};

// Cells of the straight segment (x1,y1)-(x2,y2), both ends included, in start->end order.
//
// Integer Bresenham. The walk always starts from the lexicographically smaller endpoint
// (then gets reversed if needed), so A->B and B->A cover exactly the same cells.
std::vector<GridPoint> RasterizeLine(int x1, int y1, int x2, int y2);

inline int Sign(int v)
{
    return (v > 0) - (v < 0);
}
} // namespace ink
