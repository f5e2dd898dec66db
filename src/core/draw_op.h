#pragma once

#include "core/cell.h"

#include <vector>

namespace ink
{
// A pending (position, cell) write. Tools produce them, commands consume them.
struct DrawOp
{
    int x = 0;
    int y = 0;
    Cell cell;

    DrawOp() = default;
    DrawOp(int x_, int y_, const Cell& c) : x(x_), y(y_), cell(c) {}

    bool operator==(const DrawOp& o) const { return x == o.x && y == o.y && cell == o.cell; }
    bool operator!=(const DrawOp& o) const { return !(*this == o); }
};

using DrawOps = std::vector<DrawOp>;
} // namespace ink
