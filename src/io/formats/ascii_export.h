#pragma once

#include "core/grid.h"

#include <cstddef>
#include <optional>
#include <string>

// ASCII export: the grid's visible content as UTF-8 text.
//
// Output uses '\n' between rows and never ends with a newline. ASCII controls stored in
// cells (< 0x20) are written as spaces.
namespace formats
{
namespace ascii
{
struct ExportOptions
{
    // Only emit the tight box around visible content, with trailing spaces stripped per row.
    // If false, every row and column is written verbatim.
    bool trim_borders = true;

    // Prefix each row with its 1-based grid row: "%4d | ".
    bool line_numbers = false;

    // Hard per-line limit in codepoints (prefix included). 0 = unlimited.
    size_t max_width = 0;
};

// Tight bounding box of visible (non-whitespace) cells; empty if there are none.
std::optional<ink::CellBounds> FindContentBounds(const ink::Grid& grid);

std::string ExportGrid(const ink::Grid& grid, const ExportOptions& options = {});

// Normalized, clamped region; trailing spaces are stripped from each row.
std::string ExportRegion(const ink::Grid& grid, int x1, int y1, int x2, int y2);

// Number of visible cells.
size_t CountContent(const ink::Grid& grid);

bool ExportGridToFile(const std::string& path,
                      const ink::Grid& grid,
                      std::string& err,
                      const ExportOptions& options = {});
} // namespace ascii
} // namespace formats
