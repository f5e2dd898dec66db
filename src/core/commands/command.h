// Reversible edits applied to an ink::Grid.
//
// A command starts unapplied, becomes applied on Apply() and unapplied again on Undo().
// The cells it overwrites are captured at Apply() time, never at construction, so a
// command can be built before the grid state it will replace is known.
// Apply() on an applied command and Undo() on an unapplied one do nothing.

#pragma once

#include "core/cell.h"
#include "core/grid.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ink
{
enum class CommandKind : std::uint8_t
{
    SetCell = 0,
    ClearCell,
    ClearGrid,
    DrawBatch,
    Composite,
    Resize,
};

class Command
{
public:
    explicit Command(CommandKind kind) : m_kind(kind) {}
    virtual ~Command() = default;

    Command(const Command&) = delete;
    Command& operator=(const Command&) = delete;

    CommandKind Kind() const { return m_kind; }
    bool IsApplied() const { return m_applied; }

    virtual void Apply(Grid& grid) = 0;
    virtual void Undo(Grid& grid) = 0;
    // Short user-facing label ("Draw 12 cells", "Clear canvas", ...).
    virtual std::string Description() const = 0;

protected:
    bool m_applied = false;

private:
    CommandKind m_kind;
};

using CommandPtr = std::unique_ptr<Command>;

// Merging is only defined between two DrawBatch commands; every other pairing
// (including mixed kinds) is refused from the kind tags alone.
bool CanMergeCommands(const Command& into, const Command& next);
// Appends `next` into `into`. Returns false (nothing changes) when CanMergeCommands() is false.
bool MergeCommands(Command& into, const Command& next);

// ---------------------------------------------------------------------------
// Single-cell commands
// ---------------------------------------------------------------------------

class SetCellCommand : public Command
{
public:
    SetCellCommand(int x, int y, const Cell& cell)
        : Command(CommandKind::SetCell), m_x(x), m_y(y), m_cell(cell) {}

    void Apply(Grid& grid) override;
    void Undo(Grid& grid) override;
    std::string Description() const override { return "Set cell"; }

private:
    int m_x = 0;
    int m_y = 0;
    Cell m_cell;
    // Empty when the target was out of range at apply time (undo then does nothing).
    std::optional<Cell> m_previous;
};

class ClearCellCommand : public Command
{
public:
    ClearCellCommand(int x, int y) : Command(CommandKind::ClearCell), m_x(x), m_y(y) {}

    void Apply(Grid& grid) override;
    void Undo(Grid& grid) override;
    std::string Description() const override { return "Clear cell"; }

private:
    int m_x = 0;
    int m_y = 0;
    std::optional<Cell> m_previous;
};

// ---------------------------------------------------------------------------
// Whole-grid commands
// ---------------------------------------------------------------------------

// Snapshot of the full backing store plus its dimensions.
struct GridSnapshot
{
    std::vector<Cell> cells;
    int width = 0;
    int height = 0;

    static GridSnapshot Capture(const Grid& grid);
    // Consumes `cells`. Empty if the snapshot is inconsistent.
    std::optional<Grid> Restore();
};

// Undo restores the snapshot only while the live grid still has the snapshot's
// dimensions; otherwise the grid is left alone (the command still becomes unapplied).
class ClearGridCommand : public Command
{
public:
    ClearGridCommand() : Command(CommandKind::ClearGrid) {}

    void Apply(Grid& grid) override;
    void Undo(Grid& grid) override;
    std::string Description() const override { return "Clear canvas"; }

private:
    GridSnapshot m_snapshot;
};

class ResizeCommand : public Command
{
public:
    ResizeCommand(int width, int height) : Command(CommandKind::Resize), m_width(width), m_height(height) {}

    void Apply(Grid& grid) override;
    void Undo(Grid& grid) override;
    std::string Description() const override;

private:
    int m_width = 0;
    int m_height = 0;
    GridSnapshot m_snapshot;
};
} // namespace ink
