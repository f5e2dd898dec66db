// Bounded undo/redo log of applied commands.
//
// Push() clears the redo stack and evicts the oldest undo entry once the limit is
// reached; eviction is silent (the user simply cannot undo further).

#pragma once

#include "core/commands/command.h"

#include <deque>
#include <optional>
#include <string>

namespace ink
{
class History
{
public:
    static constexpr size_t kDefaultCapacity = 100;

    // 0 = unlimited.
    explicit History(size_t capacity = kDefaultCapacity) : m_capacity(capacity) {}

    // `command` must already be applied to the grid.
    void Push(CommandPtr command);

    // Returns false when there is nothing to undo/redo.
    bool Undo(Grid& grid);
    bool Redo(Grid& grid);

    bool CanUndo() const { return !m_undo.empty(); }
    bool CanRedo() const { return !m_redo.empty(); }
    size_t UndoCount() const { return m_undo.size(); }
    size_t RedoCount() const { return m_redo.size(); }

    std::optional<std::string> UndoDescription() const;
    std::optional<std::string> RedoDescription() const;

    // Newest entries, or nullptr when empty.
    const Command* PeekUndo() const { return m_undo.empty() ? nullptr : m_undo.back().get(); }
    const Command* PeekRedo() const { return m_redo.empty() ? nullptr : m_redo.back().get(); }

    void Clear();

    size_t GetCapacity() const { return m_capacity; }
    // Shrinking trims the oldest entries of both stacks.
    void SetCapacity(size_t capacity);

private:
    void TrimToCapacity(std::deque<CommandPtr>& stack);

    std::deque<CommandPtr> m_undo;
    std::deque<CommandPtr> m_redo;
    size_t m_capacity = kDefaultCapacity;
};
} // namespace ink
