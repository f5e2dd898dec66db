#include "core/history.h"

#include <utility>

namespace ink
{
void History::TrimToCapacity(std::deque<CommandPtr>& stack)
{
    if (m_capacity == 0)
        return;
    while (stack.size() > m_capacity)
        stack.pop_front();
}

void History::Push(CommandPtr command)
{
    if (!command)
        return;
    m_redo.clear();
    if (m_capacity > 0 && m_undo.size() >= m_capacity)
        m_undo.pop_front();
    m_undo.push_back(std::move(command));
}

bool History::Undo(Grid& grid)
{
    if (m_undo.empty())
        return false;
    CommandPtr cmd = std::move(m_undo.back());
    m_undo.pop_back();
    cmd->Undo(grid);
    m_redo.push_back(std::move(cmd));
    TrimToCapacity(m_redo);
    return true;
}

bool History::Redo(Grid& grid)
{
    if (m_redo.empty())
        return false;
    CommandPtr cmd = std::move(m_redo.back());
    m_redo.pop_back();
    cmd->Apply(grid);
    m_undo.push_back(std::move(cmd));
    TrimToCapacity(m_undo);
    return true;
}

std::optional<std::string> History::UndoDescription() const
{
    if (m_undo.empty())
        return std::nullopt;
    return m_undo.back()->Description();
}

std::optional<std::string> History::RedoDescription() const
{
    if (m_redo.empty())
        return std::nullopt;
    return m_redo.back()->Description();
}

void History::Clear()
{
    m_undo.clear();
    m_redo.clear();
}

void History::SetCapacity(size_t capacity)
{
    m_capacity = capacity;
    TrimToCapacity(m_undo);
    TrimToCapacity(m_redo);
}
} // namespace ink
