#include "core/commands/composite_command.h"

#include <utility>

namespace ink
{
CompositeCommand::CompositeCommand(std::string description)
    : Command(CommandKind::Composite), m_description(std::move(description))
{
}

void CompositeCommand::Add(CommandPtr child)
{
    if (child)
        m_children.push_back(std::move(child));
}

void CompositeCommand::Apply(Grid& grid)
{
    if (m_applied)
        return;
    for (CommandPtr& c : m_children)
        c->Apply(grid);
    m_applied = true;
}

void CompositeCommand::Undo(Grid& grid)
{
    if (!m_applied)
        return;
    for (auto it = m_children.rbegin(); it != m_children.rend(); ++it)
        (*it)->Undo(grid);
    m_applied = false;
}
} // namespace ink
