#pragma once

#include "core/commands/command.h"

#include <string>
#include <vector>

namespace ink
{
// Ordered group of commands applied and undone as one unit.
class CompositeCommand : public Command
{
public:
    explicit CompositeCommand(std::string description = "Composite");

    // Children added after Apply() are not applied retroactively.
    void Add(CommandPtr child);
    size_t GetChildCount() const { return m_children.size(); }
    bool IsEmpty() const { return m_children.empty(); }

    void Apply(Grid& grid) override;
    void Undo(Grid& grid) override;
    std::string Description() const override { return m_description; }

private:
    std::vector<CommandPtr> m_children;
    std::string m_description;
};
} // namespace ink
