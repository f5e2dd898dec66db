#pragma once

#include "core/commands/command.h"
#include "core/draw_op.h"

namespace ink
{
// Batch of DrawOps committed as one history entry.
//
// Apply captures each target cell immediately before writing it, in op order; Undo
// restores those captures in reverse. Ops hitting the same cell twice therefore
// round-trip correctly. Out-of-range ops are skipped (nothing captured).
class DrawCommand : public Command
{
public:
    // Combined op count must stay strictly below this for two batches to merge.
    static constexpr size_t kMaxMergedOps = 1000;

    explicit DrawCommand(DrawOps ops);

    void Apply(Grid& grid) override;
    void Undo(Grid& grid) override;
    std::string Description() const override { return m_description; }

    const DrawOps& GetOps() const { return m_ops; }
    size_t GetOpCount() const { return m_ops.size(); }
    bool IsEmpty() const { return m_ops.empty(); }

    // Only unapplied batches accept more ops.
    bool CanMerge(const DrawCommand& other) const;
    void Merge(const DrawCommand& other);

private:
    struct Previous
    {
        int x = 0;
        int y = 0;
        Cell cell;
    };

    void RefreshDescription();

    DrawOps m_ops;
    std::vector<Previous> m_previous;
    std::string m_description;
};
} // namespace ink
