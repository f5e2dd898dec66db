#include <gtest/gtest.h>

#include "core/tools/select_tool.h"

class SelectToolTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ctx.grid_width = 20;
        ctx.grid_height = 10;
    }

    ink::ToolContext ctx;
    ink::SelectTool tool;
};

// Test dragging out a selection never edits cells
TEST_F(SelectToolTest, DragCreatesSelection)
{
    EXPECT_FALSE(tool.GetSelection().has_value());

    EXPECT_TRUE(tool.OnPointerDown(2, 1, ctx).ops.empty());
    EXPECT_TRUE(tool.IsSelecting());
    EXPECT_TRUE(tool.OnPointerMove(4, 3, ctx).ops.empty());
    ASSERT_TRUE(tool.GetSelection().has_value());
    EXPECT_EQ(*tool.GetSelection(), ink::Selection(2, 1, 4, 3));

    tool.OnPointerMove(6, 5, ctx);
    EXPECT_EQ(*tool.GetSelection(), ink::Selection(2, 1, 6, 5));

    const ink::ToolResult up = tool.OnPointerUp(6, 5, ctx);
    EXPECT_TRUE(up.ops.empty());
    EXPECT_FALSE(up.modified);
    EXPECT_FALSE(up.move.has_value());
    EXPECT_FALSE(tool.IsActive());
    EXPECT_EQ(tool.GetSelection()->Width(), 5);
    EXPECT_EQ(tool.GetSelection()->Height(), 5);
}

// Test dragging from inside the selection reports a move
TEST_F(SelectToolTest, DragInsideMovesSelection)
{
    tool.SetSelection(ink::Selection(2, 2, 5, 4));

    tool.OnPointerDown(3, 3, ctx);
    EXPECT_TRUE(tool.IsMoving());
    // The selection does not follow the pointer until release.
    tool.OnPointerMove(5, 4, ctx);
    EXPECT_EQ(*tool.GetSelection(), ink::Selection(2, 2, 5, 4));

    const ink::ToolResult up = tool.OnPointerUp(6, 4, ctx);
    EXPECT_TRUE(up.finished);
    ASSERT_TRUE(up.move.has_value());
    EXPECT_EQ(up.move->source, ink::Selection(2, 2, 5, 4));
    EXPECT_EQ(up.move->dx, 3);
    EXPECT_EQ(up.move->dy, 1);
    EXPECT_EQ(*tool.GetSelection(), ink::Selection(5, 3, 8, 5));
    EXPECT_FALSE(tool.IsMoving());
}

// Test a click inside the selection without dragging is not a move
TEST_F(SelectToolTest, ClickInsideIsNotMove)
{
    tool.SetSelection(ink::Selection(0, 0, 3, 3));
    tool.OnPointerDown(1, 1, ctx);
    const ink::ToolResult up = tool.OnPointerUp(1, 1, ctx);
    EXPECT_FALSE(up.finished);
    EXPECT_FALSE(up.move.has_value());
    EXPECT_EQ(*tool.GetSelection(), ink::Selection(0, 0, 3, 3));
}

// Test a click outside replaces the selection with a single cell
TEST_F(SelectToolTest, ClickOutsideSelectsSingleCell)
{
    tool.SetSelection(ink::Selection(0, 0, 3, 3));
    tool.OnPointerDown(10, 8, ctx);
    EXPECT_FALSE(tool.GetSelection().has_value());
    tool.OnPointerUp(10, 8, ctx);
    ASSERT_TRUE(tool.GetSelection().has_value());
    EXPECT_TRUE(tool.GetSelection()->IsEmpty());
    EXPECT_EQ(tool.GetSelection()->Area(), 1);
}

// Test selection corners are clamped to the grid
TEST_F(SelectToolTest, ClampsToGrid)
{
    tool.OnPointerDown(-4, -4, ctx);
    tool.OnPointerUp(99, 99, ctx);
    EXPECT_EQ(*tool.GetSelection(), ink::Selection(0, 0, 19, 9));
}

// Test reset drops the selection and any drag
TEST_F(SelectToolTest, ResetDropsSelection)
{
    tool.OnPointerDown(1, 1, ctx);
    tool.OnPointerMove(3, 3, ctx);
    tool.Reset();
    EXPECT_FALSE(tool.IsActive());
    EXPECT_FALSE(tool.GetSelection().has_value());

    tool.SetSelection(std::nullopt);
    EXPECT_FALSE(tool.GetSelection().has_value());
}
