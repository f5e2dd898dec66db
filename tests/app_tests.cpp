#include <gtest/gtest.h>

#include "app/clipboard_text.h"
#include "app/session_log.h"
#include "core/editor_session.h"

#include <cstdio>
#include <string>

namespace
{
std::string ReadAll(std::FILE* f)
{
    std::string out;
    std::rewind(f);
    char buf[256];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0)
        out.append(buf, n);
    return out;
}
} // namespace

// Test the session log writes one tagged line per event
TEST(SessionLogTest, WritesTaggedLines)
{
    std::FILE* f = std::tmpfile();
    ASSERT_NE(f, nullptr);
    {
        app::SessionLog log(f);
        ink::EditorSession session(10, 4);
        session.SetObserver(&log);

        session.SetTool(ink::ToolId::Line);
        session.OnPointerDown(0, 0);
        session.OnPointerUp(2, 0);
        session.Undo();
        session.SelectAll();
        session.CopySelection();
        session.Resize(5, 2);
        session.SetObserver(nullptr);
    }

    const std::string text = ReadAll(f);
    std::fclose(f);

    EXPECT_NE(text.find("[tool] Rectangle -> Line\n"), std::string::npos);
    EXPECT_NE(text.find("[history] push: Draw 3 cells (undo=1 redo=0)\n"), std::string::npos);
    EXPECT_NE(text.find("[history] undo: Draw 3 cells\n"), std::string::npos);
    EXPECT_NE(text.find("[selection] 0,0 10x4\n"), std::string::npos);
    EXPECT_NE(text.find("[clipboard] captured 10x4 (40 cells)\n"), std::string::npos);
    EXPECT_NE(text.find("[selection] cleared\n"), std::string::npos);
    EXPECT_NE(text.find("[grid] resized to 5x2\n"), std::string::npos);
}

// Test a null stream silences the log
TEST(SessionLogTest, NullStreamIsSilent)
{
    app::SessionLog log(nullptr);
    ink::EditorSession session(4, 4);
    session.SetObserver(&log);
    session.SetTool(ink::ToolId::Text);
    session.Reset();
    EXPECT_FALSE(session.GetHistory().CanUndo());
}

class ClipboardTextTest : public ::testing::Test
{
protected:
    ink::EditorSession session{12, 4};
};

// Test pasting text with mixed line endings
TEST_F(ClipboardTextTest, PasteLineEndings)
{
    EXPECT_TRUE(app::PasteUtf8Text(session, "ab\r\ncd\ref\n", 1, 0));
    EXPECT_EQ(session.ExportAscii(), "ab\ncd\nef");
    EXPECT_EQ(session.GetGrid().Get(1, 0)->ch, U'a');
    EXPECT_EQ(session.GetHistory().UndoCount(), 1u);

    // Same text again changes nothing.
    EXPECT_FALSE(app::PasteUtf8Text(session, "ab\r\ncd\ref\n", 1, 0));
    EXPECT_FALSE(app::PasteUtf8Text(session, "", 0, 0));
}

// Test tabs expand to 8-column stops and controls are dropped
TEST_F(ClipboardTextTest, PasteTabsAndControls)
{
    EXPECT_TRUE(app::PasteUtf8Text(session, "a\tb\x01" "c", 0, 0));
    EXPECT_EQ(session.GetGrid().Get(0, 0)->ch, U'a');
    EXPECT_EQ(session.GetGrid().Get(8, 0)->ch, U'b');
    EXPECT_EQ(session.GetGrid().Get(9, 0)->ch, U'c');
}

// Test text is clipped at the grid edge and UTF-8 is decoded
TEST_F(ClipboardTextTest, PasteClipsAndDecodes)
{
    EXPECT_TRUE(app::PasteUtf8Text(session, "\xE2\x94\x80\xE2\x94\x80\xE2\x94\x80", 10, 3));
    EXPECT_EQ(session.GetGrid().Get(10, 3)->ch, U'─');
    EXPECT_EQ(session.GetGrid().Get(11, 3)->ch, U'─');
}

// Test paste goes to the selection's top-left when there is one
TEST_F(ClipboardTextTest, PasteAtSelection)
{
    session.SetTool(ink::ToolId::Select);
    session.SetSelection(ink::Selection(6, 2, 4, 1));
    EXPECT_TRUE(app::PasteUtf8Text(session, "hi", 0, 0));
    EXPECT_EQ(session.GetGrid().Get(4, 1)->ch, U'h');
    EXPECT_EQ(session.GetGrid().Get(0, 0)->ch, U' ');
}

// Test the selection is copied out as text
TEST_F(ClipboardTextTest, SelectionToText)
{
    std::string text;
    EXPECT_FALSE(app::SelectionToUtf8Text(session, text));
    EXPECT_TRUE(text.empty());

    ASSERT_TRUE(app::PasteUtf8Text(session, "one\n two", 0, 0));
    session.SelectAll();
    EXPECT_TRUE(app::SelectionToUtf8Text(session, text));
    EXPECT_EQ(text, "one\n two\n\n");
}
