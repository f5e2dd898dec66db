#include <gtest/gtest.h>

#include "core/editor_session.h"
#include "io/session/editor_settings.h"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class EditorSettingsTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        dir = fs::temp_directory_path() / "inkgrid_settings_test";
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
    std::string err;
};

// Test the built-in defaults
TEST_F(EditorSettingsTest, Defaults)
{
    const ink::EditorSettings st;
    EXPECT_EQ(st.grid_width, 80);
    EXPECT_EQ(st.grid_height, 24);
    EXPECT_EQ(st.undo_limit, 100u);
    EXPECT_EQ(st.default_tool, ink::ToolId::Rectangle);
    EXPECT_EQ(st.border_style, ink::BorderStyle::Single);
    EXPECT_EQ(st.tools.freehand_glyph, U'*');
    EXPECT_EQ(st.tools.eraser_size, 1);
    EXPECT_TRUE(st.export_options.trim_borders);
    EXPECT_FALSE(st.export_options.line_numbers);
    EXPECT_EQ(st.export_options.max_width, 0u);
}

// Test every recognized key is read
TEST_F(EditorSettingsTest, ParsesAllKeys)
{
    const char* text = R"({
        "schema_version": 1,
        "grid": {"width": 120, "height": 40},
        "history": {"undo_limit": 0},
        "tools": {"default_tool": "text", "border_style": "rounded",
                  "freehand_glyph": "█", "eraser_size": 3},
        "export": {"trim_borders": false, "line_numbers": true, "max_width": 72}
    })";

    ink::EditorSettings st;
    ASSERT_TRUE(ink::ParseEditorSettingsJson(text, st, err)) << err;
    EXPECT_EQ(st.grid_width, 120);
    EXPECT_EQ(st.grid_height, 40);
    EXPECT_EQ(st.undo_limit, 0u);
    EXPECT_EQ(st.default_tool, ink::ToolId::Text);
    EXPECT_EQ(st.border_style, ink::BorderStyle::Rounded);
    EXPECT_EQ(st.tools.freehand_glyph, (char32_t)0x2588);
    EXPECT_EQ(st.tools.eraser_size, 3);
    EXPECT_FALSE(st.export_options.trim_borders);
    EXPECT_TRUE(st.export_options.line_numbers);
    EXPECT_EQ(st.export_options.max_width, 72u);
}

// Test malformed JSON and non-object roots are errors
TEST_F(EditorSettingsTest, RejectsInvalidDocuments)
{
    ink::EditorSettings st;
    EXPECT_FALSE(ink::ParseEditorSettingsJson("{ not json", st, err));
    EXPECT_FALSE(err.empty());

    EXPECT_FALSE(ink::ParseEditorSettingsJson("[1, 2, 3]", st, err));
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(st.grid_width, 80);
}

// Test values of the wrong type or range keep the defaults
TEST_F(EditorSettingsTest, IgnoresBadValues)
{
    const char* text = R"({
        "grid": {"width": "wide", "height": -3},
        "history": {"undo_limit": -1},
        "tools": {"default_tool": "lasso", "border_style": 7,
                  "freehand_glyph": "ab", "eraser_size": 0},
        "export": {"trim_borders": "yes", "max_width": 1.5},
        "unknown": {"key": true}
    })";

    ink::EditorSettings st;
    ASSERT_TRUE(ink::ParseEditorSettingsJson(text, st, err)) << err;
    EXPECT_EQ(st.grid_width, 80);
    EXPECT_EQ(st.grid_height, 24);
    EXPECT_EQ(st.undo_limit, 100u);
    EXPECT_EQ(st.default_tool, ink::ToolId::Rectangle);
    EXPECT_EQ(st.border_style, ink::BorderStyle::Single);
    EXPECT_EQ(st.tools.freehand_glyph, U'*');
    EXPECT_EQ(st.tools.eraser_size, 1);
    EXPECT_TRUE(st.export_options.trim_borders);
    EXPECT_EQ(st.export_options.max_width, 0u);
}

// Test a document from a newer schema is skipped without failing
TEST_F(EditorSettingsTest, UnknownSchemaKeepsDefaults)
{
    ink::EditorSettings st;
    EXPECT_TRUE(ink::ParseEditorSettingsJson(R"({"schema_version": 9, "grid": {"width": 10}})", st, err));
    EXPECT_EQ(st.grid_width, 80);
}

// Test saving then loading reproduces the settings
TEST_F(EditorSettingsTest, FileRoundTrip)
{
    ink::EditorSettings st;
    st.grid_width = 64;
    st.grid_height = 16;
    st.undo_limit = 25;
    st.default_tool = ink::ToolId::Freehand;
    st.border_style = ink::BorderStyle::Heavy;
    st.tools.freehand_glyph = U'░';
    st.tools.eraser_size = 2;
    st.export_options.line_numbers = true;

    const std::string path = (dir / "nested" / "settings.json").string();
    ASSERT_TRUE(ink::SaveEditorSettingsToFile(path, st, err)) << err;
    EXPECT_TRUE(fs::exists(path));
    EXPECT_FALSE(fs::exists(path + ".tmp"));

    ink::EditorSettings loaded;
    ASSERT_TRUE(ink::LoadEditorSettingsFromFile(path, loaded, err)) << err;
    EXPECT_EQ(loaded.grid_width, 64);
    EXPECT_EQ(loaded.grid_height, 16);
    EXPECT_EQ(loaded.undo_limit, 25u);
    EXPECT_EQ(loaded.default_tool, ink::ToolId::Freehand);
    EXPECT_EQ(loaded.border_style, ink::BorderStyle::Heavy);
    EXPECT_EQ(loaded.tools.freehand_glyph, U'░');
    EXPECT_EQ(loaded.tools.eraser_size, 2);
    EXPECT_TRUE(loaded.export_options.line_numbers);
}

// Test a missing file is a first run, a corrupt one is an error
TEST_F(EditorSettingsTest, LoadMissingAndCorruptFiles)
{
    ink::EditorSettings st;
    EXPECT_TRUE(ink::LoadEditorSettingsFromFile((dir / "absent.json").string(), st, err));
    EXPECT_TRUE(err.empty());
    EXPECT_EQ(st.grid_width, 80);

    fs::create_directories(dir);
    const fs::path bad = dir / "bad.json";
    {
        std::ofstream f(bad);
        f << "{\"grid\": ";
    }
    EXPECT_FALSE(ink::LoadEditorSettingsFromFile(bad.string(), st, err));
    EXPECT_NE(err.find("bad.json"), std::string::npos);
}

// Test the config path ends with the settings file name
TEST_F(EditorSettingsTest, SettingsPath)
{
    const fs::path p(ink::GetEditorSettingsPath());
    EXPECT_EQ(p.filename().string(), "settings.json");
    EXPECT_FALSE(ink::GetInkgridConfigDir().empty());
}

// Test a session built from settings picks up every option
TEST_F(EditorSettingsTest, SessionFromSettings)
{
    ink::EditorSettings st;
    st.grid_width = 12;
    st.grid_height = 6;
    st.undo_limit = 2;
    st.default_tool = ink::ToolId::Freehand;
    st.border_style = ink::BorderStyle::Ascii;
    st.tools.freehand_glyph = U'#';

    ink::EditorSession session(st);
    EXPECT_EQ(session.GetGrid().GetWidth(), 12);
    EXPECT_EQ(session.GetGrid().GetHeight(), 6);
    EXPECT_EQ(session.GetHistory().GetCapacity(), 2u);
    EXPECT_EQ(session.GetToolId(), ink::ToolId::Freehand);
    EXPECT_EQ(session.GetBorderStyle(), ink::BorderStyle::Ascii);

    session.OnPointerDown(0, 0);
    session.OnPointerUp(0, 0);
    EXPECT_EQ(session.ExportAscii(), "#");

    session.SetTool(ink::ToolId::Rectangle);
    session.OnPointerDown(2, 2);
    session.OnPointerUp(4, 4);
    EXPECT_EQ(session.GetGrid().Get(2, 2)->ch, U'+');
}

// Test a session built from settings exports with the saved export options
TEST_F(EditorSettingsTest, SessionExportUsesSettings)
{
    ink::EditorSettings st;
    st.grid_width = 10;
    st.grid_height = 4;
    st.default_tool = ink::ToolId::Freehand;
    st.export_options.line_numbers = true;
    st.export_options.max_width = 8;

    ink::EditorSession session(st);
    EXPECT_TRUE(session.GetExportOptions().line_numbers);

    session.OnPointerDown(0, 1);
    session.OnPointerMove(4, 1);
    session.OnPointerUp(4, 1);
    EXPECT_EQ(session.ExportAscii(), "   2 | *");

    // Explicit options still override.
    EXPECT_EQ(session.ExportAscii(formats::ascii::ExportOptions{}), "*****");

    formats::ascii::ExportOptions plain_numbers;
    plain_numbers.line_numbers = true;
    session.SetExportOptions(plain_numbers);
    EXPECT_EQ(session.ExportAscii(), "   2 | *****");
}
