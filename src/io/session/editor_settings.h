#pragma once

#include "core/history.h"
#include "core/tools/tool.h"
#include "io/formats/ascii_export.h"

#include <string>
#include <string_view>

// Persisted editor defaults (grid size, undo limit, tool defaults, export options).
//
// Stored as JSON ("schema_version": 1). Loading is forgiving: unknown keys and values of
// the wrong type are ignored and the defaults already in `out` are kept.
namespace ink
{
struct EditorSettings
{
    int grid_width = 80;
    int grid_height = 24;

    // 0 = unlimited.
    size_t undo_limit = History::kDefaultCapacity;

    ToolId default_tool = ToolId::Rectangle;
    BorderStyle border_style = BorderStyle::Single;
    ToolOptions tools;

    formats::ascii::ExportOptions export_options;
};

// "$XDG_CONFIG_HOME/inkgrid", else "$HOME/.config/inkgrid", else ".".
std::string GetInkgridConfigDir();
// "<config_dir>/settings.json"
std::string GetEditorSettingsPath();

// Parses settings JSON from memory into `out` (fields not present keep their value).
bool ParseEditorSettingsJson(std::string_view text, EditorSettings& out, std::string& err);
std::string EditorSettingsToJson(const EditorSettings& settings);

// A missing file is not an error: `out` is left as-is and true is returned.
bool LoadEditorSettingsFromFile(const std::string& path, EditorSettings& out, std::string& err);
// Atomic write (temp file + rename); creates the parent directory.
bool SaveEditorSettingsToFile(const std::string& path, const EditorSettings& settings, std::string& err);
} // namespace ink
