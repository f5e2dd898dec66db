#include "io/session/editor_settings.h"

#include "core/utf8.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ink
{
static constexpr int kSchemaVersion = 1;

static std::string EnvOrEmpty(const char* name)
{
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}

std::string GetInkgridConfigDir()
{
    const std::string xdg = EnvOrEmpty("XDG_CONFIG_HOME");
    if (!xdg.empty())
        return xdg + "/inkgrid";

    const std::string home = EnvOrEmpty("HOME");
    if (!home.empty())
        return home + "/.config/inkgrid";

    return ".";
}

std::string GetEditorSettingsPath()
{
    return (fs::path(GetInkgridConfigDir()) / "settings.json").string();
}

static json ToJson(const EditorSettings& st)
{
    json j;
    j["schema_version"] = kSchemaVersion;

    json grid;
    grid["width"] = st.grid_width;
    grid["height"] = st.grid_height;
    j["grid"] = std::move(grid);

    json history;
    history["undo_limit"] = st.undo_limit;
    j["history"] = std::move(history);

    json tools;
    tools["default_tool"] = std::string(ToolName(st.default_tool));
    tools["border_style"] = std::string(BorderStyleName(st.border_style));
    tools["freehand_glyph"] = utf8::Encode(st.tools.freehand_glyph);
    tools["eraser_size"] = st.tools.eraser_size;
    j["tools"] = std::move(tools);

    json ex;
    ex["trim_borders"] = st.export_options.trim_borders;
    ex["line_numbers"] = st.export_options.line_numbers;
    ex["max_width"] = st.export_options.max_width;
    j["export"] = std::move(ex);

    return j;
}

static void FromJson(const json& j, EditorSettings& out)
{
    // Defaults are already in out; only override what we recognize.
    if (j.contains("grid") && j["grid"].is_object())
    {
        const json& g = j["grid"];
        if (g.contains("width") && g["width"].is_number_integer() && g["width"].get<int>() > 0)
            out.grid_width = g["width"].get<int>();
        if (g.contains("height") && g["height"].is_number_integer() && g["height"].get<int>() > 0)
            out.grid_height = g["height"].get<int>();
    }

    if (j.contains("history") && j["history"].is_object())
    {
        const json& h = j["history"];
        if (h.contains("undo_limit") && h["undo_limit"].is_number_unsigned())
            out.undo_limit = h["undo_limit"].get<size_t>();
    }

    if (j.contains("tools") && j["tools"].is_object())
    {
        const json& t = j["tools"];
        if (t.contains("default_tool") && t["default_tool"].is_string())
        {
            if (const std::optional<ToolId> id = ParseToolId(t["default_tool"].get<std::string>()))
                out.default_tool = *id;
        }
        if (t.contains("border_style") && t["border_style"].is_string())
        {
            if (const std::optional<BorderStyle> s = ParseBorderStyle(t["border_style"].get<std::string>()))
                out.border_style = *s;
        }
        if (t.contains("freehand_glyph") && t["freehand_glyph"].is_string())
        {
            char32_t cp = 0;
            if (utf8::DecodeSingle(t["freehand_glyph"].get<std::string>(), cp) && cp >= 0x20)
                out.tools.freehand_glyph = cp;
        }
        if (t.contains("eraser_size") && t["eraser_size"].is_number_integer() && t["eraser_size"].get<int>() >= 1)
            out.tools.eraser_size = t["eraser_size"].get<int>();
    }

    if (j.contains("export") && j["export"].is_object())
    {
        const json& e = j["export"];
        if (e.contains("trim_borders") && e["trim_borders"].is_boolean())
            out.export_options.trim_borders = e["trim_borders"].get<bool>();
        if (e.contains("line_numbers") && e["line_numbers"].is_boolean())
            out.export_options.line_numbers = e["line_numbers"].get<bool>();
        if (e.contains("max_width") && e["max_width"].is_number_unsigned())
            out.export_options.max_width = e["max_width"].get<size_t>();
    }
}

// Unknown schema versions are skipped rather than failing startup.
static bool IsKnownSchema(const json& j)
{
    if (!j.contains("schema_version"))
        return true;
    if (!j["schema_version"].is_number_integer())
        return false;
    return j["schema_version"].get<int>() == kSchemaVersion;
}

bool ParseEditorSettingsJson(std::string_view text, EditorSettings& out, std::string& err)
{
    err.clear();
    json j;
    try
    {
        j = json::parse(text.begin(), text.end());
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to parse settings: ") + e.what();
        return false;
    }

    if (!j.is_object())
    {
        err = "Settings root must be a JSON object.";
        return false;
    }
    if (!IsKnownSchema(j))
        return true;

    try
    {
        FromJson(j, out);
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to read settings: ") + e.what();
        return false;
    }
    return true;
}

std::string EditorSettingsToJson(const EditorSettings& settings)
{
    return ToJson(settings).dump(2);
}

bool LoadEditorSettingsFromFile(const std::string& path, EditorSettings& out, std::string& err)
{
    err.clear();

    std::ifstream f(path, std::ios::binary);
    if (!f)
    {
        std::error_code ec;
        const bool exists = fs::exists(path, ec);
        if (exists && !ec)
        {
            err = std::string("Failed to open settings file for reading: ") + path;
            return false;
        }
        return true; // first run; keep defaults
    }

    std::ostringstream ss;
    ss << f.rdbuf();
    if (!ParseEditorSettingsJson(ss.str(), out, err))
    {
        err = path + ": " + err;
        return false;
    }
    return true;
}

bool SaveEditorSettingsToFile(const std::string& path, const EditorSettings& settings, std::string& err)
{
    err.clear();

    try
    {
        const fs::path p(path);
        if (p.has_parent_path())
            fs::create_directories(p.parent_path());
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to create config directory: ") + e.what();
        return false;
    }

    const std::string tmp_path = path + ".tmp";
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        err = "Failed to open temp settings file for writing.";
        return false;
    }

    try
    {
        out << ToJson(settings).dump(2) << "\n";
    }
    catch (const std::exception& e)
    {
        err = std::string("Failed to write settings: ") + e.what();
        return false;
    }

    out.close();
    if (!out)
    {
        err = "Failed to finalize settings temp file write.";
        return false;
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec)
    {
        err = std::string("Failed to atomically replace settings file: ") + ec.message();
        std::error_code rm_ec;
        fs::remove(tmp_path, rm_ec);
        return false;
    }
    return true;
}
} // namespace ink
