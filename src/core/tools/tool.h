// Drawing tool interface.
//
// Every tool is a small state machine driven by pointer and key events already
// converted to grid coordinates. Tools never touch the grid: they return DrawOps
// and the session decides whether those ops are a live preview or get committed.

#pragma once

#include "core/draw_op.h"
#include "core/selection.h"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace ink
{
enum class ToolId : std::uint8_t
{
    Rectangle = 0,
    Line,
    Arrow,
    Diamond,
    Text,
    Freehand,
    Select,
    Eraser,
};

// All tool ids in toolbar order.
const std::vector<ToolId>& AllToolIds();

// Display name ("Rectangle", "Line", ...).
std::string_view ToolName(ToolId id);
// Single-key shortcut, uppercase ('R', 'L', ...).
char ToolShortcut(ToolId id);
// Case-insensitive lookup of a shortcut letter.
std::optional<ToolId> ToolIdFromShortcut(char32_t key);
// Accepts the full name, the shortcut letter or "rect"; case-insensitive.
std::optional<ToolId> ParseToolId(std::string_view name);

// ---------------------------------------------------------------------------
// Border styles (rectangle tool)
// ---------------------------------------------------------------------------
enum class BorderStyle : std::uint8_t
{
    Single = 0,
    Double,
    Heavy,
    Rounded,
    Ascii,
    Dotted,
};

struct BorderGlyphs
{
    char32_t top_left = U'┌';
    char32_t top_right = U'┐';
    char32_t bottom_left = U'└';
    char32_t bottom_right = U'┘';
    char32_t horizontal = U'─';
    char32_t vertical = U'│';
};

BorderGlyphs GetBorderGlyphs(BorderStyle style);
std::string_view BorderStyleName(BorderStyle style); // lowercase ("single", ...)
std::optional<BorderStyle> ParseBorderStyle(std::string_view name);

// ---------------------------------------------------------------------------
// Events and results
// ---------------------------------------------------------------------------

// Non-printable keys delivered to Tool::OnKey().
namespace keys
{
constexpr char32_t kNewline   = U'\n';
constexpr char32_t kReturn    = U'\r';
constexpr char32_t kBackspace = U'\b';
constexpr char32_t kDelete    = 0x7F;
// Cursor keys live in the private use area so they never collide with typed text.
constexpr char32_t kArrowLeft  = 0xF702;
constexpr char32_t kArrowRight = 0xF703;
} // namespace keys

struct ToolContext
{
    int grid_width = 0;
    int grid_height = 0;
    BorderStyle border_style = BorderStyle::Single;
};

inline void ClampToGrid(int& x, int& y, const ToolContext& ctx)
{
    x = std::clamp(x, 0, std::max(0, ctx.grid_width - 1));
    y = std::clamp(y, 0, std::max(0, ctx.grid_height - 1));
}

// Content move produced by the select tool: the session relocates the cells of
// `source` by (dx,dy).
struct SelectionMove
{
    Selection source;
    int dx = 0;
    int dy = 0;
};

struct ToolResult
{
    DrawOps ops;
    // finished: gesture concluded, commit to history. Otherwise a live preview.
    bool finished = false;
    bool modified = false;
    std::optional<SelectionMove> move;

    void AddOp(const DrawOp& op)
    {
        ops.push_back(op);
        modified = true;
    }
    void SetOps(DrawOps new_ops)
    {
        ops = std::move(new_ops);
        modified = !ops.empty();
    }
    ToolResult& Finish()
    {
        finished = true;
        return *this;
    }
};

class Tool
{
public:
    virtual ~Tool() = default;

    virtual ToolId Id() const = 0;

    virtual ToolResult OnPointerDown(int x, int y, const ToolContext& ctx) = 0;
    virtual ToolResult OnPointerMove(int x, int y, const ToolContext& ctx) = 0;
    virtual ToolResult OnPointerUp(int x, int y, const ToolContext& ctx) = 0;
    virtual ToolResult OnKey(char32_t key, const ToolContext& ctx)
    {
        (void)key;
        (void)ctx;
        return {};
    }

    // Abandon any in-progress gesture; nothing is committed.
    virtual void Reset() = 0;
    // True while a gesture (or text entry) is in progress.
    virtual bool IsActive() const = 0;
    // Whether pointer-move results extend the running preview (stroke tools) instead of
    // replacing it (shape tools).
    virtual bool AccumulatesPreview() const { return false; }
    virtual std::optional<Selection> GetSelection() const { return std::nullopt; }
    // Only tools that own a selection keep it; the rest ignore the call.
    virtual void SetSelection(const std::optional<Selection>& selection) { (void)selection; }
    // The session undid or redid a command; anything the tool staged from earlier commits is stale.
    virtual void OnHistoryChanged() {}
};

// Per-tool defaults (persisted via EditorSettings).
struct ToolOptions
{
    char32_t freehand_glyph = U'*';
    int eraser_size = 1;
};

std::unique_ptr<Tool> MakeTool(ToolId id, const ToolOptions& options = {});
} // namespace ink
