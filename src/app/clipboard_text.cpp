#include "app/clipboard_text.h"

#include "core/editor_session.h"
#include "core/utf8.h"

#include <vector>

namespace app
{
namespace
{
// Decode clipboard UTF-8 bytes into lines of codepoints.
static void DecodePlainTextLines(std::string_view utf8, std::vector<std::vector<char32_t>>& out_lines)
{
    out_lines.clear();

    std::vector<char32_t> cps;
    ink::utf8::DecodeBestEffort(utf8, cps);

    std::vector<char32_t> cur;
    int col = 0;
    bool last_was_cr = false;

    auto flush_line = [&]() {
        out_lines.push_back(cur);
        cur.clear();
        col = 0;
    };

    for (char32_t cp : cps)
    {
        if (cp == U'\n')
        {
            // CRLF: the line was already flushed on CR.
            if (!last_was_cr)
                flush_line();
            last_was_cr = false;
            continue;
        }
        last_was_cr = false;
        if (cp == U'\r')
        {
            flush_line();
            last_was_cr = true;
            continue;
        }

        if (cp == U'\t')
        {
            const int tab_w = 8;
            const int next = ((col / tab_w) + 1) * tab_w;
            while (col < next)
            {
                cur.push_back(U' ');
                col++;
            }
            continue;
        }

        if (cp < 0x20u || cp == 0x7Fu)
            continue;

        cur.push_back(cp);
        col++;
    }

    if (!cur.empty())
        flush_line();
}
} // namespace

bool SelectionToUtf8Text(const ink::EditorSession& session, std::string& out_text)
{
    out_text.clear();
    if (!session.GetSelection())
        return false;
    out_text = session.ExportSelection();
    return true;
}

bool PasteUtf8Text(ink::EditorSession& session, std::string_view text, int x, int y)
{
    if (text.empty())
        return false;

    if (const std::optional<ink::Selection>& sel = session.GetSelection())
    {
        const ink::CellBounds b = sel->Bounds();
        x = b.min_x;
        y = b.min_y;
    }

    std::vector<std::vector<char32_t>> lines;
    DecodePlainTextLines(text, lines);

    const ink::Grid& grid = session.GetGrid();
    ink::DrawOps ops;
    for (size_t j = 0; j < lines.size(); ++j)
    {
        for (size_t i = 0; i < lines[j].size(); ++i)
        {
            const int px = x + (int)i;
            const int py = y + (int)j;
            if (!grid.InBounds(px, py))
                continue;
            ops.emplace_back(px, py, ink::Cell(lines[j][i]));
        }
    }
    return session.Commit(ops);
}
} // namespace app
