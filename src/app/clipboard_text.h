#pragma once

#include <string>
#include <string_view>

namespace ink { class EditorSession; }

// Plain-text bridge between an EditorSession and the host's system clipboard.
// The host owns the clipboard backend and only moves UTF-8 bytes in and out.
namespace app
{
// Selected cells as UTF-8 text, one line per row, trailing blanks trimmed.
// Returns false if there is no selection.
bool SelectionToUtf8Text(const ink::EditorSession& session, std::string& out_text);

// Writes UTF-8 `text` with its top-left at (x,y) as one undoable edit.
// - If the session has a selection, pastes at the selection's top-left instead.
// - CR, LF and CRLF end a line; TAB expands to 8-column stops; other controls are dropped.
// - Cells outside the grid are dropped.
// Returns false if the text is empty or nothing on the grid changed.
bool PasteUtf8Text(ink::EditorSession& session, std::string_view text, int x, int y);
} // namespace app
