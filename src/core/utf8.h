#pragma once

#include <string>
#include <string_view>
#include <vector>

// Minimal UTF-8 helpers shared by export, key input and the clipboard text bridge.
namespace ink
{
namespace utf8
{
// Appends the UTF-8 encoding of `cp` to `out`.
// Invalid scalar values (surrogates, > U+10FFFF) are encoded as U+FFFD.
void Append(char32_t cp, std::string& out);

std::string Encode(char32_t cp);

// Decode UTF-8 into codepoints (best-effort).
// - malformed sequences are skipped one byte at a time, including overlong forms,
//   surrogates (U+D800..U+DFFF) and values past U+10FFFF
// - BOM (EF BB BF) is stripped if present
void DecodeBestEffort(std::string_view bytes, std::vector<char32_t>& out_codepoints);

// Decodes `bytes` only if it holds exactly one codepoint.
// Returns false for empty input, multi-codepoint input or malformed input.
bool DecodeSingle(std::string_view bytes, char32_t& out_cp);
} // namespace utf8
} // namespace ink
