#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <string_view>

namespace core {

// Unicode White_Space plus the ASCII information separators (0x1C-0x1F).
bool is_space_codepoint(char32_t cp) noexcept;

// Drops trailing '\r' and '\n' characters.
std::string_view strip_trailing_eol(std::string_view text) noexcept;

// Per line ('\n' separated), whitespace runs become one space and the line
// is trimmed; line structure is kept.
std::string collapse_whitespace(std::string_view text);

// Removes every whitespace code point.
std::string remove_all_whitespace(std::string_view text);

// Whitespace-separated tokens, duplicates folded.
std::set<std::string> token_set(std::string_view text);

// Number of code points; bytes of ill-formed UTF-8 count one each.
std::size_t codepoint_length(std::string_view text) noexcept;

} // namespace core
