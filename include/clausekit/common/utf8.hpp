#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace clausekit::common {

// Malformed input never fails: each invalid byte decodes to U+FFFD.

[[nodiscard]] std::u32string utf8_decode(std::string_view text);
[[nodiscard]] std::string utf8_encode(char32_t codepoint);

/// wchar_t is UTF-32 on the platforms we build for; used to drive std::wregex.
[[nodiscard]] std::wstring utf8_to_wide(std::string_view text);
[[nodiscard]] std::string wide_to_utf8(std::wstring_view text);

[[nodiscard]] std::size_t codepoint_count(std::string_view text);

/// Byte offset of every code point start, followed by text.size().
[[nodiscard]] std::vector<std::size_t> codepoint_offsets(std::string_view text);

/// Longest prefix holding at most `count` code points.
[[nodiscard]] std::string_view utf8_prefix(std::string_view text, std::size_t count);

[[nodiscard]] bool is_unicode_space(char32_t codepoint);

/// Strips leading and trailing Unicode whitespace (ASCII, NBSP, U+3000, ...).
[[nodiscard]] std::string_view utf8_trim(std::string_view text);

} // namespace clausekit::common
