#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace clausekit::common {

/// Escape a string for embedding inside a JSON string literal. Control
/// characters without a short form are written as \u00XX.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Decode the body of a JSON string literal, including \uXXXX escapes and
/// surrogate pairs, into UTF-8.
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Position of the closing quote for the string opening at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Position of the bracket closing the one at open_pos, skipping string bodies.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

// Field lookups scan for the first occurrence of "field" in the document and
// return an empty value when it is missing or has a different JSON type.

[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);
[[nodiscard]] std::optional<bool> json_get_bool(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// First balanced `[...]` in free-form text, e.g. a model reply wrapped in
/// prose or a markdown fence. Empty when none is found.
[[nodiscard]] std::string json_extract_first_array(const std::string &text);

} // namespace clausekit::common
