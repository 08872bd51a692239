#pragma once

#include "clausekit/common/result.hpp"

#include <filesystem>
#include <string>

namespace clausekit::common {

/// ASCII whitespace only; see utf8_trim for ideographic spaces.
[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);

/// Expands a leading "~" and $VAR / ${VAR} references. Unset variables expand to "".
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

} // namespace clausekit::common
