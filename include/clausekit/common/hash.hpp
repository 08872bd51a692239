#pragma once

#include <string>

namespace clausekit::common {

/// Lowercase hex SHA-256 digest of `text`.
[[nodiscard]] std::string sha256_hex(const std::string &text);

} // namespace clausekit::common
