#pragma once

#include "clausekit/common/result.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace clausekit::common {

/// Flat view of a TOML subset: `[section]` headers, `key = value` pairs, basic
/// ("...") and literal ('...') strings, and arrays that may span several lines.
/// Keys are stored fully qualified ("section.key").
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;

  /// Unqualified names of the keys directly under `section`, sorted.
  [[nodiscard]] std::vector<std::string> keys_in(const std::string &section) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace clausekit::common
