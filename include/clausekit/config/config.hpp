#pragma once

#include "clausekit/common/result.hpp"
#include "clausekit/config/schema.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace clausekit::config {

/// Reads a TOML file; a missing file yields the defaults. Environment
/// overrides are applied on top in both cases.
[[nodiscard]] common::Result<Config> load_config(const std::filesystem::path &path);

/// Builds a config from TOML text without touching the environment.
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);

/// CLAUSEKIT_* variables; unparsable values are skipped with a config warning.
void apply_env_overrides(Config &config);

/// Failures for unusable settings, warnings for suspicious ones.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

/// Applies document-type chunking presets ("legal", "contract", "regulation",
/// "general") with an optional subtype such as "employment" or "finance".
[[nodiscard]] common::Status apply_profile(Config &config, const std::string &document_type,
                                           const std::string &subtype = "");

[[nodiscard]] std::vector<std::string> known_llm_providers();
[[nodiscard]] std::vector<std::string> known_document_types();

} // namespace clausekit::config
