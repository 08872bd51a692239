#include "clausekit/config/config.hpp"

#include "clausekit/common/fs.hpp"
#include "clausekit/common/toml.hpp"
#include "clausekit/observability/global.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <optional>

namespace clausekit::config {

namespace {

struct ChunkingPreset {
  std::size_t max_size = 0;
  std::size_t overlap = 0;
  bool strict_sizing = true;
  std::string strategy = "finest_granularity";
};

struct SubtypePreset {
  const char *name;
  ChunkingPreset preset;
};

const std::vector<SubtypePreset> &contract_subtypes() {
  static const std::vector<SubtypePreset> kSubtypes = {
      {"service", {.max_size = 1800, .overlap = 150}},
      {"purchase", {.max_size = 2200, .overlap = 200}},
      {"employment", {.max_size = 1600, .overlap = 100}},
      {"partnership", {.max_size = 2500, .overlap = 250, .strategy = "all_levels"}},
  };
  return kSubtypes;
}

const std::vector<SubtypePreset> &regulation_subtypes() {
  static const std::vector<SubtypePreset> kSubtypes = {
      {"hr", {.max_size = 1600, .overlap = 120}},
      {"finance", {.max_size = 2000, .overlap = 180}},
      {"operation", {.max_size = 2200, .overlap = 200, .strategy = "all_levels"}},
      {"safety", {.max_size = 1500, .overlap = 100}},
  };
  return kSubtypes;
}

void apply_preset(Config &config, const ChunkingPreset &preset) {
  config.chunking.max_size = preset.max_size;
  config.chunking.overlap = preset.overlap;
  config.chunking.strict_sizing = preset.strict_sizing;
  config.chunking.strategy = preset.strategy;
}

common::Status apply_subtype(Config &config, const std::vector<SubtypePreset> &subtypes,
                             const std::string &document_type, const std::string &subtype) {
  if (subtype.empty()) {
    return common::Status::success();
  }
  const auto it = std::find_if(subtypes.begin(), subtypes.end(),
                               [&subtype](const SubtypePreset &entry) { return subtype == entry.name; });
  if (it == subtypes.end()) {
    return common::Status::error("Unknown " + document_type + " subtype: " + subtype);
  }
  apply_preset(config, it->preset);
  return common::Status::success();
}

bool contains(const std::vector<std::string> &values, const std::string &value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

std::optional<std::uint64_t> parse_u64(const std::string &raw) {
  const std::string value = common::trim(raw);
  std::uint64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (value.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<bool> parse_bool(const std::string &raw) {
  const std::string value = common::to_lower(common::trim(raw));
  if (value == "true" || value == "1" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "false" || value == "0" || value == "no" || value == "off") {
    return false;
  }
  return std::nullopt;
}

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

template <typename T>
void override_number(const char *name, T &target, const std::uint64_t minimum = 0) {
  const char *raw = env_value(name);
  if (raw == nullptr) {
    return;
  }
  const auto parsed = parse_u64(raw);
  if (!parsed.has_value() || *parsed < minimum) {
    observability::record_config_warning(name, std::string("ignoring invalid value '") + raw + "'");
    return;
  }
  target = static_cast<T>(*parsed);
}

void override_string(const char *name, std::string &target) {
  if (const char *raw = env_value(name); raw != nullptr) {
    target = common::trim(raw);
  }
}

void load_custom_patterns(Config &config, const common::TomlDocument &doc) {
  const std::string section = "classifier.custom_patterns";
  for (const auto &category : doc.keys_in(section)) {
    auto patterns = doc.get_string_array(section + "." + category);
    if (patterns.empty()) {
      // A single pattern may be written as a plain string.
      const std::string single = doc.get_string(section + "." + category);
      if (!single.empty() && single.front() != '[') {
        patterns.push_back(single);
      }
    }
    if (!patterns.empty()) {
      auto &target = config.classifier.custom_patterns[category];
      target.insert(target.end(), patterns.begin(), patterns.end());
    }
  }
}

} // namespace

std::vector<std::string> known_llm_providers() { return {"qwen", "openai", "claude", "custom"}; }

std::vector<std::string> known_document_types() {
  return {"general", "legal", "contract", "regulation"};
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return parsed.forward_error<Config>();
  }
  const auto &doc = parsed.value();
  Config config;

  auto &chunking = config.chunking;
  chunking.max_size = doc.get_u64("chunking.max_size", chunking.max_size);
  chunking.overlap = doc.get_u64("chunking.overlap", chunking.overlap);
  chunking.by_sentence = doc.get_bool("chunking.by_sentence", chunking.by_sentence);
  chunking.size_unit = doc.get_string("chunking.size_unit", chunking.size_unit);
  chunking.strategy = doc.get_string("chunking.strategy", chunking.strategy);
  chunking.strict_sizing = doc.get_bool("chunking.strict_sizing", chunking.strict_sizing);
  chunking.dedup = doc.get_bool("chunking.dedup", chunking.dedup);
  chunking.dedup_threshold = doc.get_double("chunking.dedup_threshold", chunking.dedup_threshold);
  chunking.fingerprint_length =
      doc.get_u64("chunking.fingerprint_length", chunking.fingerprint_length);

  auto &classifier = config.classifier;
  classifier.backend = doc.get_string("classifier.backend", classifier.backend);
  classifier.document_type = doc.get_string("classifier.document_type", classifier.document_type);
  classifier.fuzzy_matching = doc.get_bool("classifier.fuzzy_matching", classifier.fuzzy_matching);
  classifier.fuzzy_max_length =
      doc.get_u64("classifier.fuzzy_max_length", classifier.fuzzy_max_length);
  classifier.article_max_length =
      doc.get_u64("classifier.article_max_length", classifier.article_max_length);
  classifier.max_heading_length =
      doc.get_u64("classifier.max_heading_length", classifier.max_heading_length);
  load_custom_patterns(config, doc);

  auto &llm = config.llm;
  llm.provider = doc.get_string("llm.provider", llm.provider);
  llm.model = doc.get_string("llm.model", llm.model);
  llm.api_key_env = doc.get_string("llm.api_key_env", llm.api_key_env);
  llm.base_url = doc.get_string("llm.base_url", llm.base_url);
  llm.temperature = doc.get_double("llm.temperature", llm.temperature);
  llm.max_tokens = static_cast<std::uint32_t>(doc.get_u64("llm.max_tokens", llm.max_tokens));
  llm.timeout_secs = doc.get_u64("llm.timeout_secs", llm.timeout_secs);
  llm.retry_times = static_cast<std::uint32_t>(doc.get_u64("llm.retry_times", llm.retry_times));
  llm.retry_backoff_ms = doc.get_u64("llm.retry_backoff_ms", llm.retry_backoff_ms);
  llm.batch_size = doc.get_u64("llm.batch_size", llm.batch_size);
  llm.max_tokens_per_batch = doc.get_u64("llm.max_tokens_per_batch", llm.max_tokens_per_batch);
  llm.cache_enabled = doc.get_bool("llm.cache_enabled", llm.cache_enabled);
  llm.deadline_secs = doc.get_u64("llm.deadline_secs", llm.deadline_secs);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config(const std::filesystem::path &requested) {
  // `~` and environment variables in the location are expanded.
  const std::filesystem::path path =
      requested.empty() ? requested : std::filesystem::path(common::expand_path(requested.string()));
  Config config;
  if (!path.empty() && std::filesystem::exists(path)) {
    const auto content = common::read_file(path);
    if (!content.ok()) {
      return content.forward_error<Config>();
    }
    auto parsed = parse_config(content.value());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(path.string() + ": " + parsed.error());
    }
    config = std::move(parsed.value());
  }

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

void apply_env_overrides(Config &config) {
  override_number("CLAUSEKIT_MAX_SIZE", config.chunking.max_size, 1);
  override_number("CLAUSEKIT_OVERLAP", config.chunking.overlap);

  if (const char *raw = env_value("CLAUSEKIT_STRICT_SIZING"); raw != nullptr) {
    if (const auto parsed = parse_bool(raw); parsed.has_value()) {
      config.chunking.strict_sizing = *parsed;
    } else {
      observability::record_config_warning("CLAUSEKIT_STRICT_SIZING",
                                           std::string("ignoring invalid value '") + raw + "'");
    }
  }
  override_string("CLAUSEKIT_STRATEGY", config.chunking.strategy);

  if (const char *raw = env_value("CLAUSEKIT_LLM_ENABLED"); raw != nullptr) {
    if (const auto parsed = parse_bool(raw); parsed.has_value()) {
      config.classifier.backend = *parsed ? "llm" : "rule";
    } else {
      observability::record_config_warning("CLAUSEKIT_LLM_ENABLED",
                                           std::string("ignoring invalid value '") + raw + "'");
    }
  }
  override_string("CLAUSEKIT_LLM_PROVIDER", config.llm.provider);
  override_string("CLAUSEKIT_LLM_MODEL", config.llm.model);
  override_string("CLAUSEKIT_LLM_BASE_URL", config.llm.base_url);
  override_number("CLAUSEKIT_LLM_TIMEOUT", config.llm.timeout_secs, 1);
  override_number("CLAUSEKIT_LLM_RETRY_TIMES", config.llm.retry_times);
  override_number("CLAUSEKIT_LLM_BATCH_SIZE", config.llm.batch_size, 1);
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;
  const auto &chunking = config.chunking;

  if (chunking.max_size == 0) {
    return Warnings::failure("chunking.max_size must be greater than 0");
  }
  if (chunking.overlap >= chunking.max_size) {
    warnings.push_back("chunking.overlap (" + std::to_string(chunking.overlap) +
                       ") is not smaller than chunking.max_size (" +
                       std::to_string(chunking.max_size) + "); capped at " +
                       std::to_string(chunking.max_size - 1));
  }

  const std::string &strategy = chunking.strategy;
  if (strategy != "finest_granularity" && strategy != "all_levels" && strategy != "parent_only") {
    return Warnings::failure("invalid chunking strategy '" + chunking.strategy +
                             "'; expected one of: finest_granularity, all_levels, parent_only");
  }

  if (chunking.dedup_threshold < 0.0 || chunking.dedup_threshold > 1.0) {
    return Warnings::failure("chunking.dedup_threshold must be between 0.0 and 1.0");
  }
  if (chunking.dedup && chunking.fingerprint_length == 0) {
    warnings.push_back("chunking.fingerprint_length is 0; every chunk after the first is dropped");
  }

  if (common::to_lower(chunking.size_unit) != "character") {
    warnings.push_back("chunking.size_unit '" + chunking.size_unit +
                       "' requires a caller-supplied size function; characters are counted otherwise");
  }

  const std::string document_type = common::to_lower(config.classifier.document_type);
  if (!contains(known_document_types(), document_type)) {
    return Warnings::failure("Unknown classifier.document_type: " + config.classifier.document_type);
  }

  const std::string backend = common::to_lower(config.classifier.backend);
  if (backend != "rule" && backend != "llm") {
    return Warnings::failure("Invalid classifier.backend: " + config.classifier.backend);
  }

  const std::string provider = common::to_lower(config.llm.provider);
  if (!contains(known_llm_providers(), provider)) {
    return Warnings::failure("Unknown llm.provider: " + config.llm.provider);
  }
  if (backend == "llm") {
    if (config.llm.batch_size == 0) {
      return Warnings::failure("llm.batch_size must be greater than 0");
    }
    if (config.llm.temperature < 0.0 || config.llm.temperature > 2.0) {
      return Warnings::failure("llm.temperature must be between 0.0 and 2.0");
    }
    if (provider == "custom" && common::trim(config.llm.base_url).empty()) {
      return Warnings::failure("llm.base_url is required for the custom provider");
    }
    if (std::getenv(config.llm.api_key_env.c_str()) == nullptr) {
      warnings.push_back("llm.api_key_env " + config.llm.api_key_env +
                         " is not set; the rule-based classifier will be used");
    }
  }

  return Warnings::success(std::move(warnings));
}

common::Status apply_profile(Config &config, const std::string &document_type,
                             const std::string &subtype) {
  const std::string type = common::to_lower(common::trim(document_type));
  const std::string sub = common::to_lower(common::trim(subtype));

  if (type == "general") {
    config.classifier.document_type = "general";
    return common::Status::success();
  }
  if (type == "legal") {
    apply_preset(config, {.max_size = 1500, .overlap = 100});
    config.classifier.document_type = "legal";
    return common::Status::success();
  }
  if (type == "contract") {
    apply_preset(config, {.max_size = 2000, .overlap = 200});
    config.classifier.document_type = "contract";
    return apply_subtype(config, contract_subtypes(), type, sub);
  }
  if (type == "regulation") {
    apply_preset(config, {.max_size = 1800, .overlap = 150});
    config.classifier.document_type = "regulation";
    return apply_subtype(config, regulation_subtypes(), type, sub);
  }
  return common::Status::error("Unknown document type: " + document_type);
}

} // namespace clausekit::config
