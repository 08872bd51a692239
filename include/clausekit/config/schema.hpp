#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace clausekit::config {

struct ChunkingConfig {
  std::size_t max_size = 2000;
  std::size_t overlap = 200;
  bool by_sentence = true;
  std::string size_unit = "character";
  std::string strategy = "finest_granularity";
  bool strict_sizing = false;
  bool dedup = true;
  double dedup_threshold = 0.7;
  std::size_t fingerprint_length = 300;
};

struct ClassifierConfig {
  std::string backend = "rule";
  std::string document_type = "general";
  bool fuzzy_matching = true;
  std::size_t fuzzy_max_length = 30;
  std::size_t article_max_length = 50;
  std::size_t max_heading_length = 200;
  /// Category name ("article", "chinese_numbering", ...) to extra regexes.
  std::map<std::string, std::vector<std::string>> custom_patterns;
};

struct LlmConfig {
  std::string provider = "qwen";
  std::string model = "qwen-plus";
  std::string api_key_env = "DASHSCOPE_API_KEY";
  /// Empty selects the provider's public endpoint.
  std::string base_url;
  double temperature = 0.1;
  std::uint32_t max_tokens = 1000;
  std::uint64_t timeout_secs = 30;
  std::uint32_t retry_times = 3;
  std::uint64_t retry_backoff_ms = 1000;
  std::size_t batch_size = 20;
  std::size_t max_tokens_per_batch = 3000;
  bool cache_enabled = true;
  std::uint64_t deadline_secs = 120;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  ChunkingConfig chunking;
  ClassifierConfig classifier;
  LlmConfig llm;
  ObservabilityConfig observability;
};

} // namespace clausekit::config
