#pragma once

#include "clausekit/classify/classifier.hpp"
#include "clausekit/common/result.hpp"
#include "clausekit/providers/traits.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace clausekit::classify {

struct RemoteOptions {
  std::string model = "qwen-plus";
  double temperature = 0.1;
  std::uint32_t max_tokens = 1000;
  std::chrono::milliseconds request_timeout{30'000};
  std::size_t max_texts_per_batch = 20;
  std::size_t max_tokens_per_batch = 3000;
  bool cache_enabled = true;
  /// Budget for one classify_batch call when no explicit deadline is given.
  std::chrono::milliseconds deadline{120'000};
};

/// Overall time limit plus an optional cancel flag owned by the caller.
struct ClassifyDeadline {
  std::chrono::steady_clock::time_point expires_at = std::chrono::steady_clock::time_point::max();
  const std::atomic<bool> *cancel = nullptr;

  [[nodiscard]] static ClassifyDeadline after(std::chrono::milliseconds budget,
                                              const std::atomic<bool> *cancel = nullptr);

  [[nodiscard]] bool expired() const;
  [[nodiscard]] std::chrono::milliseconds remaining() const;
};

/// Asks a chat model to label fragments in batches. Every failure (transport,
/// malformed reply, deadline, cancellation) is absorbed by classifying the
/// affected batch with `fallback` instead.
class RemoteClassifier final : public IHeadingClassifier {
public:
  RemoteClassifier(std::shared_ptr<providers::Provider> provider,
                   std::shared_ptr<const IHeadingClassifier> fallback, RemoteOptions options = {});

  [[nodiscard]] ClassificationResult classify(const std::string &text) const override;
  [[nodiscard]] std::vector<ClassificationResult>
  classify_batch(const std::vector<std::string> &texts) const override;
  [[nodiscard]] std::vector<ClassificationResult>
  classify_batch(const std::vector<std::string> &texts, const ClassifyDeadline &deadline) const;

  [[nodiscard]] std::string_view name() const override { return "llm"; }
  [[nodiscard]] std::size_t cache_size() const;

private:
  [[nodiscard]] std::vector<std::vector<std::size_t>>
  plan_batches(const std::vector<std::string> &texts,
               const std::vector<std::size_t> &pending) const;
  [[nodiscard]] common::Result<std::vector<ClassificationResult>>
  request_batch(const std::vector<std::string> &texts, const ClassifyDeadline &deadline) const;
  void apply_fallback(const std::vector<std::string> &texts,
                      const std::vector<std::size_t> &indices, const std::string &reason,
                      std::vector<ClassificationResult> &results) const;

  std::shared_ptr<providers::Provider> provider_;
  std::shared_ptr<const IHeadingClassifier> fallback_;
  RemoteOptions options_;

  mutable std::mutex cache_mutex_;
  mutable std::unordered_map<std::string, ClassificationResult> cache_;
};

/// Rough token count: code points plus half the whitespace-separated words.
[[nodiscard]] std::size_t estimate_tokens(const std::string &text);

[[nodiscard]] std::string build_classification_prompt(const std::vector<std::string> &texts);

/// Extracts the JSON array from a model reply; fails unless it holds exactly
/// `expected` objects.
[[nodiscard]] common::Result<std::vector<ClassificationResult>>
parse_classification_response(const std::string &response, std::size_t expected);

} // namespace clausekit::classify
