#pragma once

#include "clausekit/common/result.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace clausekit::chunking {

struct DedupOptions {
  double threshold = 0.7;
  std::size_t fingerprint_length = 300;
};

/// Drops chunks whose fingerprint shares too many distinct characters with an
/// earlier kept chunk. Order-insensitive on purpose: it targets repeated
/// boilerplate such as table headers, not exact duplicates.
class Deduplicator {
public:
  /// Fails when the threshold lies outside [0, 1].
  [[nodiscard]] static common::Result<Deduplicator> create(DedupOptions options = {});

  /// Keeps the first of every group of near-duplicates, preserving order.
  [[nodiscard]] std::vector<std::string> dedup(const std::vector<std::string> &chunks) const;

  [[nodiscard]] std::string fingerprint(const std::string &chunk) const;
  [[nodiscard]] const DedupOptions &options() const { return options_; }

private:
  explicit Deduplicator(DedupOptions options) : options_(options) {}

  DedupOptions options_;
};

/// |A ∩ B| / |A ∪ B| over the distinct code points of both strings; 1.0 when
/// both are empty.
[[nodiscard]] double jaccard_similarity(const std::string &left, const std::string &right);

} // namespace clausekit::chunking
