#pragma once

#include "clausekit/common/result.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace clausekit::chunking {

using SizeFn = std::function<std::size_t(std::string_view)>;

/// Default size measure: UTF-8 code points.
[[nodiscard]] std::size_t character_count(std::string_view text);

struct SplitOptions {
  std::size_t max_size = 2000;
  // Values of max_size or more act as max_size - 1.
  std::size_t overlap = 200;
  bool by_sentence = true;
  // Empty means character_count.
  SizeFn size_fn;
};

struct Chunked {
  std::vector<std::string> chunks;
  common::Diagnostics diagnostics;
};

[[nodiscard]] common::Status validate_split_options(const SplitOptions &options);

/// Cuts `text` into pieces no larger than `max_size`. Text that already fits is
/// returned unchanged whatever the overlap. A single sentence that is larger on
/// its own is kept whole and reported as a warning diagnostic. A zero max_size is
/// the only failure.
[[nodiscard]] common::Result<Chunked> split(std::string_view text, const SplitOptions &options);

/// Sentences of `text` in order, each trimmed and keeping its terminator plus any
/// closing quotes or brackets that follow it.
[[nodiscard]] std::vector<std::string_view> split_sentences(std::string_view text);

} // namespace clausekit::chunking
