#pragma once

#include "clausekit/chunking/splitter.hpp"
#include "clausekit/common/result.hpp"
#include "clausekit/structure/section.hpp"

#include <string>
#include <string_view>

namespace clausekit::chunking {

enum class Strategy {
  FinestGranularity,
  AllLevels,
  // Emits exactly what FinestGranularity emits; kept as a separate name for
  // configurations that already use it.
  ParentOnly,
};

[[nodiscard]] common::Result<Strategy> parse_strategy(std::string_view name);
[[nodiscard]] std::string strategy_name(Strategy strategy);

struct FlattenOptions {
  Strategy strategy = Strategy::FinestGranularity;
  bool strict_sizing = false;
  SplitOptions split;
};

/// Turns the forest into chunks in pre-order. Each chunk is prefixed with the
/// " > "-joined path of its ancestors' headings. With strict_sizing every chunk
/// is run through split() and replaced by its pieces.
[[nodiscard]] common::Result<Chunked> flatten(const structure::SectionForest &forest,
                                              const FlattenOptions &options);

/// Same as above with the strategy given by name; `options.strategy` is ignored.
[[nodiscard]] common::Result<Chunked> flatten(const structure::SectionForest &forest,
                                              std::string_view strategy,
                                              const FlattenOptions &options = {});

/// Text a single section contributes when emitted under `parent_path`.
[[nodiscard]] std::string section_chunk(const structure::Section &section,
                                        const std::string &parent_path);

} // namespace clausekit::chunking
