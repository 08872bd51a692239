#include "clausekit/chunking/flattener.hpp"

#include "clausekit/common/fs.hpp"

#include <iterator>

namespace clausekit::chunking {

namespace {

constexpr const char *kPathSeparator = " > ";

std::string full_heading(const structure::Section &section, const std::string &parent_path) {
  if (parent_path.empty()) {
    return section.heading;
  }
  return parent_path + kPathSeparator + section.heading;
}

void collect(const structure::SectionForest &sections, const std::string &parent_path,
             const Strategy strategy, std::vector<std::string> &out) {
  for (const auto &section : sections) {
    const std::string path = full_heading(section, parent_path);

    if (strategy == Strategy::AllLevels) {
      if (!section.content.empty()) {
        out.push_back(section_chunk(section, parent_path));
      }
      collect(section.subsections, path, strategy, out);
      continue;
    }

    if (!section.subsections.empty()) {
      collect(section.subsections, path, strategy, out);
      continue;
    }
    std::string chunk = section_chunk(section, parent_path);
    if (!chunk.empty()) {
      out.push_back(std::move(chunk));
    }
  }
}

} // namespace

common::Result<Strategy> parse_strategy(std::string_view name) {
  if (name == "finest_granularity") {
    return common::Result<Strategy>::success(Strategy::FinestGranularity);
  }
  if (name == "all_levels") {
    return common::Result<Strategy>::success(Strategy::AllLevels);
  }
  if (name == "parent_only") {
    return common::Result<Strategy>::success(Strategy::ParentOnly);
  }
  return common::Result<Strategy>::failure(
      "invalid chunking strategy '" + std::string(name) +
      "'; expected one of: finest_granularity, all_levels, parent_only");
}

std::string strategy_name(const Strategy strategy) {
  switch (strategy) {
  case Strategy::FinestGranularity:
    return "finest_granularity";
  case Strategy::AllLevels:
    return "all_levels";
  case Strategy::ParentOnly:
    return "parent_only";
  }
  return "finest_granularity";
}

std::string section_chunk(const structure::Section &section, const std::string &parent_path) {
  const std::string heading_path = full_heading(section, parent_path);
  if (section.content.empty()) {
    return heading_path;
  }
  if (!section.heading.empty() && common::starts_with(section.content, section.heading)) {
    return heading_path + section.content.substr(section.heading.size());
  }
  if (!parent_path.empty()) {
    return heading_path + "\n\n" + section.content;
  }
  return section.content;
}

common::Result<Chunked> flatten(const structure::SectionForest &forest,
                                const FlattenOptions &options) {
  if (options.strict_sizing) {
    if (auto status = validate_split_options(options.split); !status.ok()) {
      return common::Result<Chunked>::failure(status.error());
    }
  }

  std::vector<std::string> raw;
  collect(forest, "", options.strategy, raw);

  Chunked out;
  if (!options.strict_sizing) {
    out.chunks = std::move(raw);
    return common::Result<Chunked>::success(std::move(out));
  }

  for (const auto &chunk : raw) {
    auto pieces = split(chunk, options.split);
    if (!pieces.ok()) {
      return pieces;
    }
    auto &value = pieces.value();
    out.chunks.insert(out.chunks.end(), std::make_move_iterator(value.chunks.begin()),
                      std::make_move_iterator(value.chunks.end()));
    common::append_diagnostics(out.diagnostics, value.diagnostics);
  }
  return common::Result<Chunked>::success(std::move(out));
}

common::Result<Chunked> flatten(const structure::SectionForest &forest,
                                std::string_view strategy, const FlattenOptions &options) {
  auto parsed = parse_strategy(strategy);
  if (!parsed.ok()) {
    return parsed.forward_error<Chunked>();
  }
  FlattenOptions resolved = options;
  resolved.strategy = parsed.value();
  return flatten(forest, resolved);
}

} // namespace clausekit::chunking
