#pragma once

#include "clausekit/chunking/dedup.hpp"
#include "clausekit/chunking/flattener.hpp"
#include "clausekit/classify/classifier.hpp"
#include "clausekit/common/result.hpp"
#include "clausekit/config/schema.hpp"
#include "clausekit/structure/element.hpp"
#include "clausekit/structure/section.hpp"

#include <memory>
#include <string>
#include <vector>

namespace clausekit::pipeline {

struct PipelineOptions {
  chunking::FlattenOptions flatten;
  bool dedup = true;
  chunking::DedupOptions dedup_options;
  /// Ask the classifier about paragraphs the extractor left unclassified.
  bool classify_paragraphs = true;
};

/// Chunking, strategy and dedup settings from `config`. The size function stays
/// character_count; callers that count tokens set flatten.split.size_fn.
[[nodiscard]] common::Result<PipelineOptions> options_from_config(const config::Config &config);

struct PipelineOutput {
  structure::SectionForest forest;
  std::vector<std::string> chunks;
  common::Diagnostics diagnostics;
};

/// classify -> build hierarchy -> flatten (and split) -> dedup for one document.
/// Holds no per-document state; run() may be called concurrently.
class DocumentPipeline {
public:
  DocumentPipeline(std::shared_ptr<const classify::IHeadingClassifier> classifier,
                   PipelineOptions options);

  [[nodiscard]] common::Result<PipelineOutput> run(const std::vector<structure::Element> &elements) const;

  /// Treats every non-blank line of `text` as a paragraph element.
  [[nodiscard]] common::Result<PipelineOutput> run_text(const std::string &text) const;

  [[nodiscard]] const PipelineOptions &options() const { return options_; }

private:
  [[nodiscard]] std::vector<structure::Element>
  classify_elements(const std::vector<structure::Element> &elements) const;

  std::shared_ptr<const classify::IHeadingClassifier> classifier_;
  PipelineOptions options_;
};

} // namespace clausekit::pipeline
