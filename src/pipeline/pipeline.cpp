#include "clausekit/pipeline/pipeline.hpp"

#include "clausekit/common/utf8.hpp"
#include "clausekit/observability/global.hpp"
#include "clausekit/structure/hierarchy.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

namespace clausekit::pipeline {

common::Result<PipelineOptions> options_from_config(const config::Config &config) {
  auto strategy = chunking::parse_strategy(config.chunking.strategy);
  if (!strategy.ok()) {
    return strategy.forward_error<PipelineOptions>();
  }

  PipelineOptions options;
  options.flatten.strategy = strategy.value();
  options.flatten.strict_sizing = config.chunking.strict_sizing;
  options.flatten.split.max_size = config.chunking.max_size;
  options.flatten.split.overlap = config.chunking.overlap;
  options.flatten.split.by_sentence = config.chunking.by_sentence;
  if (auto status = chunking::validate_split_options(options.flatten.split); !status.ok()) {
    return common::Result<PipelineOptions>::failure(status.error());
  }

  options.dedup = config.chunking.dedup;
  options.dedup_options.threshold = config.chunking.dedup_threshold;
  options.dedup_options.fingerprint_length = config.chunking.fingerprint_length;
  if (auto dedup = chunking::Deduplicator::create(options.dedup_options); !dedup.ok()) {
    return dedup.forward_error<PipelineOptions>();
  }

  return common::Result<PipelineOptions>::success(std::move(options));
}

DocumentPipeline::DocumentPipeline(std::shared_ptr<const classify::IHeadingClassifier> classifier,
                                   PipelineOptions options)
    : classifier_(std::move(classifier)), options_(std::move(options)) {}

std::vector<structure::Element>
DocumentPipeline::classify_elements(const std::vector<structure::Element> &elements) const {
  std::vector<structure::Element> classified = elements;
  if (!options_.classify_paragraphs || classifier_ == nullptr) {
    return classified;
  }

  // Table cells are never promoted to headings.
  std::vector<std::size_t> indices;
  std::vector<std::string> texts;
  for (std::size_t i = 0; i < elements.size(); ++i) {
    const auto &element = elements[i];
    if (!element.is_heading && element.kind == structure::ElementKind::Paragraph) {
      indices.push_back(i);
      texts.push_back(element.text);
    }
  }
  if (texts.empty()) {
    return classified;
  }

  const auto results = classifier_->classify_batch(texts);
  const std::size_t usable = std::min(results.size(), indices.size());
  for (std::size_t k = 0; k < usable; ++k) {
    if (!results[k].is_heading) {
      continue;
    }
    auto &element = classified[indices[k]];
    element.is_heading = true;
    element.level = results[k].level;
  }
  return classified;
}

common::Result<PipelineOutput>
DocumentPipeline::run(const std::vector<structure::Element> &elements) const {
  const auto started = std::chrono::steady_clock::now();
  const std::string classifier_name =
      classifier_ == nullptr ? "none" : std::string(classifier_->name());
  observability::record_pipeline_start(elements.size(), classifier_name,
                                       chunking::strategy_name(options_.flatten.strategy));

  PipelineOutput output;
  output.forest = structure::build_hierarchy(classify_elements(elements));

  auto flattened = chunking::flatten(output.forest, options_.flatten);
  if (!flattened.ok()) {
    observability::record_error("pipeline", flattened.error());
    return flattened.forward_error<PipelineOutput>();
  }
  output.chunks = std::move(flattened.value().chunks);
  output.diagnostics = std::move(flattened.value().diagnostics);

  if (options_.dedup) {
    auto deduplicator = chunking::Deduplicator::create(options_.dedup_options);
    if (!deduplicator.ok()) {
      observability::record_error("pipeline", deduplicator.error());
      return deduplicator.forward_error<PipelineOutput>();
    }
    output.chunks = deduplicator.value().dedup(output.chunks);
  }

  observability::record_metric(observability::ChunksEmittedMetric{.count = output.chunks.size()});
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_pipeline_end(elapsed, structure::section_count(output.forest),
                                     output.chunks.size());
  return common::Result<PipelineOutput>::success(std::move(output));
}

common::Result<PipelineOutput> DocumentPipeline::run_text(const std::string &text) const {
  std::vector<structure::Element> elements;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    const std::string_view trimmed = common::utf8_trim(line);
    if (!trimmed.empty()) {
      elements.push_back(structure::paragraph_element(std::string(trimmed)));
    }
  }
  return run(elements);
}

} // namespace clausekit::pipeline
