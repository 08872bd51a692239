#include "clausekit/classify/factory.hpp"

#include "clausekit/classify/remote.hpp"
#include "clausekit/common/fs.hpp"
#include "clausekit/observability/global.hpp"
#include "clausekit/providers/factory.hpp"

namespace clausekit::classify {

common::Result<ClassifierOptions> options_from_config(const config::ClassifierConfig &config) {
  const auto document_type = parse_document_type(config.document_type);
  if (!document_type.ok()) {
    return document_type.forward_error<ClassifierOptions>();
  }
  return common::Result<ClassifierOptions>::success(ClassifierOptions{
      .document_type = document_type.value(),
      .enable_fuzzy_matching = config.fuzzy_matching,
      .fuzzy_max_length = config.fuzzy_max_length,
      .article_max_length = config.article_max_length,
      .max_heading_length = config.max_heading_length,
      .custom_patterns = config.custom_patterns,
  });
}

common::Result<std::shared_ptr<const IHeadingClassifier>>
create_classifier(const config::Config &config, std::shared_ptr<providers::Provider> provider) {
  using Created = common::Result<std::shared_ptr<const IHeadingClassifier>>;

  auto options = options_from_config(config.classifier);
  if (!options.ok()) {
    return options.forward_error<std::shared_ptr<const IHeadingClassifier>>();
  }
  auto rule_based = RuleBasedClassifier::create(std::move(options.value()));
  if (!rule_based.ok()) {
    return rule_based.forward_error<std::shared_ptr<const IHeadingClassifier>>();
  }
  std::shared_ptr<const IHeadingClassifier> fallback = rule_based.value();

  if (common::to_lower(common::trim(config.classifier.backend)) != "llm") {
    return Created::success(std::move(fallback));
  }

  if (provider == nullptr) {
    auto created = providers::create_provider(config.llm);
    if (!created.ok()) {
      observability::record_config_warning("classifier.backend",
                                           "llm unavailable, using rule-based classifier: " +
                                               created.error());
      return Created::success(std::move(fallback));
    }
    provider = created.value();
  }

  const auto &llm = config.llm;
  RemoteOptions remote{
      .model = llm.model,
      .temperature = llm.temperature,
      .max_tokens = llm.max_tokens,
      .request_timeout = std::chrono::seconds(llm.timeout_secs),
      .max_texts_per_batch = llm.batch_size,
      .max_tokens_per_batch = llm.max_tokens_per_batch,
      .cache_enabled = llm.cache_enabled,
      .deadline = std::chrono::seconds(llm.deadline_secs),
  };
  return Created::success(
      std::make_shared<RemoteClassifier>(std::move(provider), std::move(fallback), std::move(remote)));
}

} // namespace clausekit::classify
