#pragma once

#include "clausekit/classify/classifier.hpp"
#include "clausekit/classify/rule_based.hpp"
#include "clausekit/common/result.hpp"
#include "clausekit/config/schema.hpp"
#include "clausekit/providers/traits.hpp"

#include <memory>

namespace clausekit::classify {

[[nodiscard]] common::Result<ClassifierOptions> options_from_config(const config::ClassifierConfig &config);

/// Rule-based classifier, or the remote one layered on top of it when
/// classifier.backend is "llm". A missing provider or API key degrades to the
/// rule-based classifier with a config warning; bad patterns are failures.
[[nodiscard]] common::Result<std::shared_ptr<const IHeadingClassifier>>
create_classifier(const config::Config &config,
                  std::shared_ptr<providers::Provider> provider = nullptr);

} // namespace clausekit::classify
