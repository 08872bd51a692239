#pragma once

#include "clausekit/classify/classifier.hpp"
#include "clausekit/common/result.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace clausekit::classify {

enum class DocumentType {
  General,
  Legal,
  Contract,
  Regulation,
};

[[nodiscard]] common::Result<DocumentType> parse_document_type(const std::string &value);
[[nodiscard]] std::string_view document_type_name(DocumentType type);

struct ClassifierOptions {
  DocumentType document_type = DocumentType::General;
  bool enable_fuzzy_matching = true;
  std::size_t fuzzy_max_length = 30;
  std::size_t article_max_length = 50;
  std::size_t max_heading_length = 200;
  /// Extra regexes keyed by level name or "chinese_numbering" / "english_numbering".
  std::map<std::string, std::vector<std::string>> custom_patterns;
};

/// A marker-delimited span found by RuleBasedClassifier::extract_sections.
/// `start`/`end` are byte offsets into the scanned text.
struct LegalSpan {
  std::string heading;
  std::string content;
  int level = kDefaultLevel;
  std::size_t start = 0;
  std::size_t end = 0;
};

/// Pattern-table classifier for numbered legal and contract text. The compiled
/// tables are immutable after create(), so one instance can serve any number of
/// documents concurrently.
class RuleBasedClassifier final : public IHeadingClassifier {
public:
  /// Fails when a custom pattern does not compile or names an unknown category.
  [[nodiscard]] static common::Result<std::shared_ptr<const RuleBasedClassifier>>
  create(ClassifierOptions options = {});

  [[nodiscard]] ClassificationResult classify(const std::string &text) const override;
  [[nodiscard]] std::string_view name() const override { return "rule"; }

  /// Splits a block of text at every line that opens with a legal marker
  /// (第N章, 第N条, （一）, 1. ...). Text before the first marker is dropped.
  [[nodiscard]] std::vector<LegalSpan> extract_sections(const std::string &text) const;

  [[nodiscard]] const ClassifierOptions &options() const { return options_; }

private:
  struct Pattern {
    std::wregex regex;
    int level = kDefaultLevel;
  };

  RuleBasedClassifier(ClassifierOptions options, std::vector<Pattern> legal,
                      std::vector<Pattern> generic);

  [[nodiscard]] const Pattern *match_legal(const std::wstring &text, std::size_t *length) const;

  ClassifierOptions options_;
  std::vector<Pattern> legal_;
  std::vector<Pattern> generic_;
};

/// Collapses whitespace runs to one space and strips breadcrumb prefixes such
/// as "某某办法（征求意见稿） > " that precede an article marker.
[[nodiscard]] std::string clean_legal_text(const std::string &text);

} // namespace clausekit::classify
