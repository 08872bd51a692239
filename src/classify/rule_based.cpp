#include "clausekit/classify/rule_based.hpp"

#include "clausekit/common/fs.hpp"
#include "clausekit/common/utf8.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace clausekit::classify {

namespace {

constexpr auto kRegexFlags = std::regex_constants::ECMAScript | std::regex_constants::icase;

const std::wstring kNumeral = L"[一二三四五六七八九十百千万\\d]+";
const std::wstring kSmallNumeral = L"[一二三四五六七八九十\\d]+";

struct PatternSource {
  HeadingLevel level;
  std::wstring source;
};

std::vector<PatternSource> builtin_legal_patterns() {
  return {
      {HeadingLevel::Book, L"第" + kNumeral + L"编"},
      {HeadingLevel::Part, L"第" + kNumeral + L"篇"},
      {HeadingLevel::Chapter, L"第" + kNumeral + L"章"},
      {HeadingLevel::Section, L"第" + kNumeral + L"节"},
      {HeadingLevel::Article, L"第" + kNumeral + L"条"},
      {HeadingLevel::Clause, L"第" + kNumeral + L"款"},
      {HeadingLevel::Item, L"第" + kNumeral + L"项"},
      {HeadingLevel::SubItem, L"第" + kNumeral + L"目"},
      {HeadingLevel::Enumeration, L"（" + kNumeral + L"）"},
      {HeadingLevel::Enumeration, L"\\(" + kNumeral + L"\\)"},
      {HeadingLevel::Enumeration, L"[一二三四五六七八九十百千万]+[、．.]"},
      {HeadingLevel::Numbering, L"\\d+[、．.]"},
      {HeadingLevel::Numbering, L"\\d+\\.\\d+[、．.]?"},
      {HeadingLevel::Numbering, L"\\d+\\)"},
  };
}

std::vector<PatternSource> builtin_chinese_numbering() {
  return {
      {HeadingLevel::Enumeration, kSmallNumeral + L"[、．.]"},
      {HeadingLevel::Enumeration, L"（" + kSmallNumeral + L"）"},
  };
}

std::vector<PatternSource> builtin_english_numbering() {
  return {
      {HeadingLevel::Chapter, L"Chapter\\s+\\d+"},
      {HeadingLevel::Section, L"Section\\s+\\d+"},
      {HeadingLevel::Article, L"Article\\s+\\d+"},
      {HeadingLevel::Numbering, L"\\d+\\.?\\s+"},
      {HeadingLevel::Numbering, L"\\d+\\.\\d+\\.?\\s+"},
  };
}

// Words that mark an article line as body text rather than a title.
const std::array<std::wstring_view, 7> kArticleContentWords = {L"内容", L"规定", L"说明", L"包含",
                                                                L"详细", L"很长", L"多"};
const std::array<std::wstring_view, 5> kFuzzyContentWords = {L"内容", L"规定", L"说明", L"包含",
                                                              L"详细"};
constexpr std::wstring_view kSentenceEnders = L"。.！!？?；;：:";
constexpr std::wstring_view kClauseSeparators = L"，,、";

template <std::size_t N>
bool contains_word(const std::wstring &text, const std::array<std::wstring_view, N> &words) {
  return std::any_of(words.begin(), words.end(), [&text](const std::wstring_view word) {
    return text.find(word) != std::wstring::npos;
  });
}

common::Result<std::wregex> compile(const std::wstring &source, const std::string &category) {
  std::wstring body = source;
  if (!body.empty() && body.front() == L'^') {
    body.erase(body.begin());
  }
  try {
    return common::Result<std::wregex>::success(std::wregex(body, kRegexFlags));
  } catch (const std::regex_error &error) {
    return common::Result<std::wregex>::failure("invalid " + category + " pattern '" +
                                                common::wide_to_utf8(source) +
                                                "': " + error.what());
  }
}

bool matches_prefix(const std::wregex &regex, const std::wstring &text, std::size_t *length) {
  std::wsmatch match;
  if (!std::regex_search(text, match, regex, std::regex_constants::match_continuous)) {
    return false;
  }
  if (length != nullptr) {
    *length = static_cast<std::size_t>(match.length(0));
  }
  return true;
}

} // namespace

common::Result<DocumentType> parse_document_type(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "general" || normalized.empty()) {
    return common::Result<DocumentType>::success(DocumentType::General);
  }
  if (normalized == "legal") {
    return common::Result<DocumentType>::success(DocumentType::Legal);
  }
  if (normalized == "contract") {
    return common::Result<DocumentType>::success(DocumentType::Contract);
  }
  if (normalized == "regulation") {
    return common::Result<DocumentType>::success(DocumentType::Regulation);
  }
  return common::Result<DocumentType>::failure(
      "unknown document type '" + value + "'; expected one of: general, legal, contract, regulation");
}

std::string_view document_type_name(const DocumentType type) {
  switch (type) {
  case DocumentType::General:
    return "general";
  case DocumentType::Legal:
    return "legal";
  case DocumentType::Contract:
    return "contract";
  case DocumentType::Regulation:
    return "regulation";
  }
  return "general";
}

common::Result<std::shared_ptr<const RuleBasedClassifier>>
RuleBasedClassifier::create(ClassifierOptions options) {
  using Created = common::Result<std::shared_ptr<const RuleBasedClassifier>>;

  // Index 0 is unused so levels can index directly.
  std::array<std::vector<std::wstring>, 12> legal_sources;
  for (auto &entry : builtin_legal_patterns()) {
    legal_sources[static_cast<std::size_t>(level_value(entry.level))].push_back(
        std::move(entry.source));
  }
  std::vector<PatternSource> generic_sources = builtin_chinese_numbering();
  const std::size_t chinese_end = generic_sources.size();
  for (auto &entry : builtin_english_numbering()) {
    generic_sources.push_back(std::move(entry));
  }

  std::vector<PatternSource> chinese_custom;
  for (const auto &[category, patterns] : options.custom_patterns) {
    const std::string key = common::to_lower(common::trim(category));
    for (const auto &pattern : patterns) {
      const std::wstring source = common::utf8_to_wide(pattern);
      if (const auto level = level_from_name(key); level.has_value()) {
        legal_sources[static_cast<std::size_t>(level_value(*level))].push_back(source);
      } else if (key == "chinese_numbering") {
        chinese_custom.push_back({HeadingLevel::Enumeration, source});
      } else if (key == "english_numbering") {
        generic_sources.push_back({HeadingLevel::Numbering, source});
      } else {
        return Created::failure("unknown custom pattern category '" + category + "'");
      }
    }
  }
  generic_sources.insert(generic_sources.begin() + static_cast<std::ptrdiff_t>(chinese_end),
                         chinese_custom.begin(), chinese_custom.end());

  std::vector<Pattern> legal;
  for (std::size_t level = 1; level < legal_sources.size(); ++level) {
    for (const auto &source : legal_sources[level]) {
      auto compiled = compile(source, std::string(level_name(static_cast<HeadingLevel>(level))));
      if (!compiled.ok()) {
        return compiled.forward_error<std::shared_ptr<const RuleBasedClassifier>>();
      }
      legal.push_back(Pattern{.regex = std::move(compiled.value()), .level = static_cast<int>(level)});
    }
  }

  std::vector<Pattern> generic;
  for (const auto &entry : generic_sources) {
    auto compiled = compile(entry.source, "numbering");
    if (!compiled.ok()) {
      return compiled.forward_error<std::shared_ptr<const RuleBasedClassifier>>();
    }
    generic.push_back(Pattern{.regex = std::move(compiled.value()), .level = level_value(entry.level)});
  }

  return Created::success(std::shared_ptr<const RuleBasedClassifier>(
      new RuleBasedClassifier(std::move(options), std::move(legal), std::move(generic))));
}

RuleBasedClassifier::RuleBasedClassifier(ClassifierOptions options, std::vector<Pattern> legal,
                                         std::vector<Pattern> generic)
    : options_(std::move(options)), legal_(std::move(legal)), generic_(std::move(generic)) {}

const RuleBasedClassifier::Pattern *RuleBasedClassifier::match_legal(const std::wstring &text,
                                                                     std::size_t *length) const {
  for (const auto &pattern : legal_) {
    if (matches_prefix(pattern.regex, text, length)) {
      return &pattern;
    }
  }
  return nullptr;
}

ClassificationResult RuleBasedClassifier::classify(const std::string &text) const {
  const std::wstring wide = common::utf8_to_wide(common::utf8_trim(text));
  if (wide.size() < 2 || wide.size() > options_.max_heading_length) {
    return plain_content();
  }

  if (const auto *pattern = match_legal(wide, nullptr); pattern != nullptr) {
    if (pattern->level == level_value(HeadingLevel::Article) &&
        (wide.size() > options_.article_max_length || contains_word(wide, kArticleContentWords))) {
      return plain_content();
    }
    return heading_at(pattern->level);
  }

  if (options_.document_type == DocumentType::Legal) {
    return plain_content();
  }

  for (const auto &pattern : generic_) {
    if (matches_prefix(pattern.regex, wide, nullptr)) {
      return heading_at(pattern.level);
    }
  }

  if (options_.enable_fuzzy_matching && wide.size() < options_.fuzzy_max_length &&
      kSentenceEnders.find(wide.back()) == std::wstring_view::npos &&
      wide.find_first_of(kClauseSeparators) == std::wstring::npos &&
      !contains_word(wide, kFuzzyContentWords)) {
    return heading_at(kDefaultLevel);
  }

  return plain_content();
}

std::vector<LegalSpan> RuleBasedClassifier::extract_sections(const std::string &text) const {
  struct Marker {
    std::size_t start = 0;
    std::string heading;
    int level = kDefaultLevel;
  };

  std::vector<Marker> markers;
  std::size_t line_start = 0;
  while (line_start < text.size()) {
    std::size_t line_end = text.find('\n', line_start);
    if (line_end == std::string::npos) {
      line_end = text.size();
    }
    const std::string_view line(text.data() + line_start, line_end - line_start);
    const std::string_view trimmed = common::utf8_trim(line);
    if (!trimmed.empty()) {
      const std::wstring wide = common::utf8_to_wide(trimmed);
      std::size_t length = 0;
      if (const auto *pattern = match_legal(wide, &length); pattern != nullptr) {
        const std::string marker = common::wide_to_utf8(wide.substr(0, length));
        markers.push_back(Marker{
            .start = static_cast<std::size_t>(trimmed.data() - text.data()),
            .heading = std::string(common::utf8_trim(marker)),
            .level = pattern->level,
        });
      }
    }
    line_start = line_end + 1;
  }

  std::vector<LegalSpan> spans;
  spans.reserve(markers.size());
  for (std::size_t i = 0; i < markers.size(); ++i) {
    const std::size_t end = i + 1 < markers.size() ? markers[i + 1].start : text.size();
    const std::string_view body(text.data() + markers[i].start, end - markers[i].start);
    spans.push_back(LegalSpan{
        .heading = markers[i].heading,
        .content = std::string(common::utf8_trim(body)),
        .level = markers[i].level,
        .start = markers[i].start,
        .end = end,
    });
  }
  return spans;
}

std::string clean_legal_text(const std::string &text) {
  static const std::wregex kWhitespace(L"\\s+", std::regex_constants::ECMAScript);
  static const std::wregex kDraftBreadcrumb(L"（征求意见稿）\\s*>\\s*",
                                             std::regex_constants::ECMAScript);
  static const std::wregex kTitleBreadcrumb(L"[^第]*?>\\s*(?=第)", std::regex_constants::ECMAScript);

  std::wstring wide = common::utf8_to_wide(text);
  wide = std::regex_replace(wide, kWhitespace, L" ");
  wide = std::regex_replace(wide, kDraftBreadcrumb, L"");
  wide = std::regex_replace(wide, kTitleBreadcrumb, L"");
  return std::string(common::utf8_trim(common::wide_to_utf8(wide)));
}

} // namespace clausekit::classify
