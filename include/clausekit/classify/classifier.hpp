#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clausekit::classify {

/// Structural depth of a heading; 1 is the outermost unit.
enum class HeadingLevel : int {
  Book = 1,
  Part = 2,
  Chapter = 3,
  Section = 4,
  Article = 5,
  Clause = 6,
  Item = 7,
  SubItem = 8,
  Paragraph = 9,
  Enumeration = 10,
  Numbering = 11,
};

/// Level assigned to plain content. Shares its value with Enumeration.
inline constexpr int kDefaultLevel = 10;

[[nodiscard]] constexpr int level_value(HeadingLevel level) { return static_cast<int>(level); }

/// Lowercase category name ("book", "subitem", ...), used for custom patterns.
[[nodiscard]] std::string_view level_name(HeadingLevel level);
[[nodiscard]] std::optional<HeadingLevel> level_from_name(std::string_view name);

struct ClassificationResult {
  bool is_heading = false;
  int level = kDefaultLevel;
  double confidence = 1.0;
};

[[nodiscard]] inline ClassificationResult heading_at(const int level, const double confidence = 1.0) {
  return ClassificationResult{.is_heading = true, .level = level, .confidence = confidence};
}

[[nodiscard]] inline ClassificationResult plain_content(const double confidence = 1.0) {
  return ClassificationResult{.is_heading = false, .level = kDefaultLevel, .confidence = confidence};
}

/// Decides whether a single text fragment is a heading and at what level.
/// Implementations must be safe to call concurrently through a const reference.
class IHeadingClassifier {
public:
  virtual ~IHeadingClassifier() = default;

  [[nodiscard]] virtual ClassificationResult classify(const std::string &text) const = 0;

  [[nodiscard]] virtual std::vector<ClassificationResult>
  classify_batch(const std::vector<std::string> &texts) const {
    std::vector<ClassificationResult> results;
    results.reserve(texts.size());
    for (const auto &text : texts) {
      results.push_back(classify(text));
    }
    return results;
  }

  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace clausekit::classify
