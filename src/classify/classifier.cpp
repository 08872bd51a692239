#include "clausekit/classify/classifier.hpp"

#include <array>
#include <utility>

namespace clausekit::classify {

namespace {

constexpr std::array<std::pair<HeadingLevel, std::string_view>, 11> kLevelNames = {{
    {HeadingLevel::Book, "book"},
    {HeadingLevel::Part, "part"},
    {HeadingLevel::Chapter, "chapter"},
    {HeadingLevel::Section, "section"},
    {HeadingLevel::Article, "article"},
    {HeadingLevel::Clause, "clause"},
    {HeadingLevel::Item, "item"},
    {HeadingLevel::SubItem, "subitem"},
    {HeadingLevel::Paragraph, "paragraph"},
    {HeadingLevel::Enumeration, "enumeration"},
    {HeadingLevel::Numbering, "numbering"},
}};

} // namespace

std::string_view level_name(const HeadingLevel level) {
  for (const auto &[candidate, name] : kLevelNames) {
    if (candidate == level) {
      return name;
    }
  }
  return "unknown";
}

std::optional<HeadingLevel> level_from_name(const std::string_view name) {
  for (const auto &[level, candidate] : kLevelNames) {
    if (candidate == name) {
      return level;
    }
  }
  return std::nullopt;
}

} // namespace clausekit::classify
