#pragma once

#include "clausekit/classify/classifier.hpp"

#include <optional>
#include <string>

namespace clausekit::structure {

enum class ElementKind {
  Paragraph,
  TableCell,
  Heading,
};

/// One fragment handed over by a format extractor, in reading order.
struct Element {
  std::string text;
  bool is_heading = false;
  int level = classify::kDefaultLevel;
  ElementKind kind = ElementKind::Paragraph;
  std::optional<std::string> source_tag;
};

[[nodiscard]] inline Element heading_element(std::string text, const int level) {
  return Element{.text = std::move(text), .is_heading = true, .level = level, .kind = ElementKind::Heading};
}

[[nodiscard]] inline Element paragraph_element(std::string text) {
  return Element{.text = std::move(text)};
}

[[nodiscard]] inline Element table_cell_element(std::string text) {
  return Element{.text = std::move(text), .kind = ElementKind::TableCell};
}

} // namespace clausekit::structure
