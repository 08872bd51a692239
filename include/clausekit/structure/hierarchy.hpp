#pragma once

#include "clausekit/structure/element.hpp"
#include "clausekit/structure/section.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace clausekit::structure {

/// Heading of the root created for content that precedes the first heading.
inline constexpr const char *kSyntheticRootHeading = "Document Content";

/// Builds the section forest in one pass over `elements`. Elements must
/// already carry their final is_heading/level; blank elements are skipped.
[[nodiscard]] SectionForest build_hierarchy(const std::vector<Element> &elements);

/// Total number of sections in the forest, nested ones included.
[[nodiscard]] std::size_t section_count(const SectionForest &forest);

/// Depth of the deepest section; 0 for an empty forest.
[[nodiscard]] std::size_t max_depth(const SectionForest &forest);

/// Indented table of contents, two spaces per nesting step, one heading per line.
[[nodiscard]] std::string outline(const SectionForest &forest);

/// `[{"heading":..,"level":..,"content":..,"subsections":[..]}, ..]`
[[nodiscard]] std::string to_json(const SectionForest &forest);

} // namespace clausekit::structure
