#pragma once

#include <string>
#include <vector>

namespace clausekit::structure {

/// Node of the document tree. `content` holds the heading line followed by the
/// text directly under it, joined by blank lines; descendants live only in
/// `subsections`, each at a strictly deeper level.
struct Section {
  std::string heading;
  std::string content;
  int level = 1;
  std::vector<Section> subsections;
};

using SectionForest = std::vector<Section>;

} // namespace clausekit::structure
