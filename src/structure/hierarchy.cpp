#include "clausekit/structure/hierarchy.hpp"

#include "clausekit/common/json_util.hpp"
#include "clausekit/common/utf8.hpp"

#include <algorithm>
#include <sstream>

namespace clausekit::structure {

namespace {

void append_paragraph(Section &section, const std::string &text) {
  if (!section.content.empty()) {
    section.content += "\n\n";
  }
  section.content += text;
}

void collect_outline(const SectionForest &forest, const std::size_t depth, std::ostringstream &out) {
  for (const auto &section : forest) {
    out << std::string(depth * 2, ' ') << section.heading << "\n";
    collect_outline(section.subsections, depth + 1, out);
  }
}

void write_json(const SectionForest &forest, std::ostringstream &out) {
  out << "[";
  for (std::size_t i = 0; i < forest.size(); ++i) {
    const auto &section = forest[i];
    if (i > 0) {
      out << ",";
    }
    out << "{\"heading\":\"" << common::json_escape(section.heading) << "\",";
    out << "\"level\":" << section.level << ",";
    out << "\"content\":\"" << common::json_escape(section.content) << "\",";
    out << "\"subsections\":";
    write_json(section.subsections, out);
    out << "}";
  }
  out << "]";
}

} // namespace

SectionForest build_hierarchy(const std::vector<Element> &elements) {
  SectionForest forest;
  // Root-to-innermost path of open sections. New sections are only ever
  // appended to the innermost open section (or to the forest when nothing is
  // open), whose existing children are already closed, so these pointers
  // stay valid.
  std::vector<Section *> open;

  for (const auto &element : elements) {
    const std::string text(common::utf8_trim(element.text));
    if (text.empty()) {
      continue;
    }

    if (element.is_heading) {
      while (!open.empty() && open.back()->level >= element.level) {
        open.pop_back();
      }
      Section section{.heading = text, .content = text, .level = element.level};
      auto &siblings = open.empty() ? forest : open.back()->subsections;
      siblings.push_back(std::move(section));
      open.push_back(&siblings.back());
      continue;
    }

    if (open.empty()) {
      forest.push_back(Section{.heading = kSyntheticRootHeading, .level = 1});
      open.push_back(&forest.back());
    }
    append_paragraph(*open.back(), text);
  }

  return forest;
}

std::size_t section_count(const SectionForest &forest) {
  std::size_t count = forest.size();
  for (const auto &section : forest) {
    count += section_count(section.subsections);
  }
  return count;
}

std::size_t max_depth(const SectionForest &forest) {
  std::size_t depth = 0;
  for (const auto &section : forest) {
    depth = std::max(depth, 1 + max_depth(section.subsections));
  }
  return depth;
}

std::string outline(const SectionForest &forest) {
  std::ostringstream out;
  collect_outline(forest, 0, out);
  return out.str();
}

std::string to_json(const SectionForest &forest) {
  std::ostringstream out;
  write_json(forest, out);
  return out.str();
}

} // namespace clausekit::structure
