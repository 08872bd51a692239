#include "clausekit/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <regex>

namespace clausekit::common {

namespace {

bool is_ascii_space(const unsigned char c) { return std::isspace(c) != 0; }

} // namespace

std::string trim(const std::string &input) {
  const auto first = std::find_if_not(input.begin(), input.end(), is_ascii_space);
  const auto last = std::find_if_not(input.rbegin(), input.rend(), is_ascii_space).base();
  return first < last ? std::string(first, last) : std::string();
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

std::string to_lower(std::string value) {
  for (auto &c : value) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return value;
}

std::string expand_path(std::string value) {
  if (!value.empty() && value.front() == '~') {
    if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
      value.replace(0, 1, home);
    }
  }

  static const std::regex kVariable(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::string expanded;
  auto cursor = value.cbegin();
  for (std::sregex_iterator it(value.cbegin(), value.cend(), kVariable), end; it != end; ++it) {
    const auto &match = *it;
    expanded.append(cursor, match[0].first);
    if (const char *resolved = std::getenv(match[1].str().c_str()); resolved != nullptr) {
      expanded += resolved;
    }
    cursor = match[0].second;
  }
  expanded.append(cursor, value.cend());
  return expanded;
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return Result<std::string>::failure("Unable to open file: " + path.string());
  }
  std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
  if (file.bad()) {
    return Result<std::string>::failure("Failed reading file: " + path.string());
  }
  return Result<std::string>::success(std::move(content));
}

} // namespace clausekit::common
