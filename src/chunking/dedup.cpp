#include "clausekit/chunking/dedup.hpp"

#include "clausekit/common/utf8.hpp"
#include "clausekit/observability/global.hpp"

#include <algorithm>
#include <regex>
#include <unordered_set>

namespace clausekit::chunking {

namespace {

constexpr auto kRegexFlags = std::regex_constants::ECMAScript | std::regex_constants::icase;

// Index, part and length annotations that callers embed in chunk text.
const std::vector<std::wregex> &decoration_patterns() {
  static const std::vector<std::wregex> patterns = {
      std::wregex(L"【Chunk\\s*\\d+】[^\\n]*\\n?", kRegexFlags),
      std::wregex(L"\\[Chunk\\s*\\d+\\]", kRegexFlags),
      std::wregex(L"Chunk\\s*\\d+\\s*/\\s*\\d+\\s*[:：]", kRegexFlags),
      std::wregex(L"\\(Part\\s*\\d+\\)", kRegexFlags),
      std::wregex(L"\\[length:\\s*\\d+\\]", kRegexFlags),
      std::wregex(L"\\[长度[:：]\\s*\\d+\\]", kRegexFlags),
      std::wregex(L"[（(]长度[:：]\\s*\\d+\\s*字符[）)]", kRegexFlags),
      std::wregex(L"（第\\d+部分）", kRegexFlags),
      std::wregex(L"={50,}", kRegexFlags),
      std::wregex(L"-{20,}", kRegexFlags),
  };
  return patterns;
}

// Lowercases ASCII, Latin-1 and full-width Latin capitals.
wchar_t fold_case(wchar_t ch) {
  if (ch >= L'A' && ch <= L'Z') {
    return static_cast<wchar_t>(ch - L'A' + L'a');
  }
  if (ch >= 0xC0 && ch <= 0xDE && ch != 0xD7) {
    return static_cast<wchar_t>(ch + 0x20);
  }
  if (ch >= 0xFF21 && ch <= 0xFF3A) {
    return static_cast<wchar_t>(ch + 0x20);
  }
  return ch;
}

std::unordered_set<char32_t> distinct_codepoints(const std::string &text) {
  const std::u32string decoded = common::utf8_decode(text);
  return std::unordered_set<char32_t>(decoded.begin(), decoded.end());
}

} // namespace

common::Result<Deduplicator> Deduplicator::create(DedupOptions options) {
  if (!(options.threshold >= 0.0 && options.threshold <= 1.0)) {
    return common::Result<Deduplicator>::failure("dedup threshold must be within [0, 1], got " +
                                                 std::to_string(options.threshold));
  }
  return common::Result<Deduplicator>::success(Deduplicator(options));
}

std::string Deduplicator::fingerprint(const std::string &chunk) const {
  static const std::wregex kWhitespace(L"\\s+", std::regex_constants::ECMAScript);

  std::wstring wide = common::utf8_to_wide(chunk);
  for (const auto &pattern : decoration_patterns()) {
    wide = std::regex_replace(wide, pattern, L"");
  }
  std::transform(wide.begin(), wide.end(), wide.begin(), fold_case);
  wide = std::regex_replace(wide, kWhitespace, L" ");

  const std::string normalized = common::wide_to_utf8(wide);
  return std::string(
      common::utf8_prefix(common::utf8_trim(normalized), options_.fingerprint_length));
}

std::vector<std::string> Deduplicator::dedup(const std::vector<std::string> &chunks) const {
  std::vector<std::string> kept;
  std::vector<std::string> kept_fingerprints;
  kept.reserve(chunks.size());

  for (const auto &chunk : chunks) {
    std::string print = fingerprint(chunk);
    const bool duplicate =
        std::any_of(kept_fingerprints.begin(), kept_fingerprints.end(),
                    [&](const std::string &seen) {
                      return jaccard_similarity(print, seen) >= options_.threshold;
                    });
    if (duplicate) {
      continue;
    }
    kept_fingerprints.push_back(std::move(print));
    kept.push_back(chunk);
  }

  if (const std::size_t dropped = chunks.size() - kept.size(); dropped > 0) {
    observability::record_metric(observability::DuplicatesDroppedMetric{.count = dropped});
  }
  return kept;
}

double jaccard_similarity(const std::string &left, const std::string &right) {
  const auto left_set = distinct_codepoints(left);
  const auto right_set = distinct_codepoints(right);
  if (left_set.empty() && right_set.empty()) {
    return 1.0;
  }

  std::size_t shared = 0;
  for (const char32_t cp : left_set) {
    if (right_set.contains(cp)) {
      ++shared;
    }
  }
  const std::size_t total = left_set.size() + right_set.size() - shared;
  return static_cast<double>(shared) / static_cast<double>(total);
}

} // namespace clausekit::chunking
