#include "clausekit/chunking/splitter.hpp"

#include "clausekit/common/utf8.hpp"
#include "clausekit/observability/global.hpp"

#include <algorithm>
#include <optional>

namespace clausekit::chunking {

namespace {

// Byte range [begin, end) of one sentence, including the whitespace in front of
// it. Consecutive spans tile the text.
struct Span {
  std::size_t begin = 0;
  std::size_t end = 0;
};

bool is_terminator(char32_t cp) {
  switch (cp) {
  case U'.':
  case U'!':
  case U'?':
  case U';':
  case U'。':
  case U'！':
  case U'？':
  case U'；':
    return true;
  default:
    return false;
  }
}

bool is_closer(char32_t cp) {
  switch (cp) {
  case U'"':
  case U'”':
  case U'’':
  case U'）':
  case U')':
  case U'】':
  case U']':
  case U'》':
  case U'>':
    return true;
  default:
    return false;
  }
}

bool is_ascii_digit(char32_t cp) { return cp >= U'0' && cp <= U'9'; }

std::vector<Span> sentence_spans(std::string_view text) {
  const std::u32string cps = common::utf8_decode(text);
  const std::vector<std::size_t> offsets = common::codepoint_offsets(text);

  std::vector<Span> spans;
  std::size_t start = 0;
  std::size_t i = 0;
  while (i < cps.size()) {
    const char32_t cp = cps[i];
    // "3.5" is a number, not a sentence end.
    const bool decimal_point = cp == U'.' && i > 0 && i + 1 < cps.size() &&
                               is_ascii_digit(cps[i - 1]) && is_ascii_digit(cps[i + 1]);
    if (!is_terminator(cp) || decimal_point) {
      ++i;
      continue;
    }
    ++i;
    while (i < cps.size() && (is_terminator(cps[i]) || is_closer(cps[i]))) {
      ++i;
    }
    spans.push_back(Span{.begin = offsets[start], .end = offsets[i]});
    start = i;
  }
  if (start < cps.size()) {
    spans.push_back(Span{.begin = offsets[start], .end = text.size()});
  }

  std::vector<Span> non_blank;
  non_blank.reserve(spans.size());
  for (const auto &span : spans) {
    if (!common::utf8_trim(text.substr(span.begin, span.end - span.begin)).empty()) {
      non_blank.push_back(span);
    }
  }
  return non_blank;
}

class SentencePacker {
public:
  SentencePacker(std::string_view text, const SplitOptions &options, SizeFn size_of)
      : text_(text), options_(options), size_of_(std::move(size_of)),
        spans_(sentence_spans(text)) {}

  Chunked run() {
    bool open = false;
    std::size_t begin = 0;
    std::size_t end = 0;
    std::optional<std::size_t> carry;

    for (std::size_t i = 0; i < spans_.size(); ++i) {
      const Span sentence = spans_[i];
      if (open) {
        if (fits(begin, sentence.end, options_.max_size)) {
          end = sentence.end;
          continue;
        }
        emit(begin, end);
        carry = overlap_start(begin, end, i - 1);
        open = false;
      }

      if (carry.has_value() && fits(*carry, sentence.end, options_.max_size)) {
        begin = *carry;
      } else if (fits(sentence.begin, sentence.end, options_.max_size)) {
        begin = sentence.begin;
      } else {
        emit_oversized(sentence.begin, sentence.end);
        carry = overlap_start(sentence.begin, sentence.end, i);
        continue;
      }
      carry.reset();
      end = sentence.end;
      open = true;
    }

    if (open) {
      emit(begin, end);
    }
    return std::move(out_);
  }

private:
  [[nodiscard]] std::string_view piece(std::size_t begin, std::size_t end) const {
    return common::utf8_trim(text_.substr(begin, end - begin));
  }

  [[nodiscard]] bool fits(std::size_t begin, std::size_t end, std::size_t limit) const {
    return size_of_(piece(begin, end)) <= limit;
  }

  void emit(std::size_t begin, std::size_t end) {
    const std::string_view chunk = piece(begin, end);
    if (!chunk.empty()) {
      out_.chunks.emplace_back(chunk);
    }
  }

  void emit_oversized(std::size_t begin, std::size_t end) {
    const std::string_view chunk = piece(begin, end);
    const std::size_t size = size_of_(chunk);
    out_.chunks.emplace_back(chunk);
    out_.diagnostics.push_back(common::Diagnostic{
        .severity = common::Severity::Warning,
        .component = "splitter",
        .message = "sentence of size " + std::to_string(size) + " exceeds max_size " +
                   std::to_string(options_.max_size) + "; kept whole",
    });
    observability::record_split_fallback(size, options_.max_size);
  }

  // Where the next chunk starts when it repeats the tail of [begin, end): the
  // earliest sentence start whose suffix fits the overlap window, otherwise the
  // longest raw tail that does.
  [[nodiscard]] std::optional<std::size_t> overlap_start(std::size_t begin, std::size_t end,
                                                         std::size_t last_sentence) const {
    if (options_.overlap == 0) {
      return std::nullopt;
    }

    std::optional<std::size_t> start;
    for (std::size_t j = last_sentence + 1; j-- > 0;) {
      const Span &sentence = spans_[j];
      if (sentence.begin < begin || !fits(sentence.begin, end, options_.overlap)) {
        break;
      }
      start = sentence.begin;
    }
    if (start.has_value()) {
      return start;
    }
    return raw_tail_start(begin, end);
  }

  [[nodiscard]] std::optional<std::size_t> raw_tail_start(std::size_t begin,
                                                          std::size_t end) const {
    const std::vector<std::size_t> offsets =
        common::codepoint_offsets(text_.substr(begin, end - begin));
    // offsets.back() is the empty suffix. Suffix size shrinks as the start moves
    // right, so the first fitting start is found by bisection.
    std::size_t low = 0;
    std::size_t high = offsets.size() - 1;
    while (low < high) {
      const std::size_t mid = low + (high - low) / 2;
      if (fits(begin + offsets[mid], end, options_.overlap)) {
        high = mid;
      } else {
        low = mid + 1;
      }
    }
    if (low + 1 >= offsets.size() || piece(begin + offsets[low], end).empty()) {
      return std::nullopt;
    }
    return begin + offsets[low];
  }

  std::string_view text_;
  const SplitOptions &options_;
  SizeFn size_of_;
  std::vector<Span> spans_;
  Chunked out_;
};

std::vector<std::string> window_split(std::string_view text, const SplitOptions &options,
                                      const SizeFn &size_of) {
  const std::vector<std::size_t> offsets = common::codepoint_offsets(text);
  const std::size_t total = offsets.size() - 1;
  auto size_between = [&](std::size_t from, std::size_t to) {
    return size_of(text.substr(offsets[from], offsets[to] - offsets[from]));
  };

  std::vector<std::string> windows;
  std::size_t start = 0;
  while (start < total) {
    // Largest end whose window fits; at least one code point so the loop advances.
    std::size_t low = start + 1;
    std::size_t high = total;
    while (low < high) {
      const std::size_t mid = low + (high - low + 1) / 2;
      if (size_between(start, mid) <= options.max_size) {
        low = mid;
      } else {
        high = mid - 1;
      }
    }
    const std::size_t end = low;
    windows.emplace_back(text.substr(offsets[start], offsets[end] - offsets[start]));
    if (end == total) {
      break;
    }

    // Smallest next start after `start` whose tail up to `end` fits the overlap.
    std::size_t next_low = start + 1;
    std::size_t next_high = end;
    while (next_low < next_high) {
      const std::size_t mid = next_low + (next_high - next_low) / 2;
      if (size_between(mid, end) <= options.overlap) {
        next_high = mid;
      } else {
        next_low = mid + 1;
      }
    }
    start = next_low;
  }
  return windows;
}

} // namespace

std::size_t character_count(std::string_view text) { return common::codepoint_count(text); }

common::Status validate_split_options(const SplitOptions &options) {
  if (options.max_size == 0) {
    return common::Status::error("max_size must be greater than 0");
  }
  return common::Status::success();
}

common::Result<Chunked> split(std::string_view text, const SplitOptions &options) {
  if (auto status = validate_split_options(options); !status.ok()) {
    return common::Result<Chunked>::failure(status.error());
  }

  Chunked out;
  if (text.empty()) {
    return common::Result<Chunked>::success(std::move(out));
  }

  SizeFn size_of = options.size_fn ? options.size_fn : SizeFn(character_count);
  if (size_of(text) <= options.max_size) {
    out.chunks.emplace_back(text);
    return common::Result<Chunked>::success(std::move(out));
  }

  // The overlap window is capped one unit below max_size.
  SplitOptions bounded = options;
  bounded.overlap = std::min(options.overlap, options.max_size - 1);

  if (!bounded.by_sentence) {
    out.chunks = window_split(text, bounded, size_of);
    return common::Result<Chunked>::success(std::move(out));
  }

  SentencePacker packer(text, bounded, std::move(size_of));
  return common::Result<Chunked>::success(packer.run());
}

std::vector<std::string_view> split_sentences(std::string_view text) {
  std::vector<std::string_view> sentences;
  for (const auto &span : sentence_spans(text)) {
    sentences.push_back(common::utf8_trim(text.substr(span.begin, span.end - span.begin)));
  }
  return sentences;
}

} // namespace clausekit::chunking
