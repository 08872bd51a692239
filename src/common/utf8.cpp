#include "clausekit/common/utf8.hpp"

namespace clausekit::common {

namespace {

constexpr char32_t kReplacement = 0xFFFD;

bool is_continuation(unsigned char byte) { return (byte & 0xC0U) == 0x80U; }

// Decodes the code point starting at `pos`; returns its byte length.
std::size_t decode_one(std::string_view text, std::size_t pos, char32_t &out) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  std::size_t length = 0;
  char32_t value = 0;

  if (lead < 0x80U) {
    out = lead;
    return 1;
  }
  if ((lead & 0xE0U) == 0xC0U) {
    length = 2;
    value = lead & 0x1FU;
  } else if ((lead & 0xF0U) == 0xE0U) {
    length = 3;
    value = lead & 0x0FU;
  } else if ((lead & 0xF8U) == 0xF0U) {
    length = 4;
    value = lead & 0x07U;
  } else {
    out = kReplacement;
    return 1;
  }

  if (pos + length > text.size()) {
    out = kReplacement;
    return 1;
  }
  for (std::size_t i = 1; i < length; ++i) {
    const auto byte = static_cast<unsigned char>(text[pos + i]);
    if (!is_continuation(byte)) {
      out = kReplacement;
      return 1;
    }
    value = (value << 6U) | (byte & 0x3FU);
  }
  out = value;
  return length;
}

void append_codepoint(std::string &out, char32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0x10FFFF) {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    append_codepoint(out, kReplacement);
  }
}

} // namespace

std::u32string utf8_decode(std::string_view text) {
  std::u32string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    char32_t cp = 0;
    pos += decode_one(text, pos, cp);
    out.push_back(cp);
  }
  return out;
}

std::string utf8_encode(char32_t codepoint) {
  std::string out;
  append_codepoint(out, codepoint);
  return out;
}

std::wstring utf8_to_wide(std::string_view text) {
  std::wstring out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    char32_t cp = 0;
    pos += decode_one(text, pos, cp);
    out.push_back(static_cast<wchar_t>(cp));
  }
  return out;
}

std::string wide_to_utf8(std::wstring_view text) {
  std::string out;
  out.reserve(text.size());
  for (const wchar_t ch : text) {
    append_codepoint(out, static_cast<char32_t>(ch));
  }
  return out;
}

std::size_t codepoint_count(std::string_view text) {
  std::size_t count = 0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    char32_t cp = 0;
    pos += decode_one(text, pos, cp);
    ++count;
  }
  return count;
}

std::vector<std::size_t> codepoint_offsets(std::string_view text) {
  std::vector<std::size_t> offsets;
  offsets.reserve(text.size() + 1);
  std::size_t pos = 0;
  while (pos < text.size()) {
    offsets.push_back(pos);
    char32_t cp = 0;
    pos += decode_one(text, pos, cp);
  }
  offsets.push_back(text.size());
  return offsets;
}

std::string_view utf8_prefix(std::string_view text, std::size_t count) {
  std::size_t pos = 0;
  for (std::size_t taken = 0; taken < count && pos < text.size(); ++taken) {
    char32_t cp = 0;
    pos += decode_one(text, pos, cp);
  }
  return text.substr(0, pos);
}

bool is_unicode_space(char32_t codepoint) {
  switch (codepoint) {
  case U' ':
  case U'\t':
  case U'\n':
  case U'\r':
  case U'\f':
  case U'\v':
  case 0x00A0:
  case 0x2000:
  case 0x2001:
  case 0x2002:
  case 0x2003:
  case 0x2009:
  case 0x200B:
  case 0x3000:
  case 0xFEFF:
    return true;
  default:
    return false;
  }
}

std::string_view utf8_trim(std::string_view text) {
  std::size_t begin = 0;
  while (begin < text.size()) {
    char32_t cp = 0;
    const std::size_t length = decode_one(text, begin, cp);
    if (!is_unicode_space(cp)) {
      break;
    }
    begin += length;
  }

  std::size_t end = text.size();
  while (end > begin) {
    std::size_t start = end - 1;
    while (start > begin && is_continuation(static_cast<unsigned char>(text[start]))) {
      --start;
    }
    char32_t cp = 0;
    decode_one(text, start, cp);
    if (!is_unicode_space(cp)) {
      break;
    }
    end = start;
  }
  return text.substr(begin, end - begin);
}

} // namespace clausekit::common
