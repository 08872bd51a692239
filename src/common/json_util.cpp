#include "clausekit/common/json_util.hpp"

#include "clausekit/common/utf8.hpp"

#include <cctype>
#include <cstdio>

namespace clausekit::common {

namespace {

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

std::optional<char32_t> read_hex4(const std::string &raw, const std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return std::nullopt;
  }
  char32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const int digit = hex_value(raw[i]);
    if (digit < 0) {
      return std::nullopt;
    }
    value = (value << 4U) | static_cast<char32_t>(digit);
  }
  return value;
}

// Locates the first non-space byte after `"field":`.
std::size_t find_field_value(const std::string &json, const std::string &field) {
  const std::string quoted = "\"" + field + "\"";
  std::size_t key_pos = json.find(quoted);
  while (key_pos != std::string::npos) {
    const std::size_t after = json_skip_ws(json, key_pos + quoted.size());
    if (after < json.size() && json[after] == ':') {
      return json_skip_ws(json, after + 1);
    }
    key_pos = json.find(quoted, key_pos + 1);
  }
  return std::string::npos;
}

std::string bracketed_field(const std::string &json, const std::string &field, const char open,
                            const char close) {
  const std::size_t pos = find_field_value(json, field);
  if (pos == std::string::npos || pos >= json.size() || json[pos] != open) {
    return "";
  }
  const auto end = json_find_matching_token(json, pos, open, close);
  if (end == std::string::npos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20U) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      auto unit = read_hex4(raw, i + 1);
      if (!unit.has_value()) {
        out += "\\u";
        break;
      }
      i += 4;
      char32_t codepoint = *unit;
      if (codepoint >= 0xD800 && codepoint <= 0xDBFF && i + 2 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        const auto low = read_hex4(raw, i + 3);
        if (low.has_value() && *low >= 0xDC00 && *low <= 0xDFFF) {
          codepoint = 0x10000 + ((codepoint - 0xD800) << 10U) + (*low - 0xDC00);
          i += 6;
        }
      }
      out += utf8_encode(codepoint);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, const std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (escaped) {
      escaped = false;
      continue;
    }
    if (ch == '\\') {
      escaped = true;
      continue;
    }
    if (ch == '"') {
      return i;
    }
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, const std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      const auto end = json_find_string_end(json, i);
      if (end == std::string::npos) {
        return std::string::npos;
      }
      i = end;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const std::size_t pos = find_field_value(json, field);
  if (pos == std::string::npos || pos >= json.size() || json[pos] != '"') {
    return "";
  }
  const auto end = json_find_string_end(json, pos);
  if (end == std::string::npos) {
    return "";
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_number(const std::string &json, const std::string &field) {
  std::size_t pos = find_field_value(json, field);
  if (pos == std::string::npos || pos >= json.size()) {
    return "";
  }
  const std::size_t start = pos;
  while (pos < json.size()) {
    const char ch = json[pos];
    if (std::isdigit(static_cast<unsigned char>(ch)) == 0 && ch != '-' && ch != '+' && ch != '.' &&
        ch != 'e' && ch != 'E') {
      break;
    }
    ++pos;
  }
  return json.substr(start, pos - start);
}

std::optional<bool> json_get_bool(const std::string &json, const std::string &field) {
  const std::size_t pos = find_field_value(json, field);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  if (json.compare(pos, 4, "true") == 0) {
    return true;
  }
  if (json.compare(pos, 5, "false") == 0) {
    return false;
  }
  return std::nullopt;
}

std::string json_get_object(const std::string &json, const std::string &field) {
  return bracketed_field(json, field, '{', '}');
}

std::string json_get_array(const std::string &json, const std::string &field) {
  return bracketed_field(json, field, '[', ']');
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  const std::size_t open = json_skip_ws(array_json, 0);
  if (open >= array_json.size() || array_json[open] != '[') {
    return out;
  }
  const std::size_t close = json_find_matching_token(array_json, open, '[', ']');
  if (close == std::string::npos) {
    return out;
  }

  std::size_t pos = open + 1;
  while (pos < close) {
    const char ch = array_json[pos];
    if (ch == '"') {
      const auto end = json_find_string_end(array_json, pos);
      if (end == std::string::npos) {
        break;
      }
      pos = end + 1;
      continue;
    }
    if (ch == '{') {
      const auto end = json_find_matching_token(array_json, pos, '{', '}');
      if (end == std::string::npos || end > close) {
        break;
      }
      out.push_back(array_json.substr(pos, end - pos + 1));
      pos = end + 1;
      continue;
    }
    ++pos;
  }
  return out;
}

std::string json_extract_first_array(const std::string &text) {
  std::size_t open = text.find('[');
  while (open != std::string::npos) {
    const auto close = json_find_matching_token(text, open, '[', ']');
    if (close != std::string::npos) {
      return text.substr(open, close - open + 1);
    }
    open = text.find('[', open + 1);
  }
  return "";
}

} // namespace clausekit::common
