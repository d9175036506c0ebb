#include "couponvault/common/json_util.hpp"

#include <cctype>
#include <charconv>

namespace couponvault::common {

namespace {

// Position of the first value character after `"field":`, or npos.
std::size_t value_start(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return std::string::npos;
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return std::string::npos;
  }
  const std::size_t pos = json_skip_ws(json, colon + 1);
  return pos < json.size() ? pos : std::string::npos;
}

std::string scalar_token(const std::string &json, std::size_t pos) {
  const std::size_t start = pos;
  while (pos < json.size()) {
    const char ch = json[pos];
    if (ch == ',' || ch == '}' || ch == ']' || std::isspace(static_cast<unsigned char>(ch)) != 0) {
      break;
    }
    ++pos;
  }
  return json.substr(start, pos - start);
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
      escaped.push_back(ch);
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  bool escaped = false;
  for (const char ch : raw) {
    if (!escaped) {
      if (ch == '\\') {
        escaped = true;
      } else {
        out.push_back(ch);
      }
      continue;
    }
    switch (ch) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    default:
      out.push_back(ch);
      break;
    }
    escaped = false;
  }
  return out;
}

std::size_t json_find_key(const std::string &json, const std::string &key, std::size_t from) {
  const std::string quoted = "\"" + key + "\"";
  std::size_t pos = json.find(quoted, from);
  while (pos != std::string::npos) {
    // A string value that happens to equal the key is not followed by ':'.
    const std::size_t after = json_skip_ws(json, pos + quoted.size());
    if (after < json.size() && json[after] == ':') {
      return pos;
    }
    pos = json.find(quoted, pos + 1);
  }
  return std::string::npos;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::optional<std::string> json_get_string(const std::string &json, const std::string &field) {
  const std::size_t pos = value_start(json, field);
  if (pos == std::string::npos || json[pos] != '"') {
    return std::nullopt;
  }
  const auto end = json_find_string_end(json, pos);
  if (end == std::string::npos) {
    return std::nullopt;
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::optional<std::int64_t> json_get_int(const std::string &json, const std::string &field) {
  const std::size_t pos = value_start(json, field);
  if (pos == std::string::npos || json[pos] == '"') {
    return std::nullopt;
  }
  const std::string token = scalar_token(json, pos);
  if (token.empty()) {
    return std::nullopt;
  }

  std::int64_t parsed = 0;
  const auto *first = token.data();
  const auto *last = first + token.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr == first) {
    return std::nullopt;
  }
  // Accept a trailing fraction ("1700000000000.0") but nothing else.
  if (ptr != last) {
    if (*ptr != '.') {
      return std::nullopt;
    }
    for (const auto *it = ptr + 1; it != last; ++it) {
      if (std::isdigit(static_cast<unsigned char>(*it)) == 0) {
        return std::nullopt;
      }
    }
  }
  return parsed;
}

std::optional<bool> json_get_bool(const std::string &json, const std::string &field) {
  const std::size_t pos = value_start(json, field);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  const std::string token = scalar_token(json, pos);
  if (token == "true") {
    return true;
  }
  if (token == "false") {
    return false;
  }
  return std::nullopt;
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const std::size_t pos = value_start(json, field);
  if (pos == std::string::npos || json[pos] != '[') {
    return "";
  }
  const auto end = json_find_matching_token(json, pos, '[', ']');
  if (end == std::string::npos || end < pos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  if (array_json.size() < 2 || array_json.front() != '[' || array_json.back() != ']') {
    return out;
  }

  bool in_string = false;
  bool escaped = false;
  std::size_t depth = 0;
  std::size_t current_start = std::string::npos;
  for (std::size_t i = 1; i + 1 < array_json.size(); ++i) {
    const char ch = array_json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == '{') {
      if (depth == 0) {
        current_start = i;
      }
      ++depth;
      continue;
    }
    if (ch == '}') {
      if (depth == 0) {
        continue;
      }
      --depth;
      if (depth == 0 && current_start != std::string::npos) {
        out.push_back(array_json.substr(current_start, i - current_start + 1));
        current_start = std::string::npos;
      }
    }
  }
  return out;
}

} // namespace couponvault::common
