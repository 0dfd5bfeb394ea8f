#include "nexus/common/json_util.hpp"

#include <cctype>
#include <cstdio>

namespace nexus::common {

namespace {

std::size_t skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

// Position of the first character of the value bound to `field`, or npos.
std::size_t value_start(const std::string &json, const std::string &field) {
  const std::string quoted = "\"" + field + "\"";
  std::size_t key_pos = json.find(quoted);
  while (key_pos != std::string::npos) {
    const std::size_t after = skip_ws(json, key_pos + quoted.size());
    if (after < json.size() && json[after] == ':') {
      return skip_ws(json, after + 1);
    }
    key_pos = json.find(quoted, key_pos + 1);
  }
  return std::string::npos;
}

std::size_t string_end(const std::string &json, const std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (escaped) {
      escaped = false;
      continue;
    }
    if (ch == '\\') {
      escaped = true;
    } else if (ch == '"') {
      return i;
    }
  }
  return std::string::npos;
}

std::string unescape(const std::string &raw) {
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
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
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
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buf;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto pos = value_start(json, field);
  if (pos == std::string::npos || pos >= json.size() || json[pos] != '"') {
    return "";
  }
  const auto end = string_end(json, pos);
  if (end == std::string::npos) {
    return "";
  }
  return unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_number(const std::string &json, const std::string &field) {
  const auto start = value_start(json, field);
  if (start == std::string::npos || start >= json.size()) {
    return "";
  }
  std::size_t pos = start;
  while (pos < json.size()) {
    const char ch = json[pos];
    if (std::isdigit(static_cast<unsigned char>(ch)) == 0 && ch != '-' && ch != '.' &&
        ch != 'e' && ch != 'E' && ch != '+') {
      break;
    }
    ++pos;
  }
  return json.substr(start, pos - start);
}

std::string json_get_object(const std::string &json, const std::string &field) {
  const auto start = value_start(json, field);
  if (start == std::string::npos || start >= json.size() || json[start] != '{') {
    return "";
  }
  std::size_t depth = 0;
  for (std::size_t i = start; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      const auto end = string_end(json, i);
      if (end == std::string::npos) {
        return "";
      }
      i = end;
      continue;
    }
    if (ch == '{') {
      ++depth;
    } else if (ch == '}') {
      --depth;
      if (depth == 0) {
        return json.substr(start, i - start + 1);
      }
    }
  }
  return "";
}

} // namespace nexus::common
