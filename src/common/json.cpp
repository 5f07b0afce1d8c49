#include "tutorguard/common/json.hpp"

#include <cstdint>
#include <cstdio>

namespace tutorguard::common {

namespace {

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80U) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else if (cp < 0x10000U) {
    out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  }
}

std::optional<std::uint32_t> read_hex4(const std::string &json, const std::size_t pos) {
  if (pos + 4 > json.size()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = json[i];
    value <<= 4U;
    if (ch >= '0' && ch <= '9') {
      value |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      value |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      value |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return std::nullopt;
    }
  }
  return value;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string out;
  out.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20U) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        out += buffer;
      } else {
        out.push_back(ch);
      }
      break;
    }
  }
  return out;
}

std::optional<std::string> json_read_string(const std::string &json, const std::size_t quote_pos,
                                            std::size_t &end) {
  if (quote_pos >= json.size() || json[quote_pos] != '"') {
    return std::nullopt;
  }

  std::string out;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      end = i + 1;
      return out;
    }
    if (ch != '\\') {
      out.push_back(ch);
      continue;
    }
    if (++i >= json.size()) {
      return std::nullopt;
    }
    switch (json[i]) {
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
      auto cp = read_hex4(json, i + 1);
      if (!cp.has_value()) {
        return std::nullopt;
      }
      i += 4;
      if (*cp >= 0xD800U && *cp <= 0xDBFFU && i + 6 < json.size() && json[i + 1] == '\\' &&
          json[i + 2] == 'u') {
        const auto low = read_hex4(json, i + 3);
        if (low.has_value() && *low >= 0xDC00U && *low <= 0xDFFFU) {
          *cp = 0x10000U + ((*cp - 0xD800U) << 10U) + (*low - 0xDC00U);
          i += 6;
        }
      }
      append_utf8(out, *cp);
      break;
    }
    default:
      out.push_back(json[i]);
      break;
    }
  }
  return std::nullopt;
}

std::vector<std::string> json_string_values(const std::string &json, const std::string &key,
                                            const std::size_t from) {
  std::vector<std::string> values;
  const std::string needle = "\"" + key + "\"";
  std::size_t pos = json.find(needle, from);
  while (pos != std::string::npos) {
    std::size_t cursor = pos + needle.size();
    while (cursor < json.size() && (json[cursor] == ' ' || json[cursor] == '\n' ||
                                    json[cursor] == '\r' || json[cursor] == '\t')) {
      ++cursor;
    }
    std::size_t next = pos + needle.size();
    if (cursor < json.size() && json[cursor] == ':') {
      ++cursor;
      while (cursor < json.size() && (json[cursor] == ' ' || json[cursor] == '\n' ||
                                      json[cursor] == '\r' || json[cursor] == '\t')) {
        ++cursor;
      }
      std::size_t end = 0;
      if (auto value = json_read_string(json, cursor, end); value.has_value()) {
        values.push_back(std::move(*value));
        next = end;
      }
    }
    pos = json.find(needle, next);
  }
  return values;
}

} // namespace tutorguard::common
