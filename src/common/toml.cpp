#include "tutorguard/common/toml.hpp"

#include "tutorguard/common/strings.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>

namespace tutorguard::common {

namespace {

// Drops a trailing `# comment` that is not inside a string literal.
std::string strip_comment(const std::string &line) {
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (escaped) {
      escaped = false;
      continue;
    }
    if (in_string && ch == '\\') {
      escaped = true;
      continue;
    }
    if (ch == '"') {
      in_string = !in_string;
      continue;
    }
    if (!in_string && ch == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string unquote(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }

  std::string out;
  out.reserve(value.size() - 2);
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (ch != '\\' || i + 2 >= value.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = value[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::vector<std::string> split_array(const std::string &body) {
  std::vector<std::string> items;
  std::string current;
  bool in_string = false;
  bool escaped = false;
  for (const char ch : body) {
    if (escaped) {
      escaped = false;
      current.push_back(ch);
      continue;
    }
    if (in_string && ch == '\\') {
      escaped = true;
      current.push_back(ch);
      continue;
    }
    if (ch == '"') {
      in_string = !in_string;
    }
    if (!in_string && ch == ',') {
      items.push_back(trim(current));
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  if (!trim(current).empty()) {
    items.push_back(trim(current));
  }
  return items;
}

} // namespace

void TomlDocument::set(std::string key, std::string raw_value) {
  values_[std::move(key)] = std::move(raw_value);
}

bool TomlDocument::has(const std::string &key) const { return values_.contains(key); }

std::optional<std::string> TomlDocument::raw(const std::string &key) const {
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return trim(it->second);
}

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto value = raw(key);
  return value.has_value() ? unquote(*value) : fallback;
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto value = raw(key);
  if (!value.has_value()) {
    return fallback;
  }
  if (*value == "true") {
    return true;
  }
  if (*value == "false") {
    return false;
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto value = raw(key);
  if (!value.has_value()) {
    return fallback;
  }
  std::string digits;
  digits.reserve(value->size());
  for (const char ch : *value) {
    if (ch != '_') {
      digits.push_back(ch);
    }
  }
  std::uint64_t parsed = 0;
  const auto *first = digits.data();
  const auto *last = first + digits.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }
  return parsed;
}

double TomlDocument::get_double(const std::string &key, const double fallback) const {
  const auto value = raw(key);
  if (!value.has_value() || value->empty()) {
    return fallback;
  }
  char *end = nullptr;
  const double parsed = std::strtod(value->c_str(), &end);
  if (end != value->c_str() + value->size()) {
    return fallback;
  }
  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto value = raw(key);
  if (!value.has_value() || value->size() < 2 || value->front() != '[' || value->back() != ']') {
    return fallback;
  }
  std::vector<std::string> out;
  for (const auto &item : split_array(value->substr(1, value->size() - 2))) {
    if (!item.empty()) {
      out.push_back(unquote(item));
    }
  }
  return out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean = trim(strip_comment(line));
    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[') {
      if (clean.back() != ']') {
        return Result<TomlDocument>::failure("Unterminated section header at line " +
                                             std::to_string(line_number));
      }
      section = trim(clean.substr(1, clean.size() - 2));
      if (section.empty()) {
        return Result<TomlDocument>::failure("Empty section header at line " +
                                             std::to_string(line_number));
      }
      continue;
    }

    const auto equals = clean.find('=');
    if (equals == std::string::npos) {
      return Result<TomlDocument>::failure("Expected key = value at line " +
                                           std::to_string(line_number));
    }
    const std::string key = trim(clean.substr(0, equals));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " + std::to_string(line_number));
    }
    document.set(section.empty() ? key : section + "." + key, trim(clean.substr(equals + 1)));
  }

  return Result<TomlDocument>::success(std::move(document));
}

} // namespace tutorguard::common
