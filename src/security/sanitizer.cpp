#include "tutorguard/security/sanitizer.hpp"

#include "tutorguard/common/strings.hpp"

#include <cctype>

namespace tutorguard::security {

namespace {

// Length of the entity reference starting at `pos` (`&name;`, `&#123;`, `&#x1F;`), or 0.
std::size_t entity_length(const std::string_view input, const std::size_t pos) {
  std::size_t i = pos + 1;
  if (i >= input.size()) {
    return 0;
  }

  if (input[i] == '#') {
    ++i;
    bool hex = false;
    if (i < input.size() && (input[i] == 'x' || input[i] == 'X')) {
      hex = true;
      ++i;
    }
    const std::size_t digits_start = i;
    while (i < input.size() &&
           (hex ? std::isxdigit(static_cast<unsigned char>(input[i])) != 0
                : std::isdigit(static_cast<unsigned char>(input[i])) != 0)) {
      ++i;
    }
    if (i == digits_start || i >= input.size() || input[i] != ';') {
      return 0;
    }
    return i - pos + 1;
  }

  if (std::isalpha(static_cast<unsigned char>(input[i])) == 0) {
    return 0;
  }
  while (i < input.size() && std::isalnum(static_cast<unsigned char>(input[i])) != 0) {
    ++i;
  }
  if (i >= input.size() || input[i] != ';') {
    return 0;
  }
  return i - pos + 1;
}

} // namespace

std::string escape_markup(const std::string_view input) {
  std::string out;
  out.reserve(input.size() + input.size() / 8);
  for (std::size_t i = 0; i < input.size(); ++i) {
    const char ch = input[i];
    switch (ch) {
    case '&':
      if (const auto len = entity_length(input, i); len > 0) {
        out.append(input.substr(i, len));
        i += len - 1;
      } else {
        out += "&amp;";
      }
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&#x27;";
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  return out;
}

std::string strip_control_bytes(const std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (const char ch : input) {
    const auto byte = static_cast<unsigned char>(ch);
    if ((byte < 0x20U || byte == 0x7FU) && !common::is_ascii_space(byte)) {
      continue;
    }
    out.push_back(ch);
  }
  return out;
}

std::string collapse_whitespace(const std::string_view input) {
  std::string out;
  out.reserve(input.size());
  bool pending_space = false;
  for (const char ch : input) {
    if (common::is_ascii_space(static_cast<unsigned char>(ch))) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(ch);
  }
  return out;
}

SanitizedMessage sanitize(const std::string_view raw) {
  const std::string trimmed = common::trim(raw);
  const std::string escaped = escape_markup(trimmed);
  const std::string stripped = strip_control_bytes(escaped);
  return SanitizedMessage(collapse_whitespace(stripped));
}

} // namespace tutorguard::security
