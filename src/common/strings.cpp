#include "tutorguard/common/strings.hpp"

#include <algorithm>
#include <cctype>

namespace tutorguard::common {

bool is_ascii_space(const unsigned char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\v' || ch == '\f' || ch == '\r';
}

std::string trim(const std::string_view input) {
  std::size_t first = 0;
  std::size_t last = input.size();
  while (first < last && is_ascii_space(static_cast<unsigned char>(input[first]))) {
    ++first;
  }
  while (last > first && is_ascii_space(static_cast<unsigned char>(input[last - 1]))) {
    --last;
  }
  return std::string(input.substr(first, last - first));
}

bool starts_with(const std::string_view value, const std::string_view prefix) {
  return value.substr(0, prefix.size()) == prefix;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

bool contains_ascii_ci(const std::string_view haystack, const std::string_view needle) {
  if (needle.empty()) {
    return true;
  }
  const auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                              [](unsigned char a, unsigned char b) {
                                return std::tolower(a) == std::tolower(b);
                              });
  return it != haystack.end();
}

std::vector<std::string> split_list(const std::string_view value, const char separator) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= value.size()) {
    auto end = value.find(separator, start);
    if (end == std::string_view::npos) {
      end = value.size();
    }
    std::string item = trim(value.substr(start, end - start));
    if (!item.empty()) {
      out.push_back(std::move(item));
    }
    start = end + 1;
  }
  return out;
}

std::uint32_t next_codepoint(const std::string_view input, std::size_t &index) {
  const auto lead = static_cast<unsigned char>(input[index]);
  std::size_t extra = 0;
  std::uint32_t value = 0;
  if (lead < 0x80U) {
    ++index;
    return lead;
  }
  if ((lead & 0xE0U) == 0xC0U) {
    extra = 1;
    value = lead & 0x1FU;
  } else if ((lead & 0xF0U) == 0xE0U) {
    extra = 2;
    value = lead & 0x0FU;
  } else if ((lead & 0xF8U) == 0xF0U) {
    extra = 3;
    value = lead & 0x07U;
  } else {
    ++index;
    return lead;
  }

  if (index + extra >= input.size()) {
    ++index;
    return lead;
  }
  for (std::size_t i = 1; i <= extra; ++i) {
    const auto cont = static_cast<unsigned char>(input[index + i]);
    if ((cont & 0xC0U) != 0x80U) {
      ++index;
      return lead;
    }
    value = (value << 6U) | static_cast<std::uint32_t>(cont & 0x3FU);
  }
  index += extra + 1;
  return value;
}

std::size_t utf8_length(const std::string_view input) {
  std::size_t count = 0;
  std::size_t index = 0;
  while (index < input.size()) {
    next_codepoint(input, index);
    ++count;
  }
  return count;
}

} // namespace tutorguard::common
