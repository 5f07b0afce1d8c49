#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tutorguard::common {

[[nodiscard]] std::string trim(std::string_view input);
[[nodiscard]] bool starts_with(std::string_view value, std::string_view prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] bool contains_ascii_ci(std::string_view haystack, std::string_view needle);
[[nodiscard]] std::vector<std::string> split_list(std::string_view value, char separator);
[[nodiscard]] bool is_ascii_space(unsigned char ch);

/// Decodes one UTF-8 code point starting at `index` and advances past it. Malformed
/// sequences yield the lead byte as a code point so callers never stall.
std::uint32_t next_codepoint(std::string_view input, std::size_t &index);

/// Number of code points in a UTF-8 string.
[[nodiscard]] std::size_t utf8_length(std::string_view input);

} // namespace tutorguard::common
