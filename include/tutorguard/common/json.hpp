#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tutorguard::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Decode the JSON string literal whose opening quote is at `quote_pos`. On success `end`
/// is set to the position just past the closing quote.
[[nodiscard]] std::optional<std::string> json_read_string(const std::string &json,
                                                          std::size_t quote_pos,
                                                          std::size_t &end);

/// Every string value stored under `"key"` at or after `from`, in document order.
[[nodiscard]] std::vector<std::string> json_string_values(const std::string &json,
                                                          const std::string &key,
                                                          std::size_t from = 0);

} // namespace tutorguard::common
