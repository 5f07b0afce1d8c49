#pragma once

#include "tutorguard/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tutorguard::common {

/// Flat view of a TOML file: `[section]` headers are folded into dotted keys and values are
/// kept as raw literals until a typed getter reads them.
class TomlDocument {
public:
  void set(std::string key, std::string raw_value);

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;

private:
  [[nodiscard]] std::optional<std::string> raw(const std::string &key) const;

  std::unordered_map<std::string, std::string> values_;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace tutorguard::common
