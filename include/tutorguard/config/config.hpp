#pragma once

#include "tutorguard/common/result.hpp"
#include "tutorguard/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tutorguard::config {

[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);

/// Expands a leading `~` and `$VAR` / `${VAR}` references.
[[nodiscard]] std::string expand_config_value(const std::string &value);

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> load_config_from_string(const std::string &content);

/// Returns warnings on success; hard errors fail the result.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace tutorguard::config
