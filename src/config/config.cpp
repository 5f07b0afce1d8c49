#include "tutorguard/config/config.hpp"

#include "tutorguard/common/strings.hpp"
#include "tutorguard/common/toml.hpp"

#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

namespace tutorguard::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".tutorguard";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

const char *non_empty_env(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

bool is_known_log_level(const std::string &level) {
  const std::string normalized = common::to_lower(common::trim(level));
  return normalized == "debug" || normalized == "info" || normalized == "warn" ||
         normalized == "error";
}

void load_persona(Config &config, const common::TomlDocument &doc) {
  config.persona.name = doc.get_string("persona.name", config.persona.name);
  config.persona.match_name = doc.get_string("persona.match_name", config.persona.match_name);
  config.persona.system_instruction =
      doc.get_string("persona.system_instruction", config.persona.system_instruction);
}

void load_validation(Config &config, const common::TomlDocument &doc) {
  auto &validation = config.validation;
  validation.max_message_length = static_cast<std::size_t>(
      doc.get_u64("validation.max_message_length", validation.max_message_length));
  validation.min_message_length = static_cast<std::size_t>(
      doc.get_u64("validation.min_message_length", validation.min_message_length));
  validation.special_char_ratio =
      doc.get_double("validation.special_char_ratio", validation.special_char_ratio);
  validation.encoded_ratio = doc.get_double("validation.encoded_ratio", validation.encoded_ratio);
  validation.prompt_injection_detection =
      doc.get_bool("validation.prompt_injection_detection", validation.prompt_injection_detection);
  validation.content_filtering =
      doc.get_bool("validation.content_filtering", validation.content_filtering);
  validation.extra_patterns =
      doc.get_string_array("validation.extra_patterns", validation.extra_patterns);
}

void load_rate_limit(Config &config, const common::TomlDocument &doc) {
  auto &limits = config.rate_limit;
  limits.per_minute =
      static_cast<std::uint32_t>(doc.get_u64("rate_limit.per_minute", limits.per_minute));
  limits.per_hour = static_cast<std::uint32_t>(doc.get_u64("rate_limit.per_hour", limits.per_hour));
  limits.minute_window_seconds =
      doc.get_u64("rate_limit.minute_window_seconds", limits.minute_window_seconds);
  limits.hour_window_seconds =
      doc.get_u64("rate_limit.hour_window_seconds", limits.hour_window_seconds);
}

void load_models_and_backend(Config &config, const common::TomlDocument &doc) {
  config.models.roster = doc.get_string_array("models.roster", config.models.roster);
  config.models.temperature = doc.get_double("models.temperature", config.models.temperature);

  config.backend.kind = doc.get_string("backend.kind", config.backend.kind);
  if (doc.has("backend.api_key")) {
    config.backend.api_key = expand_config_value(doc.get_string("backend.api_key"));
  }
  config.backend.base_url =
      expand_config_value(doc.get_string("backend.base_url", config.backend.base_url));
  config.backend.timeout_ms = doc.get_u64("backend.timeout_ms", config.backend.timeout_ms);
}

} // namespace

std::string expand_config_value(const std::string &value) {
  if (value.empty()) {
    return value;
  }

  std::string input = value;
  if (input.front() == '~') {
    if (const char *home = non_empty_env("HOME"); home != nullptr) {
      input.replace(0, 1, home);
    }
  }
  if (input.find('$') == std::string::npos) {
    return input;
  }

  static const std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::string expanded;
  auto begin = std::sregex_iterator(input.begin(), input.end(), env_pattern);
  std::size_t last = 0;
  for (auto it = begin; it != std::sregex_iterator(); ++it) {
    const auto &match = *it;
    expanded += input.substr(last, static_cast<std::size_t>(match.position()) - last);
    if (const char *var = std::getenv(match[1].str().c_str()); var != nullptr) {
      expanded += var;
    }
    last = static_cast<std::size_t>(match.position() + match.length());
  }
  expanded += input.substr(last);
  return expanded;
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override.reset();
    return;
  }
  g_config_path_override = std::filesystem::path(expand_config_value(path->string()));
}

common::Result<std::filesystem::path> config_path() {
  std::optional<std::filesystem::path> override_path = g_config_path_override;
  if (!override_path.has_value()) {
    if (const char *env = non_empty_env("TUTORGUARD_CONFIG_PATH"); env != nullptr) {
      override_path = std::filesystem::path(expand_config_value(env));
    }
  }

  if (override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const char *home = non_empty_env("HOME");
  if (home == nullptr) {
    return common::Result<std::filesystem::path>::failure("HOME is not set");
  }
  return common::Result<std::filesystem::path>::success(std::filesystem::path(home) /
                                                        CONFIG_FOLDER / CONFIG_FILENAME);
}

void apply_env_overrides(Config &config) {
  if (const char *key = non_empty_env("TUTORGUARD_API_KEY"); key != nullptr) {
    config.backend.api_key = std::string(key);
  } else if (const char *gemini = non_empty_env("GEMINI_API_KEY");
             gemini != nullptr &&
             (!config.backend.api_key.has_value() || common::trim(*config.backend.api_key).empty())) {
    config.backend.api_key = std::string(gemini);
  }

  if (const char *models = non_empty_env("TUTORGUARD_MODELS"); models != nullptr) {
    auto roster = common::split_list(models, ',');
    if (!roster.empty()) {
      config.models.roster = std::move(roster);
    }
  }

  if (const char *level = non_empty_env("TUTORGUARD_LOG_LEVEL"); level != nullptr) {
    config.observability.log_level = level;
  }
}

common::Result<Config> load_config_from_string(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }

  const auto &doc = parsed.value();
  Config config;
  load_persona(config, doc);
  load_validation(config, doc);
  load_rate_limit(config, doc);
  load_models_and_backend(config, doc);

  config.session.max_turns =
      static_cast<std::size_t>(doc.get_u64("session.max_turns", config.session.max_turns));
  config.session.idle_timeout_minutes =
      doc.get_u64("session.idle_timeout_minutes", config.session.idle_timeout_minutes);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.log_level =
      doc.get_string("observability.log_level", config.observability.log_level);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto path = config_path();
  if (!path.ok()) {
    return common::Result<Config>::failure(path.error());
  }

  if (!std::filesystem::exists(path.value())) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path.value());
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.value().string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto loaded = load_config_from_string(buffer.str());
  if (!loaded.ok()) {
    return common::Result<Config>::failure(path.value().string() + ": " + loaded.error());
  }
  apply_env_overrides(loaded.value());
  return loaded;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Outcome = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (common::trim(config.persona.name).empty()) {
    return Outcome::failure("persona.name must not be empty");
  }
  if (common::trim(config.persona.match_name).empty()) {
    return Outcome::failure("persona.match_name must not be empty");
  }

  const auto &validation = config.validation;
  if (validation.max_message_length == 0) {
    return Outcome::failure("validation.max_message_length must be > 0");
  }
  if (validation.min_message_length > validation.max_message_length) {
    return Outcome::failure(
        "validation.min_message_length must not exceed validation.max_message_length");
  }
  if (validation.special_char_ratio <= 0.0 || validation.special_char_ratio > 1.0) {
    return Outcome::failure("validation.special_char_ratio must be in (0, 1]");
  }
  if (validation.encoded_ratio <= 0.0 || validation.encoded_ratio > 1.0) {
    return Outcome::failure("validation.encoded_ratio must be in (0, 1]");
  }
  for (const auto &pattern : validation.extra_patterns) {
    try {
      const std::regex compiled(pattern, std::regex::icase);
      (void)compiled;
    } catch (const std::regex_error &ex) {
      return Outcome::failure("validation.extra_patterns contains an invalid pattern '" +
                              pattern + "': " + ex.what());
    }
  }

  const auto &limits = config.rate_limit;
  if (limits.per_minute == 0 || limits.per_hour == 0) {
    return Outcome::failure("rate_limit.per_minute and rate_limit.per_hour must be > 0");
  }
  if (limits.minute_window_seconds == 0 || limits.hour_window_seconds == 0) {
    return Outcome::failure("rate_limit window lengths must be > 0");
  }
  if (limits.minute_window_seconds > limits.hour_window_seconds) {
    return Outcome::failure(
        "rate_limit.minute_window_seconds must not exceed rate_limit.hour_window_seconds");
  }
  if (limits.per_minute > limits.per_hour) {
    warnings.push_back("rate_limit.per_minute is above rate_limit.per_hour; the hourly cap wins");
  }

  if (config.models.roster.empty()) {
    return Outcome::failure("models.roster must list at least one model");
  }
  for (const auto &model : config.models.roster) {
    if (common::trim(model).empty()) {
      return Outcome::failure("models.roster contains an empty model identifier");
    }
  }
  if (config.models.temperature < 0.0 || config.models.temperature > 2.0) {
    return Outcome::failure("models.temperature must be between 0.0 and 2.0");
  }

  const std::string backend = common::to_lower(common::trim(config.backend.kind));
  if (backend != "gemini") {
    return Outcome::failure("Unknown backend.kind: " + config.backend.kind);
  }
  if (backend == "gemini" &&
      (!config.backend.api_key.has_value() || common::trim(*config.backend.api_key).empty())) {
    warnings.push_back("API key is missing (backend.api_key, TUTORGUARD_API_KEY or GEMINI_API_KEY)");
  }
  if (config.backend.timeout_ms == 0) {
    return Outcome::failure("backend.timeout_ms must be > 0");
  }

  if (config.session.max_turns == 0) {
    return Outcome::failure("session.max_turns must be > 0");
  }

  const std::string observer = common::to_lower(common::trim(config.observability.backend));
  if (observer != "log" && observer != "none" && observer != "noop") {
    return Outcome::failure("Invalid observability.backend: " + config.observability.backend);
  }
  if (!is_known_log_level(config.observability.log_level)) {
    return Outcome::failure("Invalid observability.log_level: " + config.observability.log_level);
  }

  return Outcome::success(std::move(warnings));
}

} // namespace tutorguard::config
