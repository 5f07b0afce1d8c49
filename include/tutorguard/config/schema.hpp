#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tutorguard::config {

inline constexpr const char *DEFAULT_SYSTEM_INSTRUCTION =
    "You are Prasad K. Gamage, a dedicated educational tutor for Sri Lankan students from "
    "Grade 1 to Grade 13, including O/L and A/L candidates.\n"
    "Identity rules:\n"
    "- You are Prasad K. Gamage, a teacher. When asked who you are, answer \"I'm Prasad K. "
    "Gamage, your learning assistant\".\n"
    "- Never describe yourself as a bot, a model or a computer program.\n"
    "Teaching rules:\n"
    "- Explain every subject of the Sri Lankan curriculum in simple, grade-appropriate "
    "language with step-by-step worked examples.\n"
    "- Reply in Sinhala by default; switch to English or Tamil when the student asks.\n"
    "- Be patient, warm and encouraging, and check understanding with short questions.\n"
    "- Use markdown for readability.";

struct PersonaConfig {
  std::string name = "Prasad K. Gamage";
  std::string match_name = "prasad";
  std::string system_instruction = DEFAULT_SYSTEM_INSTRUCTION;
};

struct ValidationConfig {
  std::size_t max_message_length = 5000;
  std::size_t min_message_length = 1;
  double special_char_ratio = 0.4;
  double encoded_ratio = 0.2;
  bool prompt_injection_detection = true;
  bool content_filtering = true;
  std::vector<std::string> extra_patterns;
};

struct RateLimitConfig {
  std::uint32_t per_minute = 20;
  std::uint32_t per_hour = 100;
  std::uint64_t minute_window_seconds = 60;
  std::uint64_t hour_window_seconds = 3600;
};

struct ModelsConfig {
  std::vector<std::string> roster = {
      "gemini-2.5-flash",      "gemini-2.0-flash-001",      "gemini-flash-latest",
      "gemini-2.5-flash-lite", "gemini-2.0-flash-lite-001", "gemini-2.5-pro"};
  double temperature = 0.7;
};

struct BackendConfig {
  std::string kind = "gemini";
  std::optional<std::string> api_key;
  std::string base_url = "https://generativelanguage.googleapis.com/v1beta";
  std::uint64_t timeout_ms = 60'000;
};

struct SessionConfig {
  std::size_t max_turns = 100;
  std::uint64_t idle_timeout_minutes = 60;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string log_level = "info";
};

struct Config {
  PersonaConfig persona;
  ValidationConfig validation;
  RateLimitConfig rate_limit;
  ModelsConfig models;
  BackendConfig backend;
  SessionConfig session;
  ObservabilityConfig observability;
};

} // namespace tutorguard::config
