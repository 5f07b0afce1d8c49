#pragma once

#include "tutorguard/config/schema.hpp"
#include "tutorguard/security/sanitizer.hpp"
#include "tutorguard/security/verdict.hpp"

#include <string>
#include <string_view>

namespace tutorguard::security {

extern const std::string STUDENT_MESSAGE_START;
extern const std::string STUDENT_MESSAGE_END;

extern const std::string PLACEHOLDER_SENSITIVE;
extern const std::string PLACEHOLDER_SYSTEM_LEAK;
extern const std::string PLACEHOLDER_AI_REFERENCE;
extern const std::string PLACEHOLDER_IDENTITY;

/// Replaces any delimiter marker inside `content` (case-insensitive) with a neutral token.
[[nodiscard]] std::string neutralize_markers(std::string_view content);

[[nodiscard]] bool contains_api_key(std::string_view text);

/// Wraps user text for the generation backend and screens its replies for leaks and
/// persona breaks.
class ResponseGuard {
public:
  explicit ResponseGuard(config::PersonaConfig persona);

  [[nodiscard]] std::string wrap(const SanitizedMessage &message) const;
  [[nodiscard]] GuardVerdict validate(std::string_view response) const;

  [[nodiscard]] const config::PersonaConfig &persona() const { return persona_; }

private:
  config::PersonaConfig persona_;
  std::string match_name_;
};

} // namespace tutorguard::security
