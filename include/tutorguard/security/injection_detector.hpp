#pragma once

#include "tutorguard/security/rules.hpp"
#include "tutorguard/security/sanitizer.hpp"
#include "tutorguard/security/verdict.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tutorguard::security {

/// Classifies sanitized text. Checks run in a fixed order and the first failure wins:
/// length, injection patterns, obfuscation ratio, encoded content, SQL/command structure.
class InjectionDetector {
public:
  explicit InjectionDetector(std::shared_ptr<const ValidationRuleSet> rules);

  [[nodiscard]] GuardVerdict check(const SanitizedMessage &message) const;

  [[nodiscard]] std::optional<std::string> check_length(std::string_view text) const;
  [[nodiscard]] std::optional<std::string> check_patterns(std::string_view text) const;
  [[nodiscard]] std::optional<std::string> check_obfuscation(std::string_view text) const;
  [[nodiscard]] std::optional<std::string> check_encoded(std::string_view text) const;
  [[nodiscard]] std::optional<std::string> check_structure(std::string_view text) const;

  [[nodiscard]] const ValidationRuleSet &rules() const { return *rules_; }

private:
  std::shared_ptr<const ValidationRuleSet> rules_;
};

/// Fraction of code points that are not ASCII letters, digits, whitespace, Sinhala or Tamil.
[[nodiscard]] double special_character_ratio(std::string_view text);

/// Fraction of code points that are `%`, `&` or `#`.
[[nodiscard]] double encoding_character_ratio(std::string_view text);

} // namespace tutorguard::security
