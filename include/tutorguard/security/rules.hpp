#pragma once

#include "tutorguard/common/result.hpp"
#include "tutorguard/config/schema.hpp"

#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace tutorguard::security {

enum class RuleCategory {
  InstructionOverride,
  SystemExtraction,
  DelimiterAttack,
  EncodingMarker,
  SqlInjection,
  CommandInjection,
  Custom,
};

[[nodiscard]] std::string_view rule_category_name(RuleCategory category);

/// SQL and command rules belong to the structural check; everything else is a
/// prompt-injection pattern.
[[nodiscard]] bool is_structural(RuleCategory category);

struct InjectionRule {
  std::string label;
  std::string pattern;
  RuleCategory category = RuleCategory::Custom;
  std::regex regex;
};

struct RuleSpec {
  const char *label;
  const char *pattern;
  RuleCategory category;
};

/// Built-in rule table in evaluation order.
[[nodiscard]] const std::vector<RuleSpec> &default_rule_specs();

/// Immutable rule table plus thresholds. Built once and shared read-only between requests.
class ValidationRuleSet {
  struct Key {
    explicit Key() = default;
  };

public:
  explicit ValidationRuleSet(Key) {}

  [[nodiscard]] static common::Result<std::shared_ptr<const ValidationRuleSet>>
  from_config(const config::ValidationConfig &config);

  [[nodiscard]] static common::Result<std::shared_ptr<const ValidationRuleSet>>
  from_specs(const std::vector<RuleSpec> &specs, const config::ValidationConfig &config);

  [[nodiscard]] const std::vector<InjectionRule> &pattern_rules() const { return pattern_rules_; }
  [[nodiscard]] const std::vector<InjectionRule> &structural_rules() const {
    return structural_rules_;
  }

  [[nodiscard]] std::size_t max_length() const { return max_length_; }
  [[nodiscard]] std::size_t min_length() const { return min_length_; }
  [[nodiscard]] double special_char_ratio() const { return special_char_ratio_; }
  [[nodiscard]] double encoded_ratio() const { return encoded_ratio_; }
  [[nodiscard]] bool prompt_injection_detection() const { return prompt_injection_detection_; }
  [[nodiscard]] bool content_filtering() const { return content_filtering_; }

private:
  [[nodiscard]] common::Status add_rule(std::string label, std::string pattern,
                                        RuleCategory category);

  std::vector<InjectionRule> pattern_rules_;
  std::vector<InjectionRule> structural_rules_;
  std::size_t max_length_ = 0;
  std::size_t min_length_ = 0;
  double special_char_ratio_ = 0.0;
  double encoded_ratio_ = 0.0;
  bool prompt_injection_detection_ = true;
  bool content_filtering_ = true;
};

} // namespace tutorguard::security
