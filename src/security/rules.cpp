#include "tutorguard/security/rules.hpp"

namespace tutorguard::security {

std::string_view rule_category_name(const RuleCategory category) {
  switch (category) {
  case RuleCategory::InstructionOverride:
    return "instruction_override";
  case RuleCategory::SystemExtraction:
    return "system_extraction";
  case RuleCategory::DelimiterAttack:
    return "delimiter_attack";
  case RuleCategory::EncodingMarker:
    return "encoding_marker";
  case RuleCategory::SqlInjection:
    return "sql_injection";
  case RuleCategory::CommandInjection:
    return "command_injection";
  case RuleCategory::Custom:
    return "custom";
  }
  return "custom";
}

bool is_structural(const RuleCategory category) {
  return category == RuleCategory::SqlInjection || category == RuleCategory::CommandInjection;
}

const std::vector<RuleSpec> &default_rule_specs() {
  using C = RuleCategory;
  static const std::vector<RuleSpec> specs = {
      {"ignore previous instructions",
       R"(ignore\s+(all\s+)?(previous|prior|above)\s+(instructions?|prompts?))",
       C::InstructionOverride},
      {"disregard previous", R"(disregard\s+(all\s+)?previous)", C::InstructionOverride},
      {"forget everything", R"(forget\s+everything)", C::InstructionOverride},
      {"you are now", R"(you\s+are\s+now)", C::InstructionOverride},
      {"act as", R"(act\s+as)", C::InstructionOverride},
      {"pretend to be", R"(pretend\s+to\s+be)", C::InstructionOverride},
      {"new instructions", R"(new\s+instructions?:)", C::InstructionOverride},
      {"override", R"(override)", C::InstructionOverride},

      {"show system prompt", R"(show\s+me\s+your\s+(system|prompt|instructions))",
       C::SystemExtraction},
      {"ask for instructions", R"(what\s+(are|is)\s+your\s+instructions?)", C::SystemExtraction},
      {"reveal your", R"(reveal\s+your)", C::SystemExtraction},
      {"tell system prompt", R"(tell\s+me\s+your\s+(system|prompt))", C::SystemExtraction},

      {"system role marker", R"(system\s*:)", C::DelimiterAttack},
      {"script tag", R"(<\s*script)", C::DelimiterAttack},
      {"javascript uri", R"(javascript:)", C::DelimiterAttack},
      {"eval call", R"(eval\s*\()", C::DelimiterAttack},
      {"exec call", R"(exec\s*\()", C::DelimiterAttack},

      {"base64 padding", R"(=+$)", C::EncodingMarker},

      {"sql keyword", R"((?:union|select|insert|update|delete|drop|create|alter)\s+)",
       C::SqlInjection},
      {"sql line comment", R"(--\s*$)", C::SqlInjection},
      {"sql block comment", R"(/\*.*\*/)", C::SqlInjection},

      {"chained destructive command", R"(;\s*(?:rm|del|format|shutdown))", C::CommandInjection},
      {"command substitution", R"(\$\([^)]+\))", C::CommandInjection},
      {"backtick execution", R"(`[^`]+`)", C::CommandInjection},
      {"and-chained destructive command", R"(&&\s*(?:rm|del|format))", C::CommandInjection},
      {"pipe to reader", R"(\|\s*(?:cat|ls|dir|type|more))", C::CommandInjection},
      {"path traversal", R"(\.\./)", C::CommandInjection},
      {"windows path traversal", R"(\.\.\\)", C::CommandInjection},
  };
  return specs;
}

common::Status ValidationRuleSet::add_rule(std::string label, std::string pattern,
                                           const RuleCategory category) {
  InjectionRule rule{.label = std::move(label), .pattern = std::move(pattern), .category = category};
  try {
    rule.regex = std::regex(rule.pattern, std::regex::ECMAScript | std::regex::icase);
  } catch (const std::regex_error &ex) {
    return common::Status::error("invalid pattern for rule '" + rule.label + "': " + ex.what());
  }

  if (is_structural(category)) {
    structural_rules_.push_back(std::move(rule));
  } else {
    pattern_rules_.push_back(std::move(rule));
  }
  return common::Status::success();
}

common::Result<std::shared_ptr<const ValidationRuleSet>>
ValidationRuleSet::from_specs(const std::vector<RuleSpec> &specs,
                              const config::ValidationConfig &config) {
  using Outcome = common::Result<std::shared_ptr<const ValidationRuleSet>>;

  auto rules = std::make_shared<ValidationRuleSet>(Key{});
  rules->max_length_ = config.max_message_length;
  rules->min_length_ = config.min_message_length;
  rules->special_char_ratio_ = config.special_char_ratio;
  rules->encoded_ratio_ = config.encoded_ratio;
  rules->prompt_injection_detection_ = config.prompt_injection_detection;
  rules->content_filtering_ = config.content_filtering;

  for (const auto &spec : specs) {
    if (auto status = rules->add_rule(spec.label, spec.pattern, spec.category); !status.ok()) {
      return Outcome::failure(status.error());
    }
  }
  for (const auto &pattern : config.extra_patterns) {
    if (auto status = rules->add_rule("custom: " + pattern, pattern, RuleCategory::Custom);
        !status.ok()) {
      return Outcome::failure(status.error());
    }
  }

  return Outcome::success(std::move(rules));
}

common::Result<std::shared_ptr<const ValidationRuleSet>>
ValidationRuleSet::from_config(const config::ValidationConfig &config) {
  return from_specs(default_rule_specs(), config);
}

} // namespace tutorguard::security
