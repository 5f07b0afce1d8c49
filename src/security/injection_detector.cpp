#include "tutorguard/security/injection_detector.hpp"

#include "tutorguard/common/strings.hpp"

#include <array>

namespace tutorguard::security {

namespace {

constexpr std::array<std::string_view, 5> kEncodingMarkers = {"base64", "unicode", "hex", "&#x",
                                                              "%"};

bool is_ascii_alnum(const std::uint32_t cp) {
  return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z') || (cp >= '0' && cp <= '9');
}

bool is_sinhala(const std::uint32_t cp) { return cp >= 0x0D80U && cp <= 0x0DFFU; }

bool is_tamil(const std::uint32_t cp) { return cp >= 0x0B80U && cp <= 0x0BFFU; }

bool is_allowed_codepoint(const std::uint32_t cp) {
  if (cp < 0x80U && common::is_ascii_space(static_cast<unsigned char>(cp))) {
    return true;
  }
  return is_ascii_alnum(cp) || is_sinhala(cp) || is_tamil(cp);
}

template <typename Pred> double codepoint_ratio(const std::string_view text, Pred pred) {
  std::size_t total = 0;
  std::size_t matched = 0;
  std::size_t index = 0;
  while (index < text.size()) {
    const std::uint32_t cp = common::next_codepoint(text, index);
    ++total;
    if (pred(cp)) {
      ++matched;
    }
  }
  if (total == 0) {
    return 0.0;
  }
  return static_cast<double>(matched) / static_cast<double>(total);
}

} // namespace

double special_character_ratio(const std::string_view text) {
  return codepoint_ratio(text, [](const std::uint32_t cp) { return !is_allowed_codepoint(cp); });
}

double encoding_character_ratio(const std::string_view text) {
  return codepoint_ratio(text,
                         [](const std::uint32_t cp) { return cp == '%' || cp == '&' || cp == '#'; });
}

InjectionDetector::InjectionDetector(std::shared_ptr<const ValidationRuleSet> rules)
    : rules_(std::move(rules)) {}

GuardVerdict InjectionDetector::check(const SanitizedMessage &message) const {
  const std::string &text = message.text();

  if (auto reason = check_length(text)) {
    return GuardVerdict::reject(std::move(*reason));
  }
  if (rules_->prompt_injection_detection()) {
    if (auto reason = check_patterns(text)) {
      return GuardVerdict::reject(std::move(*reason));
    }
  }
  if (auto reason = check_obfuscation(text)) {
    return GuardVerdict::reject(std::move(*reason));
  }
  if (auto reason = check_encoded(text)) {
    return GuardVerdict::reject(std::move(*reason));
  }
  if (rules_->content_filtering()) {
    if (auto reason = check_structure(text)) {
      return GuardVerdict::reject(std::move(*reason));
    }
  }

  return GuardVerdict::pass(text);
}

std::optional<std::string> InjectionDetector::check_length(const std::string_view text) const {
  if (text.empty()) {
    return std::string("Message cannot be empty");
  }
  const std::size_t length = common::utf8_length(text);
  if (length > rules_->max_length()) {
    return "Message exceeds maximum length of " + std::to_string(rules_->max_length()) +
           " characters";
  }
  if (length < rules_->min_length()) {
    return std::string("Message is too short");
  }
  return std::nullopt;
}

std::optional<std::string> InjectionDetector::check_patterns(const std::string_view text) const {
  const std::string subject(text);
  for (const auto &rule : rules_->pattern_rules()) {
    if (std::regex_search(subject, rule.regex)) {
      return "Detected suspicious pattern: " + rule.label;
    }
  }
  return std::nullopt;
}

std::optional<std::string> InjectionDetector::check_obfuscation(const std::string_view text) const {
  if (special_character_ratio(text) > rules_->special_char_ratio()) {
    return std::string("Excessive special characters detected (possible obfuscation)");
  }
  return std::nullopt;
}

std::optional<std::string> InjectionDetector::check_encoded(const std::string_view text) const {
  const std::string lower = common::to_lower(std::string(text));
  bool has_marker = false;
  for (const auto marker : kEncodingMarkers) {
    if (lower.find(marker) != std::string::npos) {
      has_marker = true;
      break;
    }
  }
  if (has_marker && encoding_character_ratio(text) > rules_->encoded_ratio()) {
    return std::string("Potential encoded injection detected");
  }
  return std::nullopt;
}

std::optional<std::string> InjectionDetector::check_structure(const std::string_view text) const {
  const std::string subject(text);
  for (const auto &rule : rules_->structural_rules()) {
    if (!std::regex_search(subject, rule.regex)) {
      continue;
    }
    if (rule.category == RuleCategory::SqlInjection) {
      return std::string("Potential SQL injection detected");
    }
    return std::string("Potential command injection detected");
  }
  return std::nullopt;
}

} // namespace tutorguard::security
