#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace tutorguard::security {

/// Outcome of a guard stage. On a pass `text` is what may flow onward; on an output
/// rejection it is the fixed placeholder, never the offending text.
struct GuardVerdict {
  bool passed = false;
  std::string reason;
  std::string text;
  std::optional<std::uint64_t> retry_after_seconds;

  [[nodiscard]] static GuardVerdict pass(std::string text) {
    return GuardVerdict{.passed = true, .reason = "", .text = std::move(text),
                        .retry_after_seconds = std::nullopt};
  }

  [[nodiscard]] static GuardVerdict reject(std::string reason, std::string text = "",
                                           std::optional<std::uint64_t> retry_after = std::nullopt) {
    return GuardVerdict{.passed = false, .reason = std::move(reason), .text = std::move(text),
                        .retry_after_seconds = retry_after};
  }
};

} // namespace tutorguard::security
