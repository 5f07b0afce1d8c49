#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace tutorguard::security {

/// Text that has been through `sanitize`. Only `sanitize` can produce one, so holding a
/// SanitizedMessage proves the text is trimmed, entity-escaped, free of control bytes and
/// whitespace-collapsed.
class SanitizedMessage {
public:
  [[nodiscard]] const std::string &text() const { return text_; }
  [[nodiscard]] bool empty() const { return text_.empty(); }

  friend bool operator==(const SanitizedMessage &a, const SanitizedMessage &b) {
    return a.text_ == b.text_;
  }

private:
  friend SanitizedMessage sanitize(std::string_view raw);
  explicit SanitizedMessage(std::string text) : text_(std::move(text)) {}

  std::string text_;
};

/// Trim -> escape markup -> strip control bytes -> collapse whitespace. Total and idempotent.
[[nodiscard]] SanitizedMessage sanitize(std::string_view raw);

[[nodiscard]] std::string escape_markup(std::string_view input);
[[nodiscard]] std::string strip_control_bytes(std::string_view input);
[[nodiscard]] std::string collapse_whitespace(std::string_view input);

} // namespace tutorguard::security
