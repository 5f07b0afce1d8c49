#include "tutorguard/providers/traits.hpp"

#include "tutorguard/common/strings.hpp"

#include <array>
#include <sstream>

namespace tutorguard::providers {

namespace {

constexpr std::array<std::string_view, 4> kQuotaMarkers = {"429", "quota", "exceeded",
                                                           "resource_exhausted"};

} // namespace

std::string_view generation_error_kind_name(const GenerationErrorKind kind) {
  switch (kind) {
  case GenerationErrorKind::Quota:
    return "quota";
  case GenerationErrorKind::Cancelled:
    return "cancelled";
  case GenerationErrorKind::Other:
    return "other";
  }
  return "other";
}

std::string GenerationError::to_string() const {
  std::ostringstream stream;
  stream << "Generation error [" << generation_error_kind_name(kind) << "]";
  if (status != 0) {
    stream << " status=" << status;
  }
  if (!message.empty()) {
    stream << ": " << message;
  }
  return stream.str();
}

GenerationErrorKind classify_failure(const std::uint16_t status, const std::string_view message) {
  if (status == 429) {
    return GenerationErrorKind::Quota;
  }
  const std::string lower = common::to_lower(std::string(message));
  for (const auto marker : kQuotaMarkers) {
    if (lower.find(marker) != std::string::npos) {
      return GenerationErrorKind::Quota;
    }
  }
  return GenerationErrorKind::Other;
}

std::string_view turn_role_name(const TurnRole role) {
  switch (role) {
  case TurnRole::User:
    return "user";
  case TurnRole::Model:
    return "model";
  }
  return "user";
}

} // namespace tutorguard::providers
