#include "tutorguard/common/error.hpp"

#include <sstream>

namespace tutorguard::common {

std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::ValidationRejected:
    return "validation_rejected";
  case ErrorKind::RateLimited:
    return "rate_limited";
  case ErrorKind::QuotaExceeded:
    return "quota_exceeded";
  case ErrorKind::ModelsExhausted:
    return "models_exhausted";
  case ErrorKind::GuardRejected:
    return "guard_rejected";
  case ErrorKind::CollaboratorError:
    return "collaborator_error";
  case ErrorKind::Cancelled:
    return "cancelled";
  case ErrorKind::SessionNotFound:
    return "session_not_found";
  }
  return "unknown";
}

std::uint16_t http_status(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::ValidationRejected:
    return 400;
  case ErrorKind::SessionNotFound:
    return 404;
  case ErrorKind::RateLimited:
  case ErrorKind::QuotaExceeded:
  case ErrorKind::ModelsExhausted:
    return 429;
  case ErrorKind::Cancelled:
    return 499;
  case ErrorKind::GuardRejected:
  case ErrorKind::CollaboratorError:
    return 500;
  }
  return 500;
}

bool is_locally_recoverable(const ErrorKind kind) { return kind == ErrorKind::QuotaExceeded; }

std::string Error::to_string() const {
  std::ostringstream stream;
  stream << "[" << error_kind_name(kind) << "] " << message;
  if (retry_after_seconds.has_value()) {
    stream << " (retry after " << *retry_after_seconds << "s)";
  }
  return stream.str();
}

} // namespace tutorguard::common
