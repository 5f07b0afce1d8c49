#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tutorguard::common {

enum class ErrorKind {
  ValidationRejected,
  RateLimited,
  QuotaExceeded,
  ModelsExhausted,
  GuardRejected,
  CollaboratorError,
  Cancelled,
  SessionNotFound,
};

/// Failure surfaced to the caller-facing layer. Only QuotaExceeded is ever recovered
/// internally; every other kind propagates unchanged.
struct Error {
  ErrorKind kind = ErrorKind::CollaboratorError;
  std::string message;
  std::optional<std::uint64_t> retry_after_seconds;

  [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] std::string_view error_kind_name(ErrorKind kind);

/// HTTP-equivalent status class for an error kind.
[[nodiscard]] std::uint16_t http_status(ErrorKind kind);

/// Error kinds the layer retries on its own.
[[nodiscard]] bool is_locally_recoverable(ErrorKind kind);

} // namespace tutorguard::common
