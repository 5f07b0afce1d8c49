#pragma once

#include "tutorguard/common/result.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tutorguard::providers {

enum class GenerationErrorKind {
  Quota,
  Cancelled,
  Other,
};

struct GenerationError {
  GenerationErrorKind kind = GenerationErrorKind::Other;
  std::uint16_t status = 0;
  std::string message;

  [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] std::string_view generation_error_kind_name(GenerationErrorKind kind);

/// Maps a raw transport failure onto the structured kind: HTTP 429 or a quota marker in
/// the message ("429", "quota", "exceeded", "resource_exhausted") is Quota.
[[nodiscard]] GenerationErrorKind classify_failure(std::uint16_t status, std::string_view message);

/// Shared cancellation flag. Copies observe the same flag.
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const { flag_->store(true); }
  [[nodiscard]] bool cancelled() const { return flag_->load(); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

enum class TurnRole {
  User,
  Model,
};

[[nodiscard]] std::string_view turn_role_name(TurnRole role);

struct ChatTurn {
  TurnRole role = TurnRole::User;
  std::string text;
};

struct GenerationRequest {
  std::string system_persona;
  std::string wrapped_user_text;
  std::string model_id;
  std::vector<ChatTurn> history;
  double temperature = 0.7;
  CancellationToken cancellation;
};

using GenerationResult = common::Result<std::string, GenerationError>;

/// Opaque text-completion capability. Implementations classify their own failures.
class GenerationBackend {
public:
  virtual ~GenerationBackend() = default;

  [[nodiscard]] virtual GenerationResult invoke(const GenerationRequest &request) = 0;
  [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace tutorguard::providers
