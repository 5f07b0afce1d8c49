#pragma once

#include "tutorguard/common/result.hpp"
#include "tutorguard/providers/traits.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace tutorguard::sessions {

using Clock = std::chrono::system_clock;

struct GenerationSession {
  std::string session_id;
  std::string model;
  std::vector<providers::ChatTurn> history;
  Clock::time_point created_at{};
  Clock::time_point updated_at{};
  // Number of user turns in `history`.
  std::size_t turn_count = 0;
};

/// Random UUID-v4 formatted identifier drawn from OpenSSL's CSPRNG.
[[nodiscard]] common::Result<std::string> generate_session_id();

[[nodiscard]] bool is_valid_session_id(const std::string &session_id);

} // namespace tutorguard::sessions
