#pragma once

#include "tutorguard/config/schema.hpp"
#include "tutorguard/security/verdict.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tutorguard::security {

/// SHA-256 hex digest of an opaque caller token; the limiter only ever stores these.
[[nodiscard]] std::string identity_digest(std::string_view identity);

/// Per-identity sliding-window limiter with a per-minute and a per-hour cap.
///
/// A map mutex guards find-or-create of an identity's window; each window carries its own
/// mutex for prune/check/append, so unrelated identities never contend on the same lock.
/// Windows left empty after the hour window passes are dropped on a later lookup.
class RateLimiter {
public:
  using TimePoint = std::chrono::steady_clock::time_point;
  using Clock = std::function<TimePoint()>;

  explicit RateLimiter(config::RateLimitConfig limits, Clock clock = {});

  [[nodiscard]] GuardVerdict admit(std::string_view identity);
  [[nodiscard]] GuardVerdict admit_at(std::string_view identity, TimePoint now);

  /// Requests currently inside the hour window for `identity`.
  [[nodiscard]] std::size_t count_at(std::string_view identity, TimePoint now);

  void forget(std::string_view identity);
  [[nodiscard]] std::size_t tracked_identities() const;

  [[nodiscard]] const config::RateLimitConfig &limits() const { return limits_; }

private:
  struct Window {
    std::mutex mutex;
    std::deque<TimePoint> stamps;
  };

  std::shared_ptr<Window> window_for(const std::string &digest, TimePoint now);
  void prune_locked(Window &window, TimePoint now) const;
  void sweep_locked(TimePoint now);

  config::RateLimitConfig limits_;
  Clock clock_;
  std::chrono::seconds minute_window_;
  std::chrono::seconds hour_window_;

  mutable std::mutex map_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Window>> windows_;
  std::optional<TimePoint> last_sweep_;
};

} // namespace tutorguard::security
