#include "tutorguard/security/rate_limiter.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace tutorguard::security {

namespace {

std::uint64_t seconds_until_expiry(const RateLimiter::TimePoint stamp,
                                   const RateLimiter::TimePoint now,
                                   const std::chrono::seconds window) {
  const auto remaining = window - (now - stamp);
  const auto secs = std::chrono::ceil<std::chrono::seconds>(remaining).count();
  return static_cast<std::uint64_t>(std::max<std::int64_t>(secs, 1));
}

} // namespace

std::string identity_digest(const std::string_view identity) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(identity.data()), identity.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

RateLimiter::RateLimiter(config::RateLimitConfig limits, Clock clock)
    : limits_(std::move(limits)), clock_(std::move(clock)),
      minute_window_(static_cast<std::int64_t>(limits_.minute_window_seconds)),
      hour_window_(static_cast<std::int64_t>(limits_.hour_window_seconds)) {
  if (!clock_) {
    clock_ = [] { return std::chrono::steady_clock::now(); };
  }
}

std::shared_ptr<RateLimiter::Window> RateLimiter::window_for(const std::string &digest,
                                                             const TimePoint now) {
  std::lock_guard<std::mutex> lock(map_mutex_);
  if (!last_sweep_.has_value()) {
    last_sweep_ = now;
  } else if (now - *last_sweep_ >= minute_window_) {
    sweep_locked(now);
    last_sweep_ = now;
  }
  auto &slot = windows_[digest];
  if (!slot) {
    slot = std::make_shared<Window>();
  }
  return slot;
}

void RateLimiter::prune_locked(Window &window, const TimePoint now) const {
  while (!window.stamps.empty() && now - window.stamps.front() >= hour_window_) {
    window.stamps.pop_front();
  }
}

// Caller holds map_mutex_. A window referenced only by the map cannot be handed out
// concurrently, so dropping it once empty loses no stamps.
void RateLimiter::sweep_locked(const TimePoint now) {
  for (auto it = windows_.begin(); it != windows_.end();) {
    bool drop = false;
    if (it->second.use_count() == 1) {
      std::lock_guard<std::mutex> window_lock(it->second->mutex);
      prune_locked(*it->second, now);
      drop = it->second->stamps.empty();
    }
    if (drop) {
      it = windows_.erase(it);
    } else {
      ++it;
    }
  }
}

GuardVerdict RateLimiter::admit(const std::string_view identity) {
  return admit_at(identity, clock_());
}

GuardVerdict RateLimiter::admit_at(const std::string_view identity, const TimePoint now) {
  const auto window = window_for(identity_digest(identity), now);
  std::lock_guard<std::mutex> lock(window->mutex);
  prune_locked(*window, now);

  auto &stamps = window->stamps;
  if (stamps.size() >= limits_.per_hour) {
    return GuardVerdict::reject("Hourly rate limit exceeded (" + std::to_string(limits_.per_hour) +
                                    " requests/hour)",
                                "", seconds_until_expiry(stamps.front(), now, hour_window_));
  }

  const auto first_recent =
      std::find_if(stamps.begin(), stamps.end(),
                   [&](const TimePoint stamp) { return now - stamp < minute_window_; });
  const auto recent = static_cast<std::size_t>(std::distance(first_recent, stamps.end()));
  if (recent >= limits_.per_minute) {
    return GuardVerdict::reject("Rate limit exceeded (" + std::to_string(limits_.per_minute) +
                                    " requests/minute)",
                                "", seconds_until_expiry(*first_recent, now, minute_window_));
  }

  stamps.push_back(now);
  return GuardVerdict::pass("");
}

std::size_t RateLimiter::count_at(const std::string_view identity, const TimePoint now) {
  const auto window = window_for(identity_digest(identity), now);
  std::lock_guard<std::mutex> lock(window->mutex);
  prune_locked(*window, now);
  return window->stamps.size();
}

void RateLimiter::forget(const std::string_view identity) {
  std::lock_guard<std::mutex> lock(map_mutex_);
  windows_.erase(identity_digest(identity));
}

std::size_t RateLimiter::tracked_identities() const {
  std::lock_guard<std::mutex> lock(map_mutex_);
  return windows_.size();
}

} // namespace tutorguard::security
