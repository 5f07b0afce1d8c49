#pragma once

#include "tutorguard/common/result.hpp"
#include "tutorguard/sessions/session.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tutorguard::sessions {

/// In-memory conversation store shared by concurrent requests.
///
/// The map mutex only guards lookup, insert and erase. Each session has its own mutex, so
/// rebinding a model on failover and appending turns from another request never race.
class SessionStore {
public:
  SessionStore() = default;

  [[nodiscard]] common::Result<std::string> create(const std::string &model);
  [[nodiscard]] common::Result<std::string> create_at(const std::string &model,
                                                      Clock::time_point now);

  [[nodiscard]] common::Result<GenerationSession> get(const std::string &session_id) const;
  [[nodiscard]] common::Status rebind(const std::string &session_id, const std::string &model);
  [[nodiscard]] common::Status append_turn(const std::string &session_id, providers::TurnRole role,
                                           const std::string &text);
  [[nodiscard]] common::Status append_turn_at(const std::string &session_id,
                                              providers::TurnRole role, const std::string &text,
                                              Clock::time_point now);
  [[nodiscard]] common::Result<std::size_t> turn_count(const std::string &session_id) const;

  /// Claims one user turn against `max_turns`, counting turns still in flight. Yields false
  /// when the session is full. A claim ends with `commit_exchange` or `release_turn`.
  [[nodiscard]] common::Result<bool> reserve_turn(const std::string &session_id,
                                                  std::size_t max_turns);
  void release_turn(const std::string &session_id);
  /// Appends a user turn and its reply together and settles the claim.
  [[nodiscard]] common::Status commit_exchange(const std::string &session_id,
                                               const std::string &user_text,
                                               const std::string &model_text);
  [[nodiscard]] common::Status commit_exchange_at(const std::string &session_id,
                                                  const std::string &user_text,
                                                  const std::string &model_text,
                                                  Clock::time_point now);
  [[nodiscard]] common::Result<std::vector<providers::ChatTurn>>
  history(const std::string &session_id) const;

  bool remove(const std::string &session_id);
  [[nodiscard]] bool contains(const std::string &session_id) const;
  [[nodiscard]] std::size_t size() const;

  /// Drops sessions whose last update is older than `max_idle` and returns their ids.
  std::vector<std::string> evict_idle(std::chrono::minutes max_idle);
  std::vector<std::string> evict_idle_at(Clock::time_point now, std::chrono::minutes max_idle);

private:
  struct Entry {
    mutable std::mutex mutex;
    GenerationSession session;
    std::size_t reserved_turns = 0;
  };

  [[nodiscard]] std::shared_ptr<Entry> find(const std::string &session_id) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace tutorguard::sessions
