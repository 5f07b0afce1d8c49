#include "tutorguard/sessions/store.hpp"

namespace tutorguard::sessions {

namespace {

std::string not_found(const std::string &session_id) {
  return "session not found: " + session_id;
}

} // namespace

std::shared_ptr<SessionStore::Entry> SessionStore::find(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(session_id);
  if (it == entries_.end()) {
    return nullptr;
  }
  return it->second;
}

common::Result<std::string> SessionStore::create(const std::string &model) {
  return create_at(model, Clock::now());
}

common::Result<std::string> SessionStore::create_at(const std::string &model,
                                                    const Clock::time_point now) {
  auto entry = std::make_shared<Entry>();
  entry->session.model = model;
  entry->session.created_at = now;
  entry->session.updated_at = now;

  std::lock_guard<std::mutex> lock(mutex_);
  // Never overwrite an existing session on an id collision.
  for (int attempt = 0; attempt < 4; ++attempt) {
    auto id = generate_session_id();
    if (!id.ok()) {
      return id;
    }
    if (entries_.contains(id.value())) {
      continue;
    }
    entry->session.session_id = id.value();
    entries_.emplace(id.value(), std::move(entry));
    return id;
  }
  return common::Result<std::string>::failure("could not allocate a unique session id");
}

common::Result<GenerationSession> SessionStore::get(const std::string &session_id) const {
  const auto entry = find(session_id);
  if (!entry) {
    return common::Result<GenerationSession>::failure(not_found(session_id));
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  return common::Result<GenerationSession>::success(entry->session);
}

common::Status SessionStore::rebind(const std::string &session_id, const std::string &model) {
  const auto entry = find(session_id);
  if (!entry) {
    return common::Status::error(not_found(session_id));
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  entry->session.model = model;
  return common::Status::success();
}

common::Status SessionStore::append_turn(const std::string &session_id,
                                         const providers::TurnRole role, const std::string &text) {
  return append_turn_at(session_id, role, text, Clock::now());
}

common::Status SessionStore::append_turn_at(const std::string &session_id,
                                            const providers::TurnRole role,
                                            const std::string &text, const Clock::time_point now) {
  const auto entry = find(session_id);
  if (!entry) {
    return common::Status::error(not_found(session_id));
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  entry->session.history.push_back(providers::ChatTurn{.role = role, .text = text});
  if (role == providers::TurnRole::User) {
    ++entry->session.turn_count;
  }
  entry->session.updated_at = now;
  return common::Status::success();
}

common::Result<std::size_t> SessionStore::turn_count(const std::string &session_id) const {
  const auto entry = find(session_id);
  if (!entry) {
    return common::Result<std::size_t>::failure(not_found(session_id));
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  return common::Result<std::size_t>::success(entry->session.turn_count);
}

common::Result<bool> SessionStore::reserve_turn(const std::string &session_id,
                                                const std::size_t max_turns) {
  const auto entry = find(session_id);
  if (!entry) {
    return common::Result<bool>::failure(not_found(session_id));
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  if (entry->session.turn_count + entry->reserved_turns >= max_turns) {
    return common::Result<bool>::success(false);
  }
  ++entry->reserved_turns;
  return common::Result<bool>::success(true);
}

void SessionStore::release_turn(const std::string &session_id) {
  const auto entry = find(session_id);
  if (!entry) {
    return;
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  if (entry->reserved_turns > 0) {
    --entry->reserved_turns;
  }
}

common::Status SessionStore::commit_exchange(const std::string &session_id,
                                             const std::string &user_text,
                                             const std::string &model_text) {
  return commit_exchange_at(session_id, user_text, model_text, Clock::now());
}

common::Status SessionStore::commit_exchange_at(const std::string &session_id,
                                                const std::string &user_text,
                                                const std::string &model_text,
                                                const Clock::time_point now) {
  const auto entry = find(session_id);
  if (!entry) {
    return common::Status::error(not_found(session_id));
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  auto &history = entry->session.history;
  history.push_back(providers::ChatTurn{.role = providers::TurnRole::User, .text = user_text});
  history.push_back(providers::ChatTurn{.role = providers::TurnRole::Model, .text = model_text});
  ++entry->session.turn_count;
  if (entry->reserved_turns > 0) {
    --entry->reserved_turns;
  }
  entry->session.updated_at = now;
  return common::Status::success();
}

common::Result<std::vector<providers::ChatTurn>>
SessionStore::history(const std::string &session_id) const {
  using Outcome = common::Result<std::vector<providers::ChatTurn>>;
  const auto entry = find(session_id);
  if (!entry) {
    return Outcome::failure(not_found(session_id));
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  return Outcome::success(entry->session.history);
}

bool SessionStore::remove(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.erase(session_id) > 0;
}

bool SessionStore::contains(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.contains(session_id);
}

std::size_t SessionStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::vector<std::string> SessionStore::evict_idle(const std::chrono::minutes max_idle) {
  return evict_idle_at(Clock::now(), max_idle);
}

std::vector<std::string> SessionStore::evict_idle_at(const Clock::time_point now,
                                                     const std::chrono::minutes max_idle) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> removed;
  for (auto it = entries_.begin(); it != entries_.end();) {
    bool idle = false;
    {
      std::lock_guard<std::mutex> entry_lock(it->second->mutex);
      idle = now - it->second->session.updated_at > max_idle;
    }
    if (idle) {
      removed.push_back(it->first);
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}

} // namespace tutorguard::sessions
