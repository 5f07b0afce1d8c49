#pragma once

#include "tutorguard/common/error.hpp"
#include "tutorguard/common/result.hpp"
#include "tutorguard/config/schema.hpp"
#include "tutorguard/fallback/controller.hpp"
#include "tutorguard/fallback/roster.hpp"
#include "tutorguard/providers/traits.hpp"
#include "tutorguard/security/injection_detector.hpp"
#include "tutorguard/security/rate_limiter.hpp"
#include "tutorguard/security/response_guard.hpp"
#include "tutorguard/security/rules.hpp"
#include "tutorguard/security/sanitizer.hpp"
#include "tutorguard/sessions/store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tutorguard::pipeline {

struct ChatReply {
  std::string session_id;
  std::string text;
  std::string model;
  std::size_t attempts = 0;
};

using ChatOutcome = common::Result<ChatReply, common::Error>;

/// Caller-facing composition of the guard stages, the limiter, the session store and the
/// fallback controller.
///
/// `chat` runs the full flow: sanitize and check the message, admit the caller, resolve or
/// create the session, enforce its turn limit, generate through the roster and screen the
/// reply before it is recorded in the session history.
class MessagePipeline {
  struct Key {
    explicit Key() = default;
  };

public:
  MessagePipeline(Key, config::Config config,
                  std::shared_ptr<const security::ValidationRuleSet> rules,
                  std::shared_ptr<fallback::ModelRoster> roster,
                  std::shared_ptr<providers::GenerationBackend> backend,
                  security::RateLimiter::Clock clock);

  [[nodiscard]] static common::Result<std::unique_ptr<MessagePipeline>>
  create(const config::Config &config, std::shared_ptr<providers::GenerationBackend> backend,
         security::RateLimiter::Clock clock = {});

  MessagePipeline(const MessagePipeline &) = delete;
  MessagePipeline &operator=(const MessagePipeline &) = delete;

  [[nodiscard]] common::Result<security::SanitizedMessage, common::Error>
  validate_and_sanitize(std::string_view raw) const;
  [[nodiscard]] security::GuardVerdict admit(std::string_view identity);
  [[nodiscard]] std::string wrap(const security::SanitizedMessage &message) const;
  [[nodiscard]] security::GuardVerdict validate_response(std::string_view response) const;
  [[nodiscard]] fallback::GenerationOutcome
  generate(const std::string &session_id, const std::string &wrapped_text,
           const providers::CancellationToken &cancellation = {});

  [[nodiscard]] ChatOutcome chat(std::string_view identity,
                                 const std::optional<std::string> &session_id,
                                 std::string_view raw,
                                 const providers::CancellationToken &cancellation = {});

  [[nodiscard]] common::Result<std::string, common::Error> create_session();
  [[nodiscard]] common::Result<std::vector<providers::ChatTurn>, common::Error>
  session_history(const std::string &session_id) const;
  [[nodiscard]] common::Result<bool, common::Error> delete_session(const std::string &session_id);

  [[nodiscard]] fallback::RosterSnapshot roster_info() const;

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] security::RateLimiter &limiter() { return limiter_; }
  [[nodiscard]] sessions::SessionStore &sessions() { return sessions_; }
  [[nodiscard]] fallback::ModelRoster &roster() { return *roster_; }

private:
  config::Config config_;
  security::InjectionDetector detector_;
  security::ResponseGuard guard_;
  security::RateLimiter limiter_;
  std::shared_ptr<fallback::ModelRoster> roster_;
  sessions::SessionStore sessions_;
  fallback::ModelFallbackController controller_;
};

} // namespace tutorguard::pipeline
