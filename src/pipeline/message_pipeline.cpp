#include "tutorguard/pipeline/message_pipeline.hpp"

#include "tutorguard/config/config.hpp"
#include "tutorguard/observability/global.hpp"

namespace tutorguard::pipeline {

namespace {

common::Error make_error(const common::ErrorKind kind, std::string message,
                         std::optional<std::uint64_t> retry_after = std::nullopt) {
  return common::Error{.kind = kind, .message = std::move(message),
                       .retry_after_seconds = retry_after};
}

// Returns an unsettled turn claim to the session on scope exit.
class TurnClaim {
public:
  TurnClaim(sessions::SessionStore &sessions, std::string session_id)
      : sessions_(sessions), session_id_(std::move(session_id)) {}
  ~TurnClaim() {
    if (!settled_) {
      sessions_.release_turn(session_id_);
    }
  }

  TurnClaim(const TurnClaim &) = delete;
  TurnClaim &operator=(const TurnClaim &) = delete;

  void settle() { settled_ = true; }

private:
  sessions::SessionStore &sessions_;
  std::string session_id_;
  bool settled_ = false;
};

} // namespace

common::Result<std::unique_ptr<MessagePipeline>>
MessagePipeline::create(const config::Config &config,
                        std::shared_ptr<providers::GenerationBackend> backend,
                        security::RateLimiter::Clock clock) {
  using Outcome = common::Result<std::unique_ptr<MessagePipeline>>;
  if (!backend) {
    return Outcome::failure("generation backend is required");
  }

  auto validated = config::validate_config(config);
  if (!validated.ok()) {
    return Outcome::failure(validated.error());
  }

  auto rules = security::ValidationRuleSet::from_config(config.validation);
  if (!rules.ok()) {
    return Outcome::failure(rules.error());
  }
  auto roster = fallback::ModelRoster::create(config.models.roster);
  if (!roster.ok()) {
    return Outcome::failure(roster.error());
  }

  return Outcome::success(std::make_unique<MessagePipeline>(
      Key{}, config, rules.value(), roster.value(), std::move(backend), std::move(clock)));
}

MessagePipeline::MessagePipeline(Key, config::Config config,
                                 std::shared_ptr<const security::ValidationRuleSet> rules,
                                 std::shared_ptr<fallback::ModelRoster> roster,
                                 std::shared_ptr<providers::GenerationBackend> backend,
                                 security::RateLimiter::Clock clock)
    : config_(std::move(config)), detector_(std::move(rules)), guard_(config_.persona),
      limiter_(config_.rate_limit, std::move(clock)), roster_(std::move(roster)),
      controller_(*roster_, std::move(backend), sessions_, config_.persona.system_instruction,
                  config_.models.temperature) {}

common::Result<security::SanitizedMessage, common::Error>
MessagePipeline::validate_and_sanitize(const std::string_view raw) const {
  using Outcome = common::Result<security::SanitizedMessage, common::Error>;
  auto message = security::sanitize(raw);
  auto verdict = detector_.check(message);
  if (!verdict.passed) {
    observability::record_rejection("validation", verdict.reason);
    return Outcome::failure(make_error(common::ErrorKind::ValidationRejected, verdict.reason));
  }
  return Outcome::success(std::move(message));
}

security::GuardVerdict MessagePipeline::admit(const std::string_view identity) {
  auto verdict = limiter_.admit(identity);
  if (!verdict.passed) {
    observability::record_rejection("rate_limit", verdict.reason);
  }
  return verdict;
}

std::string MessagePipeline::wrap(const security::SanitizedMessage &message) const {
  return guard_.wrap(message);
}

security::GuardVerdict MessagePipeline::validate_response(const std::string_view response) const {
  auto verdict = guard_.validate(response);
  if (!verdict.passed) {
    observability::record_rejection("response", verdict.reason);
  }
  return verdict;
}

fallback::GenerationOutcome
MessagePipeline::generate(const std::string &session_id, const std::string &wrapped_text,
                          const providers::CancellationToken &cancellation) {
  return controller_.generate(session_id, wrapped_text, cancellation);
}

common::Result<std::string, common::Error> MessagePipeline::create_session() {
  using Outcome = common::Result<std::string, common::Error>;

  const auto evicted =
      sessions_.evict_idle(std::chrono::minutes(config_.session.idle_timeout_minutes));
  for (const auto &stale : evicted) {
    observability::record_session(stale, "evicted");
  }

  auto created = sessions_.create(roster_->current().model);
  if (!created.ok()) {
    observability::record_error("sessions", created.error());
    return Outcome::failure(make_error(common::ErrorKind::CollaboratorError, created.error()));
  }
  observability::record_session(created.value(), "created");
  observability::record_metric(observability::ActiveSessionsMetric{.count = sessions_.size()});
  return Outcome::success(created.value());
}

common::Result<std::vector<providers::ChatTurn>, common::Error>
MessagePipeline::session_history(const std::string &session_id) const {
  using Outcome = common::Result<std::vector<providers::ChatTurn>, common::Error>;
  auto history = sessions_.history(session_id);
  if (!history.ok()) {
    return Outcome::failure(make_error(common::ErrorKind::SessionNotFound, history.error()));
  }
  return Outcome::success(std::move(history.value()));
}

common::Result<bool, common::Error> MessagePipeline::delete_session(const std::string &session_id) {
  using Outcome = common::Result<bool, common::Error>;
  if (!sessions_.remove(session_id)) {
    return Outcome::failure(
        make_error(common::ErrorKind::SessionNotFound, "session not found: " + session_id));
  }
  observability::record_session(session_id, "deleted");
  observability::record_metric(observability::ActiveSessionsMetric{.count = sessions_.size()});
  return Outcome::success(true);
}

fallback::RosterSnapshot MessagePipeline::roster_info() const { return roster_->snapshot(); }

ChatOutcome MessagePipeline::chat(const std::string_view identity,
                                  const std::optional<std::string> &session_id,
                                  const std::string_view raw,
                                  const providers::CancellationToken &cancellation) {
  auto message = validate_and_sanitize(raw);
  if (!message.ok()) {
    return ChatOutcome::failure(message.error());
  }

  const auto admission = admit(identity);
  if (!admission.passed) {
    return ChatOutcome::failure(make_error(common::ErrorKind::RateLimited, admission.reason,
                                           admission.retry_after_seconds));
  }

  std::string id;
  if (session_id.has_value()) {
    if (!sessions_.contains(*session_id)) {
      return ChatOutcome::failure(
          make_error(common::ErrorKind::SessionNotFound, "session not found: " + *session_id));
    }
    id = *session_id;
  } else {
    auto created = create_session();
    if (!created.ok()) {
      return ChatOutcome::failure(created.error());
    }
    id = created.value();
  }

  auto reserved = sessions_.reserve_turn(id, config_.session.max_turns);
  if (!reserved.ok()) {
    return ChatOutcome::failure(make_error(common::ErrorKind::SessionNotFound, reserved.error()));
  }
  if (!reserved.value()) {
    const std::string reason = "Session has reached the maximum of " +
                               std::to_string(config_.session.max_turns) +
                               " messages. Please start a new session";
    observability::record_rejection("session", reason);
    return ChatOutcome::failure(make_error(common::ErrorKind::ValidationRejected, reason));
  }
  TurnClaim claim(sessions_, id);

  auto reply = controller_.generate(id, wrap(message.value()), cancellation);
  if (!reply.ok()) {
    return ChatOutcome::failure(reply.error());
  }

  const auto verdict = validate_response(reply.value().text);
  if (!verdict.passed) {
    return ChatOutcome::failure(make_error(common::ErrorKind::GuardRejected, verdict.text));
  }

  if (auto status = sessions_.commit_exchange(id, message.value().text(), verdict.text);
      !status.ok()) {
    return ChatOutcome::failure(make_error(common::ErrorKind::SessionNotFound, status.error()));
  }
  claim.settle();

  return ChatOutcome::success(ChatReply{.session_id = id,
                                        .text = verdict.text,
                                        .model = reply.value().model,
                                        .attempts = reply.value().attempts});
}

} // namespace tutorguard::pipeline
