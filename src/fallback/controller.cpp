#include "tutorguard/fallback/controller.hpp"

#include "tutorguard/observability/global.hpp"

#include <chrono>

namespace tutorguard::fallback {

namespace {

GenerationOutcome fail(const common::ErrorKind kind, std::string message) {
  return GenerationOutcome::failure(common::Error{.kind = kind, .message = std::move(message)});
}

GenerationOutcome cancelled() {
  return fail(common::ErrorKind::Cancelled, "generation cancelled");
}

GenerationOutcome exhausted(const std::string &last_model, const std::string &last_error) {
  observability::record_models_exhausted(last_model);
  return fail(common::ErrorKind::ModelsExhausted,
              "All models exhausted. Please wait for quota reset. Last error: " + last_error);
}

} // namespace

ModelFallbackController::ModelFallbackController(
    ModelRoster &roster, std::shared_ptr<providers::GenerationBackend> backend,
    sessions::SessionStore &sessions, std::string system_persona, const double temperature)
    : roster_(roster), backend_(std::move(backend)), sessions_(sessions),
      system_persona_(std::move(system_persona)), temperature_(temperature) {}

GenerationOutcome ModelFallbackController::generate(const std::string &session_id,
                                                    const std::string &wrapped_text,
                                                    const providers::CancellationToken &cancellation) {
  return run(session_id, wrapped_text, cancellation);
}

GenerationOutcome
ModelFallbackController::generate_once(const std::string &wrapped_text,
                                       const providers::CancellationToken &cancellation) {
  return run(std::nullopt, wrapped_text, cancellation);
}

GenerationOutcome ModelFallbackController::run(const std::optional<std::string> &session_id,
                                               const std::string &wrapped_text,
                                               const providers::CancellationToken &cancellation) {
  const auto started = std::chrono::steady_clock::now();
  std::string last_error = "no attempt made";
  std::string last_model;

  for (std::size_t attempt = 1; attempt <= roster_.size(); ++attempt) {
    if (cancellation.cancelled()) {
      return cancelled();
    }

    const RosterPosition position = roster_.current();
    last_model = position.model;

    providers::GenerationRequest request{.system_persona = system_persona_,
                                         .wrapped_user_text = wrapped_text,
                                         .model_id = position.model,
                                         .history = {},
                                         .temperature = temperature_,
                                         .cancellation = cancellation};

    if (session_id.has_value()) {
      auto session = sessions_.get(*session_id);
      if (!session.ok()) {
        return fail(common::ErrorKind::SessionNotFound, session.error());
      }
      if (session.value().model != position.model) {
        if (auto status = sessions_.rebind(*session_id, position.model); !status.ok()) {
          return fail(common::ErrorKind::SessionNotFound, status.error());
        }
      }
      request.history = std::move(session.value().history);
    }

    auto result = backend_->invoke(request);
    if (result.ok()) {
      const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started);
      observability::record_generation(position.model, attempt, elapsed);
      return GenerationOutcome::success(
          GenerationReply{.text = result.value(), .model = position.model, .attempts = attempt});
    }

    const auto &error = result.error();
    switch (error.kind) {
    case providers::GenerationErrorKind::Cancelled:
      return cancelled();
    case providers::GenerationErrorKind::Other:
      observability::record_error("fallback", error.to_string());
      return fail(common::ErrorKind::CollaboratorError, error.message);
    case providers::GenerationErrorKind::Quota:
      break;
    }

    last_error = error.message;
    const AdvanceResult advance = roster_.advance_from(position.index);
    if (advance.outcome == AdvanceOutcome::Exhausted) {
      return exhausted(position.model, last_error);
    }
    if (advance.outcome == AdvanceOutcome::Advanced) {
      observability::record_failover(position.model, advance.position.model,
                                     advance.position.index);
    }
  }

  return exhausted(last_model, last_error);
}

} // namespace tutorguard::fallback
