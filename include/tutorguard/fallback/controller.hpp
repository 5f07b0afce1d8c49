#pragma once

#include "tutorguard/common/error.hpp"
#include "tutorguard/common/result.hpp"
#include "tutorguard/fallback/roster.hpp"
#include "tutorguard/providers/traits.hpp"
#include "tutorguard/sessions/store.hpp"

#include <memory>
#include <optional>
#include <string>

namespace tutorguard::fallback {

struct GenerationReply {
  std::string text;
  std::string model;
  std::size_t attempts = 0;
};

using GenerationOutcome = common::Result<GenerationReply, common::Error>;

/// Drives generation against the shared roster. Quota failures advance the cursor and retry
/// on the next model; every other failure ends the request without touching the cursor.
class ModelFallbackController {
public:
  ModelFallbackController(ModelRoster &roster, std::shared_ptr<providers::GenerationBackend> backend,
                          sessions::SessionStore &sessions, std::string system_persona,
                          double temperature);

  /// Generates within a session, rebinding it to each model tried while keeping its history.
  [[nodiscard]] GenerationOutcome
  generate(const std::string &session_id, const std::string &wrapped_text,
           const providers::CancellationToken &cancellation = {});

  [[nodiscard]] GenerationOutcome
  generate_once(const std::string &wrapped_text,
                const providers::CancellationToken &cancellation = {});

private:
  [[nodiscard]] GenerationOutcome run(const std::optional<std::string> &session_id,
                                      const std::string &wrapped_text,
                                      const providers::CancellationToken &cancellation);

  ModelRoster &roster_;
  std::shared_ptr<providers::GenerationBackend> backend_;
  sessions::SessionStore &sessions_;
  std::string system_persona_;
  double temperature_;
};

} // namespace tutorguard::fallback
