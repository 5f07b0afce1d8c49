#pragma once

#include "tutorguard/common/result.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tutorguard::fallback {

struct RosterPosition {
  std::size_t index = 0;
  std::string model;
};

enum class AdvanceOutcome {
  Advanced,
  // Another request already moved the cursor past the observed index.
  AlreadyAdvanced,
  Exhausted,
};

struct AdvanceResult {
  AdvanceOutcome outcome = AdvanceOutcome::Exhausted;
  RosterPosition position;
};

struct RosterSnapshot {
  std::string current_model;
  std::size_t current_index = 0;
  std::vector<std::string> available_models;
  std::size_t remaining_fallbacks = 0;
};

/// Ordered model list with one process-wide cursor. The cursor only moves forward, one step
/// per exhausted-quota event, and stays on the last model once the list is used up.
class ModelRoster {
  struct Key {
    explicit Key() = default;
  };

public:
  ModelRoster(Key, std::vector<std::string> models);

  [[nodiscard]] static common::Result<std::shared_ptr<ModelRoster>>
  create(std::vector<std::string> models);

  [[nodiscard]] RosterPosition current() const;

  /// Compare-and-advance: moves the cursor only if it still points at `observed`.
  [[nodiscard]] AdvanceResult advance_from(std::size_t observed);

  [[nodiscard]] RosterSnapshot snapshot() const;
  [[nodiscard]] std::size_t size() const { return models_.size(); }
  [[nodiscard]] const std::vector<std::string> &models() const { return models_; }

private:
  const std::vector<std::string> models_;
  mutable std::mutex mutex_;
  std::size_t cursor_ = 0;
};

} // namespace tutorguard::fallback
