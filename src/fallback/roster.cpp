#include "tutorguard/fallback/roster.hpp"

#include "tutorguard/common/strings.hpp"

namespace tutorguard::fallback {

ModelRoster::ModelRoster(Key, std::vector<std::string> models) : models_(std::move(models)) {}

common::Result<std::shared_ptr<ModelRoster>> ModelRoster::create(std::vector<std::string> models) {
  using Outcome = common::Result<std::shared_ptr<ModelRoster>>;
  if (models.empty()) {
    return Outcome::failure("model roster must not be empty");
  }
  for (const auto &model : models) {
    if (common::trim(model).empty()) {
      return Outcome::failure("model roster contains an empty model id");
    }
  }
  return Outcome::success(std::make_shared<ModelRoster>(Key{}, std::move(models)));
}

RosterPosition ModelRoster::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return RosterPosition{.index = cursor_, .model = models_[cursor_]};
}

AdvanceResult ModelRoster::advance_from(const std::size_t observed) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cursor_ > observed) {
    return AdvanceResult{.outcome = AdvanceOutcome::AlreadyAdvanced,
                         .position = {.index = cursor_, .model = models_[cursor_]}};
  }
  if (cursor_ + 1 >= models_.size()) {
    return AdvanceResult{.outcome = AdvanceOutcome::Exhausted,
                         .position = {.index = cursor_, .model = models_[cursor_]}};
  }
  ++cursor_;
  return AdvanceResult{.outcome = AdvanceOutcome::Advanced,
                       .position = {.index = cursor_, .model = models_[cursor_]}};
}

RosterSnapshot ModelRoster::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return RosterSnapshot{.current_model = models_[cursor_],
                        .current_index = cursor_,
                        .available_models = models_,
                        .remaining_fallbacks = models_.size() - cursor_ - 1};
}

} // namespace tutorguard::fallback
