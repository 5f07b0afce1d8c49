#include "tutorguard/observability/global.hpp"

#include <mutex>

namespace tutorguard::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

// Holding a shared reference keeps the observer alive while a concurrent
// set_global_observer swaps it out.
std::shared_ptr<IObserver> current_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_rejection(const std::string &stage, const std::string &reason) {
  record_event(RequestRejectedEvent{.stage = stage, .reason = reason});
}

void record_failover(const std::string &from_model, const std::string &to_model,
                     const std::size_t index) {
  record_event(ModelFailoverEvent{.from_model = from_model, .to_model = to_model, .index = index});
  record_metric(RosterCursorMetric{.index = index});
}

void record_models_exhausted(const std::string &last_model) {
  record_event(ModelsExhaustedEvent{.last_model = last_model});
}

void record_generation(const std::string &model, const std::size_t attempts,
                       const std::chrono::milliseconds duration) {
  record_event(GenerationCompletedEvent{.model = model, .attempts = attempts, .duration = duration});
  record_metric(RequestLatencyMetric{.latency = duration});
}

void record_session(const std::string &session_id, const std::string &action) {
  record_event(SessionEvent{.session_id = session_id, .action = action});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace tutorguard::observability
