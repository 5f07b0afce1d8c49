#pragma once

#include "tutorguard/observability/observer.hpp"

#include <memory>

namespace tutorguard::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_rejection(const std::string &stage, const std::string &reason);
void record_failover(const std::string &from_model, const std::string &to_model,
                     std::size_t index);
void record_models_exhausted(const std::string &last_model);
void record_generation(const std::string &model, std::size_t attempts,
                       std::chrono::milliseconds duration);
void record_session(const std::string &session_id, const std::string &action);
void record_error(const std::string &component, const std::string &message);

} // namespace tutorguard::observability
