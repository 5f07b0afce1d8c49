#include "tutorguard/observability/log_observer.hpp"

#include "tutorguard/common/strings.hpp"

#include <iostream>
#include <type_traits>

namespace tutorguard::observability {

std::optional<LogLevel> parse_log_level(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "info") {
    return LogLevel::Info;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

std::string_view log_level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

LogObserver::LogObserver(const LogLevel min_level) : out_(&std::cerr), min_level_(min_level) {}

LogObserver::LogObserver(std::ostream &out, const LogLevel min_level)
    : out_(&out), min_level_(min_level) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << log_level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, RequestRejectedEvent>) {
          log_line(LogLevel::Info, "request.rejected stage=" + evt.stage + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, ModelFailoverEvent>) {
          log_line(LogLevel::Warn, "model.failover from=" + evt.from_model + " to=" +
                                       evt.to_model + " index=" + std::to_string(evt.index));
        } else if constexpr (std::is_same_v<T, ModelsExhaustedEvent>) {
          log_line(LogLevel::Error, "model.exhausted last=" + evt.last_model);
        } else if constexpr (std::is_same_v<T, GenerationCompletedEvent>) {
          log_line(LogLevel::Info, "generation.done model=" + evt.model +
                                       " attempts=" + std::to_string(evt.attempts) +
                                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, SessionEvent>) {
          log_line(LogLevel::Debug, "session." + evt.action + " id=" + evt.session_id);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.request_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ActiveSessionsMetric>) {
          log_line(LogLevel::Debug, "metric.active_sessions=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, RosterCursorMetric>) {
          log_line(LogLevel::Debug, "metric.roster_cursor=" + std::to_string(m.index));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace tutorguard::observability
