#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace tutorguard::observability {

struct RequestRejectedEvent {
  std::string stage;
  std::string reason;
};

struct ModelFailoverEvent {
  std::string from_model;
  std::string to_model;
  std::size_t index = 0;
};

struct ModelsExhaustedEvent {
  std::string last_model;
};

struct GenerationCompletedEvent {
  std::string model;
  std::size_t attempts = 0;
  std::chrono::milliseconds duration{0};
};

struct SessionEvent {
  std::string session_id;
  std::string action;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<RequestRejectedEvent, ModelFailoverEvent, ModelsExhaustedEvent,
                                   GenerationCompletedEvent, SessionEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct ActiveSessionsMetric {
  std::uint64_t count = 0;
};

struct RosterCursorMetric {
  std::size_t index = 0;
};

using ObserverMetric = std::variant<RequestLatencyMetric, ActiveSessionsMetric, RosterCursorMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace tutorguard::observability
