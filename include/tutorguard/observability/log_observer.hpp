#pragma once

#include "tutorguard/observability/observer.hpp"

#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

namespace tutorguard::observability {

enum class LogLevel {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
};

[[nodiscard]] std::optional<LogLevel> parse_log_level(const std::string &value);
[[nodiscard]] std::string_view log_level_name(LogLevel level);

/// Writes one `[LEVEL] message` line per event. Lines below `min_level` are dropped.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info);
  LogObserver(std::ostream &out, LogLevel min_level);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(LogLevel level, const std::string &message);

  std::ostream *out_;
  LogLevel min_level_;
  std::mutex mutex_;
};

} // namespace tutorguard::observability
