#include "tutorguard/observability/factory.hpp"

#include "tutorguard/common/strings.hpp"
#include "tutorguard/observability/log_observer.hpp"
#include "tutorguard/observability/noop_observer.hpp"

namespace tutorguard::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  const auto level = parse_log_level(config.observability.log_level).value_or(LogLevel::Info);
  return std::make_unique<LogObserver>(level);
}

} // namespace tutorguard::observability
