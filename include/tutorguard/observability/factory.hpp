#pragma once

#include "tutorguard/config/schema.hpp"
#include "tutorguard/observability/observer.hpp"

#include <memory>

namespace tutorguard::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace tutorguard::observability
