#pragma once

#include "nexus/config/schema.hpp"
#include "nexus/observability/observer.hpp"

#include <memory>

namespace nexus::observability {

/// Backends: "log", "none"/"noop", or a comma list of those.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace nexus::observability
