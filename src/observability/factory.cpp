#include "nexus/observability/factory.hpp"

#include "nexus/common/fs.hpp"
#include "nexus/observability/log_observer.hpp"
#include "nexus/observability/multi_observer.hpp"
#include "nexus/observability/noop_observer.hpp"

namespace nexus::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &backend) {
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.find(',') == std::string::npos) {
    return create_single(backend);
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &part : common::split(backend, ',')) {
    const std::string name = common::trim(part);
    if (name.empty()) {
      continue;
    }
    multi->add(create_single(name));
  }
  return multi;
}

} // namespace nexus::observability
