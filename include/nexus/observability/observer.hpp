#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace nexus::observability {

struct HeartbeatTickEvent {
  std::string agent_id;
  bool success = true;
};

struct MonitorLaunchEvent {
  std::string session;
  std::string strategy;
  int pid = 0;
};

struct StaleTerminatedEvent {
  std::string owner;
  int pid = 0;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<HeartbeatTickEvent, MonitorLaunchEvent, StaleTerminatedEvent,
                                   WarningEvent, ErrorEvent>;

struct HeartbeatLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct ConsecutiveFailuresMetric {
  std::uint64_t count = 0;
};

struct ActiveMonitorsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric =
    std::variant<HeartbeatLatencyMetric, ConsecutiveFailuresMetric, ActiveMonitorsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace nexus::observability
