#include "nexus/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace nexus::observability {

namespace {

void log_line(std::ostream &out, const std::string &level, const std::string &message) {
  out << "[" << level << "] " << message << "\n";
}

} // namespace

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::record_event(const ObserverEvent &event) {
  std::ostream &out = *out_;
  std::visit(
      [&out](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, HeartbeatTickEvent>) {
          log_line(out, evt.success ? "DEBUG" : "WARN",
                   "heartbeat.tick agent=" + evt.agent_id +
                       " success=" + (evt.success ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, MonitorLaunchEvent>) {
          log_line(out, "INFO",
                   "monitor.launch session=" + evt.session + " strategy=" + evt.strategy +
                       (evt.pid > 0 ? " pid=" + std::to_string(evt.pid) : std::string()));
        } else if constexpr (std::is_same_v<T, StaleTerminatedEvent>) {
          log_line(out, "INFO",
                   "stale.terminated owner=" + evt.owner + " pid=" + std::to_string(evt.pid));
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line(out, "WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(out, "ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::ostream &out = *out_;
  std::visit(
      [&out](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, HeartbeatLatencyMetric>) {
          log_line(out, "DEBUG", "metric.heartbeat_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ConsecutiveFailuresMetric>) {
          log_line(out, "DEBUG", "metric.consecutive_failures=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, ActiveMonitorsMetric>) {
          log_line(out, "DEBUG", "metric.active_monitors=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace nexus::observability
