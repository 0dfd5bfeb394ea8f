#include "nexus/observability/global.hpp"

#include <mutex>

namespace nexus::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

// Dispatch under the lock: the heartbeat thread records while the main
// thread may swap observers on shutdown.
void record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_metric(metric);
  }
}

void record_heartbeat_tick(const std::string &agent_id, const bool success) {
  record_event(HeartbeatTickEvent{.agent_id = agent_id, .success = success});
}

void record_monitor_launch(const std::string &session, const std::string &strategy,
                           const int pid) {
  record_event(MonitorLaunchEvent{.session = session, .strategy = strategy, .pid = pid});
}

void record_stale_terminated(const std::string &owner, const int pid) {
  record_event(StaleTerminatedEvent{.owner = owner, .pid = pid});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace nexus::observability
