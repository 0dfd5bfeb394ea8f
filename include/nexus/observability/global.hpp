#pragma once

#include "nexus/observability/observer.hpp"

#include <memory>

namespace nexus::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_heartbeat_tick(const std::string &agent_id, bool success);
void record_monitor_launch(const std::string &session, const std::string &strategy, int pid);
void record_stale_terminated(const std::string &owner, int pid);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace nexus::observability
