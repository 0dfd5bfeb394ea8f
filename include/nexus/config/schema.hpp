#pragma once

#include <cstdint>
#include <string>

namespace nexus::config {

struct HeartbeatConfig {
  std::uint32_t interval_secs = 60;
};

struct MonitorConfig {
  std::string strategy = "auto";
  std::uint32_t poll_interval_secs = 10;
  std::string event_session = "event_monitor";
  std::string status_session = "agent_monitor";
  std::string kill_signature = "scripts/watch_events.sh";
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  std::string workspace_dir = ".";
  std::string run_dir = ".";
  std::string scripts_dir = "scripts";
  HeartbeatConfig heartbeat;
  MonitorConfig monitor;
  ObservabilityConfig observability;
};

} // namespace nexus::config
