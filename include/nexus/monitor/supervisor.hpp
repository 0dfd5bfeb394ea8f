#pragma once

#include "nexus/collab/collaborators.hpp"
#include "nexus/config/schema.hpp"
#include "nexus/daemon/pid_file.hpp"
#include "nexus/launch/launcher.hpp"
#include "nexus/process/command_runner.hpp"
#include "nexus/process/process_table.hpp"
#include "nexus/process/tool_probe.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace nexus::monitor {

struct MonitorOptions {
  std::string event_session = "event_monitor";
  std::string status_session = "agent_monitor";
  std::string kill_signature = "scripts/watch_events.sh";
  std::uint32_t poll_interval_secs = 10;
  std::string preferred_strategy = "auto";
  std::optional<std::filesystem::path> cwd;
};

[[nodiscard]] MonitorOptions options_from_config(const config::MonitorConfig &config);

struct MonitorReport {
  std::optional<launch::LaunchStrategy> strategy;
  std::vector<launch::LaunchHandle> launched;
  std::size_t stale_terminated = 0;
  bool advisory = false;
};

struct TaskStatus {
  std::string name;
  std::optional<int> pid;
  bool alive = false;
};

class MonitorSupervisor {
public:
  MonitorSupervisor(MonitorOptions options, daemon::PidFileStore &store,
                    collab::ICollaborators &collaborators, process::ICommandRunner &runner,
                    process::IProcessTable &processes, const process::IToolProbe &probe,
                    process::Platform platform, std::ostream &out);

  /// Kill stale, select a strategy, launch, record. Launch problems are
  /// reported and leave monitoring down; they never fail the caller.
  MonitorReport run();

  /// Terminates recorded monitors, quits named sessions, then falls back to
  /// the command-line signature on Unix. Returns how many processes died.
  std::size_t kill_stale();

  [[nodiscard]] common::Status stop();
  [[nodiscard]] std::vector<TaskStatus> status();

  [[nodiscard]] process::CommandSpec status_poller_command() const;

private:
  void quit_sessions();
  std::optional<launch::LaunchHandle> launch_task(launch::ILauncher &launcher,
                                                  const launch::LaunchSpec &spec);

  MonitorOptions options_;
  daemon::PidFileStore &store_;
  collab::ICollaborators &collaborators_;
  process::ICommandRunner &runner_;
  process::IProcessTable &processes_;
  const process::IToolProbe &probe_;
  process::Platform platform_;
  std::ostream &out_;
};

} // namespace nexus::monitor
