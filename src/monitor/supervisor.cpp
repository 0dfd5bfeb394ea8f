#include "nexus/monitor/supervisor.hpp"

#include "nexus/health/health.hpp"
#include "nexus/launch/factory.hpp"
#include "nexus/launch/strategy.hpp"
#include "nexus/launch/windows_console.hpp"
#include "nexus/observability/global.hpp"

#include <ostream>
#include <vector>

namespace nexus::monitor {

namespace {

constexpr const char *COMPONENT = "monitor";
constexpr const char *ADVISORY =
    "NOTE: Install 'screen' or 'tmux' for better background process management.";

} // namespace

MonitorOptions options_from_config(const config::MonitorConfig &config) {
  MonitorOptions options;
  options.event_session = config.event_session;
  options.status_session = config.status_session;
  options.kill_signature = config.kill_signature;
  options.poll_interval_secs = config.poll_interval_secs;
  options.preferred_strategy = config.strategy;
  return options;
}

MonitorSupervisor::MonitorSupervisor(MonitorOptions options, daemon::PidFileStore &store,
                                     collab::ICollaborators &collaborators,
                                     process::ICommandRunner &runner,
                                     process::IProcessTable &processes,
                                     const process::IToolProbe &probe,
                                     const process::Platform platform, std::ostream &out)
    : options_(std::move(options)), store_(store), collaborators_(collaborators),
      runner_(runner), processes_(processes), probe_(probe), platform_(platform), out_(out) {}

process::CommandSpec MonitorSupervisor::status_poller_command() const {
  const auto list = collaborators_.list_statuses_command();
  process::CommandSpec spec;
  spec.program = "watch";
  spec.args = {"-n", std::to_string(options_.poll_interval_secs), list.program};
  spec.args.insert(spec.args.end(), list.args.begin(), list.args.end());
  spec.cwd = options_.cwd;
  return spec;
}

void MonitorSupervisor::quit_sessions() {
  std::vector<launch::LaunchStrategy> strategies;
  if (process::is_unix(platform_)) {
    for (const auto strategy : {launch::LaunchStrategy::Screen, launch::LaunchStrategy::Tmux}) {
      if (probe_.has_tool(std::string(launch::strategy_name(strategy)))) {
        strategies.push_back(strategy);
      }
    }
  } else if (probe_.has_tool("cmd")) {
    // Console windows are found by title.
    strategies.push_back(launch::LaunchStrategy::WindowsConsole);
  }

  const launch::LaunchContext context{.runner = runner_, .processes = processes_, .probe = probe_};
  for (const auto strategy : strategies) {
    auto launcher = launch::create_launcher(strategy, context);
    for (const auto &session : {options_.event_session, options_.status_session}) {
      const launch::LaunchHandle handle{.strategy = strategy, .pid = 0, .session = session};
      if (launcher->is_running(handle)) {
        // An already-gone session is not worth reporting.
        (void)launcher->stop(handle);
      }
    }
  }
}

std::size_t MonitorSupervisor::kill_stale() {
  std::size_t terminated = 0;
  for (const auto &owner : {options_.event_session, options_.status_session}) {
    if (store_.terminate_and_clear(owner).has_value()) {
      ++terminated;
    }
  }

  quit_sessions();
  if (!process::is_unix(platform_)) {
    return terminated;
  }

  for (const int pid : processes_.find_by_signature(options_.kill_signature)) {
    if (pid <= 1 || pid == process::current_pid()) {
      continue;
    }
    auto status = processes_.terminate(pid);
    if (status.ok()) {
      ++terminated;
      observability::record_stale_terminated(options_.kill_signature, pid);
    } else {
      observability::record_warning(COMPONENT, status.error());
    }
  }
  return terminated;
}

std::optional<launch::LaunchHandle> MonitorSupervisor::launch_task(launch::ILauncher &launcher,
                                                                   const launch::LaunchSpec &spec) {
  auto handle = launcher.launch(spec);
  if (!handle.ok()) {
    out_ << "Warning: Unable to start " << spec.name << ": " << handle.error() << "\n";
    observability::record_warning(COMPONENT, handle.error());
    return std::nullopt;
  }
  const auto &launched = handle.value();
  if (launched.pid > 0) {
    if (auto written = store_.write(spec.name, launched.pid); !written.ok()) {
      observability::record_warning(COMPONENT, written.error());
    }
  }
  observability::record_monitor_launch(spec.name,
                                       std::string(launch::strategy_name(launched.strategy)),
                                       launched.pid);
  return launched;
}

MonitorReport MonitorSupervisor::run() {
  MonitorReport report;
  health::mark_component_starting(COMPONENT);

  auto event_lock = store_.lock(options_.event_session);
  auto status_lock = store_.lock(options_.status_session);
  if (!event_lock.ok() || !status_lock.ok()) {
    observability::record_warning(COMPONENT, "monitor records are not locked");
  }

  report.stale_terminated = kill_stale();

  auto selected = launch::select_strategy(platform_, probe_, options_.preferred_strategy);
  if (!selected.ok()) {
    const auto shell = launch::windows_shell(probe_).value_or("bash.exe");
    out_ << "Warning: Unable to start monitoring automatically.\n";
    out_ << "Please open a new terminal and run: " << shell << " scripts/watch_events.sh\n";
    observability::record_warning(COMPONENT, selected.error());
    health::mark_component_error(COMPONENT, selected.error());
    return report;
  }

  const auto strategy = selected.value();
  report.strategy = strategy;
  const std::string name(launch::strategy_name(strategy));
  if (options_.preferred_strategy != "auto" && options_.preferred_strategy != name &&
      process::is_unix(platform_)) {
    observability::record_warning(COMPONENT, "monitor.strategy '" + options_.preferred_strategy +
                                                 "' is unavailable, using " + name);
  }

  switch (strategy) {
  case launch::LaunchStrategy::Screen:
    out_ << "Starting event monitor in screen session...\n";
    break;
  case launch::LaunchStrategy::Tmux:
    out_ << "Starting event monitor in tmux session...\n";
    break;
  case launch::LaunchStrategy::BareBackground:
    out_ << "Starting event monitor in background...\n";
    break;
  case launch::LaunchStrategy::WindowsConsole:
    out_ << "Starting event monitoring in a new window...\n";
    break;
  }

  const launch::LaunchContext context{.runner = runner_, .processes = processes_, .probe = probe_};
  auto launcher = launch::create_launcher(strategy, context);

  auto watcher = collaborators_.watch_events_command();
  watcher.cwd = options_.cwd;
  if (auto handle = launch_task(*launcher, {.name = options_.event_session, .command = watcher})) {
    report.launched.push_back(*handle);
  }
  if (launch::is_multiplexer(strategy)) {
    if (auto handle = launch_task(
            *launcher, {.name = options_.status_session, .command = status_poller_command()})) {
      report.launched.push_back(*handle);
    }
  }

  out_ << "Monitoring strategy: " << name << "\n";
  if (!launch::is_multiplexer(strategy) && process::is_unix(platform_)) {
    out_ << ADVISORY << "\n";
    report.advisory = true;
  }

  observability::record_metric(
      observability::ActiveMonitorsMetric{.count = report.launched.size()});
  if (report.launched.empty()) {
    health::mark_component_error(COMPONENT, "no monitor could be launched");
  } else {
    health::mark_component_ok(COMPONENT);
  }
  return report;
}

common::Status MonitorSupervisor::stop() {
  const auto terminated = kill_stale();
  out_ << "Stopped monitors (" << terminated << " process"
       << (terminated == 1 ? "" : "es") << " terminated)\n";
  health::mark_component_stopped(COMPONENT);
  return common::Status::success();
}

std::vector<TaskStatus> MonitorSupervisor::status() {
  const launch::LaunchContext context{.runner = runner_, .processes = processes_, .probe = probe_};
  std::vector<TaskStatus> tasks;
  for (const auto &name : {options_.event_session, options_.status_session}) {
    TaskStatus task;
    task.name = name;
    task.pid = store_.read(name);
    task.alive = task.pid.has_value() && processes_.is_alive(*task.pid);
    if (!task.alive && process::is_unix(platform_)) {
      for (const auto strategy : {launch::LaunchStrategy::Screen, launch::LaunchStrategy::Tmux}) {
        if (!probe_.has_tool(std::string(launch::strategy_name(strategy)))) {
          continue;
        }
        auto launcher = launch::create_launcher(strategy, context);
        if (launcher->is_running({.strategy = strategy, .pid = 0, .session = name})) {
          task.alive = true;
          break;
        }
      }
    }
    tasks.push_back(std::move(task));
  }
  return tasks;
}

} // namespace nexus::monitor
