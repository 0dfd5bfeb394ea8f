#include "nexus/cli/commands.hpp"

#include "nexus/agent/identity.hpp"
#include "nexus/collab/collaborators.hpp"
#include "nexus/common/fs.hpp"
#include "nexus/common/json_util.hpp"
#include "nexus/config/config.hpp"
#include "nexus/daemon/pid_file.hpp"
#include "nexus/daemon/state_writer.hpp"
#include "nexus/doctor/diagnostics.hpp"
#include "nexus/heartbeat/scheduler.hpp"
#include "nexus/launch/windows_console.hpp"
#include "nexus/monitor/supervisor.hpp"
#include "nexus/observability/factory.hpp"
#include "nexus/observability/global.hpp"
#include "nexus/process/command_runner.hpp"
#include "nexus/process/process_table.hpp"
#include "nexus/process/tool_probe.hpp"
#include "nexus/setup/orchestrator.hpp"
#include "nexus/setup/prompt.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace nexus::cli {

namespace {

std::atomic<bool> g_shutdown_requested{false};

void handle_shutdown_signal(int) { g_shutdown_requested = true; }

std::string version_string() {
#ifdef NEXUS_VERSION
  return std::string("nexus ") + NEXUS_VERSION;
#else
  return "nexus 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

bool parse_duration(const std::string &raw, int &out) {
  if (raw.empty()) {
    out = 0;
    return true;
  }
  try {
    std::size_t used = 0;
    out = std::stoi(raw, &used);
    return used == raw.size() && out >= 0;
  } catch (const std::exception &) {
    return false;
  }
}

/// Blocks until SIGINT/SIGTERM, or until `duration_secs` passes when positive.
void wait_for_shutdown(const int duration_secs) {
  g_shutdown_requested = false;
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(duration_secs);
  while (!g_shutdown_requested) {
    if (duration_secs > 0 && std::chrono::steady_clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}

/// Loaded config plus the OS-facing services every command shares.
struct Runtime {
  config::Config config;
  process::Platform platform = process::current_platform();
  process::SystemCommandRunner runner;
  std::shared_ptr<process::SystemProcessTable> processes =
      std::make_shared<process::SystemProcessTable>();
  process::PathToolProbe probe;
  std::unique_ptr<daemon::PidFileStore> store;
  std::unique_ptr<collab::ScriptCollaborators> collaborators;

  [[nodiscard]] monitor::MonitorSupervisor make_supervisor(std::ostream &out) {
    return monitor::MonitorSupervisor(monitor::options_from_config(config.monitor), *store,
                                      *collaborators, runner, *processes, probe, platform, out);
  }

  [[nodiscard]] std::chrono::milliseconds heartbeat_interval() const {
    return std::chrono::seconds(config.heartbeat.interval_secs);
  }
};

std::unique_ptr<Runtime> load_runtime() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << "config: " << cfg.error() << "\n";
    return nullptr;
  }
  auto validation = config::validate_config(cfg.value());
  if (!validation.ok()) {
    std::cerr << "config: " << validation.error() << "\n";
    return nullptr;
  }

  auto runtime = std::make_unique<Runtime>();
  runtime->config = cfg.value();
  observability::set_global_observer(observability::create_observer(runtime->config));
  for (const auto &warning : validation.value()) {
    observability::record_warning("config", warning);
  }

  // Collaborator scripts are addressed relative to the workspace.
  if (runtime->config.workspace_dir != ".") {
    std::error_code ec;
    std::filesystem::current_path(runtime->config.workspace_dir, ec);
    if (ec) {
      std::cerr << "workspace " << runtime->config.workspace_dir << ": " << ec.message() << "\n";
      return nullptr;
    }
    runtime->config.workspace_dir = ".";
  }

  runtime->store = std::make_unique<daemon::PidFileStore>(
      config::resolve_dir(runtime->config, runtime->config.run_dir), runtime->processes);
  runtime->collaborators = std::make_unique<collab::ScriptCollaborators>(
      runtime->runner, config::resolve_dir(runtime->config, runtime->config.scripts_dir),
      runtime->platform, launch::windows_shell(runtime->probe));
  return runtime;
}

void print_help() {
  std::cout << "Usage: nexus [--config <path>] <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  setup       Bring up the workspace, monitors and this agent's heartbeat\n";
  std::cout << "              [--id ID] [--kind KIND] [--description TEXT] [--non-interactive]\n";
  std::cout << "              [--skip-deps] [--no-wait] [--duration-secs N]\n";
  std::cout << "  heartbeat   Host only the heartbeat: heartbeat <agent_id> [--duration-secs N]\n";
  std::cout << "  monitor     Manage the background monitors: monitor start|stop|status\n";
  std::cout << "  stop        Stop an agent's heartbeat: stop <agent_id>\n";
  std::cout << "  status      Show PID records, monitors and the last host state\n";
  std::cout << "  doctor      Check dependencies and launch capabilities\n";
  std::cout << "  config-path Print the config file location\n";
  std::cout << "  version     Print the version\n";
  std::cout << "  help        Show this help\n";
}

int host_heartbeat(Runtime &runtime, heartbeat::HeartbeatScheduler &scheduler,
                   const std::string &agent_id, const std::string &strategy,
                   const int duration_secs) {
  daemon::StateWriter state(config::state_file_path(runtime.config), agent_id);
  state.set_strategy(strategy);
  state.start();

  std::cout << "Heartbeat running for " << agent_id << " every "
            << runtime.config.heartbeat.interval_secs << "s (pid " << process::current_pid()
            << "). Press Ctrl+C to stop.\n";
  wait_for_shutdown(duration_secs);

  scheduler.stop();
  state.stop();
  std::cout << "Heartbeat stopped.\n";
  return 0;
}

int run_setup(std::vector<std::string> args) {
  setup::SetupOptions options;
  std::string value;
  if (take_option(args, "--id", "", value)) {
    options.id = value;
  }
  if (take_option(args, "--kind", "", value)) {
    options.kind = value;
  }
  if (take_option(args, "--description", "", value)) {
    options.description = value;
  }
  options.non_interactive = take_flag(args, "--non-interactive");
  options.skip_deps = take_flag(args, "--skip-deps");
  const bool no_wait = take_flag(args, "--no-wait");
  std::string duration_raw;
  (void)take_option(args, "--duration-secs", "", duration_raw);
  int duration_secs = 0;
  if (!parse_duration(duration_raw, duration_secs)) {
    std::cerr << "invalid --duration-secs: " << duration_raw << "\n";
    return 1;
  }
  if (!args.empty()) {
    std::cerr << "Unknown setup option: " << args.front() << "\n";
    return 1;
  }

  auto runtime = load_runtime();
  if (runtime == nullptr) {
    return 1;
  }

  heartbeat::HeartbeatScheduler scheduler(*runtime->store, *runtime->collaborators,
                                          runtime->heartbeat_interval());
  auto supervisor = runtime->make_supervisor(std::cout);
  setup::StreamPrompter prompter(std::cin, std::cout);
  setup::SetupOrchestrator orchestrator(runtime->config,
                                        setup::SetupContext{.probe = runtime->probe,
                                                            .platform = runtime->platform,
                                                            .collaborators = *runtime->collaborators,
                                                            .monitors = supervisor,
                                                            .heartbeat = scheduler,
                                                            .prompter = prompter,
                                                            .out = std::cout});

  auto identity = orchestrator.run(options);
  if (!identity.ok()) {
    std::cerr << "setup failed (" << common::error_kind_name(identity.kind())
              << "): " << identity.error() << "\n";
    return 1;
  }
  if (no_wait) {
    return 0;
  }

  return host_heartbeat(*runtime, scheduler, identity.value().id, runtime->config.monitor.strategy,
                        duration_secs);
}

int run_heartbeat(std::vector<std::string> args) {
  std::string duration_raw;
  (void)take_option(args, "--duration-secs", "", duration_raw);
  int duration_secs = 0;
  if (!parse_duration(duration_raw, duration_secs)) {
    std::cerr << "invalid --duration-secs: " << duration_raw << "\n";
    return 1;
  }
  if (args.size() != 1) {
    std::cerr << "Usage: nexus heartbeat <agent_id> [--duration-secs N]\n";
    return 1;
  }
  const auto valid = agent::validate_identity({.id = args[0], .kind = "agent", .description = ""});
  if (!valid.ok()) {
    std::cerr << valid.error() << "\n";
    return 1;
  }

  auto runtime = load_runtime();
  if (runtime == nullptr) {
    return 1;
  }
  heartbeat::HeartbeatScheduler scheduler(*runtime->store, *runtime->collaborators,
                                          runtime->heartbeat_interval());
  auto started = scheduler.start(args[0]);
  if (!started.ok()) {
    std::cerr << started.error() << "\n";
    return 1;
  }
  return host_heartbeat(*runtime, scheduler, args[0], "", duration_secs);
}

int run_monitor(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "Usage: nexus monitor start|stop|status\n";
    return 1;
  }
  auto runtime = load_runtime();
  if (runtime == nullptr) {
    return 1;
  }
  auto supervisor = runtime->make_supervisor(std::cout);

  const std::string action = args[0];
  if (action == "start") {
    const auto report = supervisor.run();
    return report.launched.empty() ? 1 : 0;
  }
  if (action == "stop") {
    auto stopped = supervisor.stop();
    if (!stopped.ok()) {
      std::cerr << stopped.error() << "\n";
      return 1;
    }
    return 0;
  }
  if (action == "status") {
    for (const auto &task : supervisor.status()) {
      std::cout << task.name << ": " << (task.alive ? "running" : "stopped");
      if (task.pid.has_value()) {
        std::cout << " (pid " << *task.pid << ")";
      }
      std::cout << "\n";
    }
    return 0;
  }
  std::cerr << "Unknown monitor action: " << action << "\n";
  return 1;
}

int run_stop(std::vector<std::string> args) {
  if (args.size() != 1) {
    std::cerr << "Usage: nexus stop <agent_id>\n";
    return 1;
  }
  auto runtime = load_runtime();
  if (runtime == nullptr) {
    return 1;
  }
  const auto owner_key = daemon::heartbeat_owner_key(args[0]);
  const auto recorded = runtime->store->read(owner_key);
  const auto terminated = runtime->store->terminate_and_clear(owner_key);
  if (terminated.has_value()) {
    std::cout << "Stopped heartbeat for " << args[0] << " (pid " << *terminated << ")\n";
  } else if (recorded.has_value()) {
    std::cout << "Cleared heartbeat record for " << args[0] << "\n";
  } else {
    std::cout << "No heartbeat recorded for " << args[0] << "\n";
  }
  return 0;
}

int run_status() {
  auto runtime = load_runtime();
  if (runtime == nullptr) {
    return 1;
  }

  std::cout << "Platform: " << process::platform_name(runtime->platform) << "\n";
  std::cout << "Run dir: " << runtime->store->run_dir().string() << "\n";

  const auto records = runtime->store->list();
  std::cout << "PID records:";
  if (records.empty()) {
    std::cout << " none";
  }
  std::cout << "\n";
  for (const auto &record : records) {
    std::cout << "  " << record.owner_key << " pid=" << record.pid << " "
              << (runtime->processes->is_alive(record.pid) ? "alive" : "dead") << "\n";
  }

  auto supervisor = runtime->make_supervisor(std::cout);
  std::cout << "Monitors:\n";
  for (const auto &task : supervisor.status()) {
    std::cout << "  " << task.name << ": " << (task.alive ? "running" : "stopped") << "\n";
  }

  const auto state_path = config::state_file_path(runtime->config);
  auto state = common::read_file(state_path);
  if (state.ok()) {
    std::cout << "Last host state (" << state_path.string() << "):\n";
    std::cout << "  agent=" << common::json_get_string(state.value(), "agent_id")
              << " pid=" << common::json_get_number(state.value(), "pid")
              << " strategy=" << common::json_get_string(state.value(), "strategy")
              << " written_at=" << common::json_get_string(state.value(), "written_at") << "\n";
    const auto heartbeat = common::json_get_object(state.value(), "heartbeat");
    if (!heartbeat.empty()) {
      std::cout << "  heartbeat=" << common::json_get_string(heartbeat, "status") << "\n";
    }
  } else {
    std::cout << "Last host state: none\n";
  }
  return 0;
}

int run_doctor() {
  auto runtime = load_runtime();
  if (runtime == nullptr) {
    std::cerr << "[FAIL] Config load\n";
    return 1;
  }
  const auto report = doctor::run_diagnostics(runtime->config, runtime->probe,
                                              *runtime->processes, runtime->platform);
  doctor::print_diagnostics_report(report, std::cout);
  return report.failed == 0 ? 0 : 1;
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argv + (argc > 0 ? 1 : 0));
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    std::cout << config::config_path().string();
    if (!config::config_exists()) {
      std::cout << " (not found)";
    }
    std::cout << "\n";
    return 0;
  }
  if (subcommand == "setup") {
    return run_setup(std::move(args));
  }
  if (subcommand == "heartbeat") {
    return run_heartbeat(std::move(args));
  }
  if (subcommand == "monitor") {
    return run_monitor(std::move(args));
  }
  if (subcommand == "stop") {
    return run_stop(std::move(args));
  }
  if (subcommand == "status") {
    return run_status();
  }
  if (subcommand == "doctor") {
    return run_doctor();
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace nexus::cli
