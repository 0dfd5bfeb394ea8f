#include "nexus/doctor/diagnostics.hpp"

#include "nexus/common/fs.hpp"
#include "nexus/config/config.hpp"
#include "nexus/daemon/pid_file.hpp"
#include "nexus/launch/strategy.hpp"
#include "nexus/setup/dependencies.hpp"

#include <ostream>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace nexus::doctor {

namespace {

constexpr const char *SCRIPTS[] = {"agent_status.sh", "log_event.sh", "watch_events.sh",
                                   "generate_snapshot.sh"};

void add_check(DiagnosticsReport &report, DiagnosticCheck check) {
  switch (check.status) {
  case CheckStatus::Pass:
    ++report.passed;
    break;
  case CheckStatus::Fail:
    ++report.failed;
    break;
  case CheckStatus::Warn:
    ++report.warnings;
    break;
  }
  report.checks.push_back(std::move(check));
}

DiagnosticCheck check_config(const config::Config &config) {
  DiagnosticCheck check{.name = "Config", .status = CheckStatus::Pass, .message = "valid"};
  auto validation = config::validate_config(config);
  if (!validation.ok()) {
    check.status = CheckStatus::Fail;
    check.message = validation.error();
  } else if (!validation.value().empty()) {
    check.status = CheckStatus::Warn;
    check.message = validation.value().front();
  }
  return check;
}

DiagnosticCheck check_dependencies(const process::IToolProbe &probe,
                                   const process::Platform platform) {
  DiagnosticCheck check{.name = "Dependencies", .status = CheckStatus::Pass, .message = ""};
  const auto missing = setup::missing_dependencies(platform, probe);
  if (missing.empty()) {
    std::vector<std::string> tools;
    for (const auto &dep : setup::required_dependencies(platform)) {
      tools.push_back(dep.tool);
    }
    check.message = common::join(tools, ", ") + " found";
    return check;
  }
  std::vector<std::string> names;
  for (const auto &dep : missing) {
    names.push_back(dep.tool);
  }
  check.status = CheckStatus::Fail;
  check.message = "missing " + common::join(names, ", ");
  const auto hints = setup::install_hints(platform, probe, missing);
  if (!hints.empty()) {
    check.message += " (" + common::trim(hints.front()) + ")";
  }
  return check;
}

std::vector<DiagnosticCheck> check_launch(const config::Config &config,
                                          const process::IToolProbe &probe,
                                          const process::Platform platform) {
  std::vector<DiagnosticCheck> checks;
  DiagnosticCheck check{.name = "Launch strategy", .status = CheckStatus::Pass, .message = ""};
  const auto selected = launch::select_strategy(platform, probe, config.monitor.strategy);
  if (!selected.ok()) {
    check.status = CheckStatus::Fail;
    check.message = selected.error();
    checks.push_back(std::move(check));
    return checks;
  }

  check.message = std::string(launch::strategy_name(selected.value()));
  if (selected.value() == launch::LaunchStrategy::BareBackground) {
    check.status = CheckStatus::Warn;
    check.message += " (install screen or tmux for named sessions)";
  }
  checks.push_back(std::move(check));

  if (launch::is_multiplexer(selected.value()) && !probe.has_tool("watch")) {
    checks.push_back(DiagnosticCheck{.name = "Status poller",
                                     .status = CheckStatus::Warn,
                                     .message = "'watch' not found; the status session will exit"});
  }
  return checks;
}

DiagnosticCheck check_scripts(const config::Config &config, const process::Platform platform) {
  DiagnosticCheck check{.name = "Scripts", .status = CheckStatus::Pass, .message = ""};
  const auto dir = config::resolve_dir(config, config.scripts_dir);
  std::vector<std::string> missing;
  std::vector<std::string> not_executable;
  for (const char *script : SCRIPTS) {
    const auto path = dir / script;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
      missing.push_back(script);
      continue;
    }
#ifndef _WIN32
    if (process::is_unix(platform) && access(path.c_str(), X_OK) != 0) {
      not_executable.push_back(script);
    }
#else
    (void)platform;
#endif
  }
  if (!missing.empty()) {
    check.status = CheckStatus::Fail;
    check.message = "missing in " + dir.string() + ": " + common::join(missing, ", ");
  } else if (!not_executable.empty()) {
    check.status = CheckStatus::Warn;
    check.message = "not executable (setup fixes this): " + common::join(not_executable, ", ");
  } else {
    check.message = "all present in " + dir.string();
  }
  return check;
}

DiagnosticCheck check_run_dir(const config::Config &config) {
  DiagnosticCheck check{.name = "Run directory", .status = CheckStatus::Pass, .message = ""};
  const auto dir = config::resolve_dir(config, config.run_dir);
  const auto probe_file = dir / ".nexus" / "doctor.probe";
  auto written = common::write_file_atomic(probe_file, "ok\n");
  if (!written.ok()) {
    check.status = CheckStatus::Fail;
    check.message = written.error();
    return check;
  }
  std::error_code ec;
  std::filesystem::remove(probe_file, ec);
  check.message = "writable: " + dir.string();
  return check;
}

DiagnosticCheck check_records(const config::Config &config, process::IProcessTable &processes) {
  DiagnosticCheck check{.name = "PID records", .status = CheckStatus::Pass, .message = ""};
  const daemon::PidFileStore store(config::resolve_dir(config, config.run_dir));
  const auto records = store.list();
  std::vector<std::string> stale;
  for (const auto &record : records) {
    if (!processes.is_alive(record.pid)) {
      stale.push_back(record.owner_key + "=" + std::to_string(record.pid));
    }
  }
  if (!stale.empty()) {
    check.status = CheckStatus::Warn;
    check.message = "stale: " + common::join(stale, ", ");
  } else {
    check.message = std::to_string(records.size()) + " live";
  }
  return check;
}

} // namespace

DiagnosticsReport run_diagnostics(const config::Config &config, const process::IToolProbe &probe,
                                  process::IProcessTable &processes,
                                  const process::Platform platform) {
  DiagnosticsReport report;
  add_check(report, check_config(config));
  add_check(report, check_dependencies(probe, platform));
  for (auto &check : check_launch(config, probe, platform)) {
    add_check(report, std::move(check));
  }
  add_check(report, check_scripts(config, platform));
  add_check(report, check_run_dir(config));
  add_check(report, check_records(config, processes));
  return report;
}

void print_diagnostics_report(const DiagnosticsReport &report, std::ostream &out) {
  auto status_prefix = [](CheckStatus status) -> const char * {
    switch (status) {
    case CheckStatus::Pass:
      return "[PASS]";
    case CheckStatus::Fail:
      return "[FAIL]";
    case CheckStatus::Warn:
      return "[WARN]";
    }
    return "[INFO]";
  };

  for (const auto &check : report.checks) {
    out << status_prefix(check.status) << " " << check.name << ": " << check.message << "\n";
  }
  out << "Summary: " << report.passed << " passed, " << report.failed << " failed, "
      << report.warnings << " warnings\n";
}

} // namespace nexus::doctor
