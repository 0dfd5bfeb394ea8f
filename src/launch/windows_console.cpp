#include "nexus/launch/windows_console.hpp"

#include "nexus/common/fs.hpp"

namespace nexus::launch {

namespace {

std::string title_filter(const std::string &session) { return "WINDOWTITLE eq " + session + "*"; }

} // namespace

std::optional<std::string> windows_shell(const process::IToolProbe &probe) {
  for (const char *shell : {"bash.exe", "sh.exe"}) {
    if (probe.has_tool(shell)) {
      return std::string(shell);
    }
  }
  return std::nullopt;
}

WindowsConsoleLauncher::WindowsConsoleLauncher(process::ICommandRunner &runner,
                                               const process::IToolProbe &probe)
    : runner_(runner), probe_(probe) {}

common::Result<LaunchHandle> WindowsConsoleLauncher::launch(const LaunchSpec &spec) {
  const auto shell = windows_shell(probe_);
  if (!shell.has_value()) {
    return common::Result<LaunchHandle>::failure(common::ErrorKind::LaunchUnavailable,
                                                 "neither bash.exe nor sh.exe is installed");
  }

  // `start` takes the first quoted argument as the window title.
  std::vector<std::string> args = {"/c", "start", spec.name, *shell, spec.command.program};
  args.insert(args.end(), spec.command.args.begin(), spec.command.args.end());
  const process::CommandSpec command{.program = "cmd",
                                     .args = std::move(args),
                                     .cwd = spec.command.cwd,
                                     .output = process::OutputMode::Discard};
  const auto rc = runner_.run(command);
  if (!rc.ok()) {
    return common::Result<LaunchHandle>::failure(common::ErrorKind::LaunchUnavailable, rc.error());
  }
  if (rc.value() != 0) {
    return common::Result<LaunchHandle>::failure(
        common::ErrorKind::LaunchUnavailable,
        "console window " + spec.name + " failed with code " + std::to_string(rc.value()));
  }
  return common::Result<LaunchHandle>::success(
      LaunchHandle{.strategy = LaunchStrategy::WindowsConsole, .pid = 0, .session = spec.name});
}

bool WindowsConsoleLauncher::is_running(const LaunchHandle &handle) {
  if (handle.session.empty()) {
    return false;
  }
  const process::CommandSpec command{.program = "tasklist",
                                     .args = {"/NH", "/FI", title_filter(handle.session)},
                                     .cwd = std::nullopt,
                                     .output = process::OutputMode::Inherit};
  const auto listed = runner_.capture(command);
  if (!listed.ok()) {
    return false;
  }
  // No match prints a single "INFO: No tasks ..." line.
  const auto text = common::trim(listed.value());
  return !text.empty() && !common::starts_with(text, "INFO:");
}

common::Status WindowsConsoleLauncher::stop(const LaunchHandle &handle) {
  const process::CommandSpec command{
      .program = "taskkill",
      .args = {"/FI", title_filter(handle.session), "/T", "/F"},
      .cwd = std::nullopt,
      .output = process::OutputMode::Discard};
  const auto rc = runner_.run(command);
  if (!rc.ok()) {
    return rc.status();
  }
  return common::Status::success();
}

} // namespace nexus::launch
