#include "nexus/launch/tmux.hpp"

namespace nexus::launch {

namespace {

process::CommandSpec tmux_command(std::vector<std::string> args) {
  return process::CommandSpec{.program = "tmux",
                              .args = std::move(args),
                              .cwd = std::nullopt,
                              .output = process::OutputMode::Discard};
}

} // namespace

TmuxLauncher::TmuxLauncher(process::ICommandRunner &runner) : runner_(runner) {}

common::Result<LaunchHandle> TmuxLauncher::launch(const LaunchSpec &spec) {
  // tmux hands the command to a shell, so it travels as one quoted string.
  std::vector<std::string> args = {"new-session", "-d", "-s", spec.name};
  if (spec.command.cwd.has_value()) {
    args.push_back("-c");
    args.push_back(spec.command.cwd->string());
  }
  args.push_back(process::describe(spec.command));

  auto command = tmux_command(std::move(args));
  command.cwd = spec.command.cwd;
  const auto rc = runner_.run(command);
  if (!rc.ok()) {
    return common::Result<LaunchHandle>::failure(common::ErrorKind::LaunchUnavailable, rc.error());
  }
  if (rc.value() != 0) {
    return common::Result<LaunchHandle>::failure(
        common::ErrorKind::LaunchUnavailable,
        "tmux session " + spec.name + " exited with code " + std::to_string(rc.value()));
  }
  return common::Result<LaunchHandle>::success(
      LaunchHandle{.strategy = LaunchStrategy::Tmux, .pid = 0, .session = spec.name});
}

bool TmuxLauncher::is_running(const LaunchHandle &handle) {
  if (handle.session.empty()) {
    return false;
  }
  const auto rc = runner_.run(tmux_command({"has-session", "-t", handle.session}));
  return rc.ok() && rc.value() == 0;
}

common::Status TmuxLauncher::stop(const LaunchHandle &handle) {
  const auto rc = runner_.run(tmux_command({"kill-session", "-t", handle.session}));
  if (!rc.ok()) {
    return rc.status();
  }
  if (rc.value() != 0) {
    return common::Status::error(common::ErrorKind::SignalDeliveryFailed,
                                 "no tmux session named " + handle.session);
  }
  return common::Status::success();
}

} // namespace nexus::launch
