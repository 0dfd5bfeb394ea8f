#include "nexus/launch/screen.hpp"

namespace nexus::launch {

namespace {

process::CommandSpec screen_command(std::vector<std::string> args) {
  return process::CommandSpec{.program = "screen",
                              .args = std::move(args),
                              .cwd = std::nullopt,
                              .output = process::OutputMode::Discard};
}

} // namespace

ScreenLauncher::ScreenLauncher(process::ICommandRunner &runner) : runner_(runner) {}

common::Result<LaunchHandle> ScreenLauncher::launch(const LaunchSpec &spec) {
  std::vector<std::string> args = {"-dmS", spec.name, spec.command.program};
  args.insert(args.end(), spec.command.args.begin(), spec.command.args.end());
  auto command = screen_command(std::move(args));
  command.cwd = spec.command.cwd;

  const auto rc = runner_.run(command);
  if (!rc.ok()) {
    return common::Result<LaunchHandle>::failure(common::ErrorKind::LaunchUnavailable, rc.error());
  }
  if (rc.value() != 0) {
    return common::Result<LaunchHandle>::failure(
        common::ErrorKind::LaunchUnavailable,
        "screen session " + spec.name + " exited with code " + std::to_string(rc.value()));
  }
  return common::Result<LaunchHandle>::success(
      LaunchHandle{.strategy = LaunchStrategy::Screen, .pid = 0, .session = spec.name});
}

bool ScreenLauncher::is_running(const LaunchHandle &handle) {
  if (handle.session.empty()) {
    return false;
  }
  const auto rc = runner_.run(screen_command({"-S", handle.session, "-Q", "select", "."}));
  return rc.ok() && rc.value() == 0;
}

common::Status ScreenLauncher::stop(const LaunchHandle &handle) {
  const auto rc = runner_.run(screen_command({"-S", handle.session, "-X", "quit"}));
  if (!rc.ok()) {
    return rc.status();
  }
  if (rc.value() != 0) {
    return common::Status::error(common::ErrorKind::SignalDeliveryFailed,
                                 "no screen session named " + handle.session);
  }
  return common::Status::success();
}

} // namespace nexus::launch
