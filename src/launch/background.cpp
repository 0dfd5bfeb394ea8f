#include "nexus/launch/background.hpp"

namespace nexus::launch {

BackgroundLauncher::BackgroundLauncher(process::ICommandRunner &runner,
                                       process::IProcessTable &processes)
    : runner_(runner), processes_(processes) {}

common::Result<LaunchHandle> BackgroundLauncher::launch(const LaunchSpec &spec) {
  auto command = spec.command;
  command.output = process::OutputMode::Discard;
  const auto pid = runner_.spawn_detached(command);
  if (!pid.ok()) {
    return common::Result<LaunchHandle>::failure(common::ErrorKind::LaunchUnavailable,
                                                 spec.name + ": " + pid.error());
  }
  return common::Result<LaunchHandle>::success(LaunchHandle{
      .strategy = LaunchStrategy::BareBackground, .pid = pid.value(), .session = spec.name});
}

bool BackgroundLauncher::is_running(const LaunchHandle &handle) {
  return handle.pid > 0 && processes_.is_alive(handle.pid);
}

common::Status BackgroundLauncher::stop(const LaunchHandle &handle) {
  if (handle.pid <= 0) {
    return common::Status::success();
  }
  return processes_.terminate(handle.pid);
}

} // namespace nexus::launch
