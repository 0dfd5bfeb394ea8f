#pragma once

#include "nexus/launch/launcher.hpp"
#include "nexus/process/tool_probe.hpp"

#include <optional>

namespace nexus::launch {

[[nodiscard]] std::optional<std::string> windows_shell(const process::IToolProbe &probe);

class WindowsConsoleLauncher final : public ILauncher {
public:
  WindowsConsoleLauncher(process::ICommandRunner &runner, const process::IToolProbe &probe);

  [[nodiscard]] LaunchStrategy strategy() const override {
    return LaunchStrategy::WindowsConsole;
  }
  [[nodiscard]] common::Result<LaunchHandle> launch(const LaunchSpec &spec) override;
  [[nodiscard]] bool is_running(const LaunchHandle &handle) override;
  [[nodiscard]] common::Status stop(const LaunchHandle &handle) override;

private:
  process::ICommandRunner &runner_;
  const process::IToolProbe &probe_;
};

} // namespace nexus::launch
