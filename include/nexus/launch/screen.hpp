#pragma once

#include "nexus/launch/launcher.hpp"

namespace nexus::launch {

class ScreenLauncher final : public ILauncher {
public:
  explicit ScreenLauncher(process::ICommandRunner &runner);

  [[nodiscard]] LaunchStrategy strategy() const override { return LaunchStrategy::Screen; }
  [[nodiscard]] common::Result<LaunchHandle> launch(const LaunchSpec &spec) override;
  [[nodiscard]] bool is_running(const LaunchHandle &handle) override;
  [[nodiscard]] common::Status stop(const LaunchHandle &handle) override;

private:
  process::ICommandRunner &runner_;
};

} // namespace nexus::launch
