#pragma once

#include "nexus/launch/launcher.hpp"

namespace nexus::launch {

class TmuxLauncher final : public ILauncher {
public:
  explicit TmuxLauncher(process::ICommandRunner &runner);

  [[nodiscard]] LaunchStrategy strategy() const override { return LaunchStrategy::Tmux; }
  [[nodiscard]] common::Result<LaunchHandle> launch(const LaunchSpec &spec) override;
  [[nodiscard]] bool is_running(const LaunchHandle &handle) override;
  [[nodiscard]] common::Status stop(const LaunchHandle &handle) override;

private:
  process::ICommandRunner &runner_;
};

} // namespace nexus::launch
