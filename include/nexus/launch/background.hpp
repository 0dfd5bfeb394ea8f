#pragma once

#include "nexus/launch/launcher.hpp"
#include "nexus/process/process_table.hpp"

namespace nexus::launch {

class BackgroundLauncher final : public ILauncher {
public:
  BackgroundLauncher(process::ICommandRunner &runner, process::IProcessTable &processes);

  [[nodiscard]] LaunchStrategy strategy() const override {
    return LaunchStrategy::BareBackground;
  }
  [[nodiscard]] common::Result<LaunchHandle> launch(const LaunchSpec &spec) override;
  [[nodiscard]] bool is_running(const LaunchHandle &handle) override;
  [[nodiscard]] common::Status stop(const LaunchHandle &handle) override;

private:
  process::ICommandRunner &runner_;
  process::IProcessTable &processes_;
};

} // namespace nexus::launch
