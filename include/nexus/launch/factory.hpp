#pragma once

#include "nexus/launch/launcher.hpp"
#include "nexus/process/process_table.hpp"
#include "nexus/process/tool_probe.hpp"

#include <memory>

namespace nexus::launch {

struct LaunchContext {
  process::ICommandRunner &runner;
  process::IProcessTable &processes;
  const process::IToolProbe &probe;
};

[[nodiscard]] std::unique_ptr<ILauncher> create_launcher(LaunchStrategy strategy,
                                                         const LaunchContext &context);

} // namespace nexus::launch
