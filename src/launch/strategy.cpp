#include "nexus/launch/strategy.hpp"

#include "nexus/launch/windows_console.hpp"

namespace nexus::launch {

common::Result<LaunchStrategy> select_strategy(const process::Platform platform,
                                               const process::IToolProbe &probe,
                                               const std::string_view preferred) {
  using StrategyResult = common::Result<LaunchStrategy>;

  if (platform == process::Platform::Windows) {
    if (!probe.has_tool("cmd")) {
      return StrategyResult::failure(common::ErrorKind::LaunchUnavailable,
                                     "cmd is not available to open a console window");
    }
    if (!windows_shell(probe).has_value()) {
      return StrategyResult::failure(common::ErrorKind::LaunchUnavailable,
                                     "neither bash.exe nor sh.exe is installed");
    }
    return StrategyResult::success(LaunchStrategy::WindowsConsole);
  }

  if (preferred == "screen" && probe.has_tool("screen")) {
    return StrategyResult::success(LaunchStrategy::Screen);
  }
  if (preferred == "tmux" && probe.has_tool("tmux")) {
    return StrategyResult::success(LaunchStrategy::Tmux);
  }
  if (preferred == "background") {
    return StrategyResult::success(LaunchStrategy::BareBackground);
  }

  if (probe.has_tool("screen")) {
    return StrategyResult::success(LaunchStrategy::Screen);
  }
  if (probe.has_tool("tmux")) {
    return StrategyResult::success(LaunchStrategy::Tmux);
  }
  return StrategyResult::success(LaunchStrategy::BareBackground);
}

} // namespace nexus::launch
