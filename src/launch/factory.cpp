#include "nexus/launch/factory.hpp"

#include "nexus/launch/background.hpp"
#include "nexus/launch/screen.hpp"
#include "nexus/launch/tmux.hpp"
#include "nexus/launch/windows_console.hpp"

namespace nexus::launch {

std::unique_ptr<ILauncher> create_launcher(const LaunchStrategy strategy,
                                           const LaunchContext &context) {
  switch (strategy) {
  case LaunchStrategy::Screen:
    return std::make_unique<ScreenLauncher>(context.runner);
  case LaunchStrategy::Tmux:
    return std::make_unique<TmuxLauncher>(context.runner);
  case LaunchStrategy::WindowsConsole:
    return std::make_unique<WindowsConsoleLauncher>(context.runner, context.probe);
  case LaunchStrategy::BareBackground:
    break;
  }
  return std::make_unique<BackgroundLauncher>(context.runner, context.processes);
}

} // namespace nexus::launch
