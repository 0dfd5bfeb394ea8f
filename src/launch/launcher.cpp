#include "nexus/launch/launcher.hpp"

namespace nexus::launch {

std::string_view strategy_name(const LaunchStrategy strategy) {
  switch (strategy) {
  case LaunchStrategy::Screen:
    return "screen";
  case LaunchStrategy::Tmux:
    return "tmux";
  case LaunchStrategy::BareBackground:
    return "background";
  case LaunchStrategy::WindowsConsole:
    return "windows_console";
  }
  return "unknown";
}

std::optional<LaunchStrategy> parse_strategy(const std::string_view name) {
  if (name == "screen") {
    return LaunchStrategy::Screen;
  }
  if (name == "tmux") {
    return LaunchStrategy::Tmux;
  }
  if (name == "background") {
    return LaunchStrategy::BareBackground;
  }
  if (name == "windows_console") {
    return LaunchStrategy::WindowsConsole;
  }
  return std::nullopt;
}

} // namespace nexus::launch
