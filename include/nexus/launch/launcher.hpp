#pragma once

#include "nexus/common/result.hpp"
#include "nexus/process/command_runner.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace nexus::launch {

enum class LaunchStrategy {
  Screen,
  Tmux,
  BareBackground,
  WindowsConsole,
};

[[nodiscard]] std::string_view strategy_name(LaunchStrategy strategy);
[[nodiscard]] std::optional<LaunchStrategy> parse_strategy(std::string_view name);
[[nodiscard]] constexpr bool is_multiplexer(const LaunchStrategy strategy) {
  return strategy == LaunchStrategy::Screen || strategy == LaunchStrategy::Tmux;
}

struct LaunchSpec {
  std::string name;
  process::CommandSpec command;
};

/// `pid` is set for bare background launches, `session` for everything else.
struct LaunchHandle {
  LaunchStrategy strategy = LaunchStrategy::BareBackground;
  int pid = 0;
  std::string session;
};

class ILauncher {
public:
  virtual ~ILauncher() = default;

  [[nodiscard]] virtual LaunchStrategy strategy() const = 0;
  [[nodiscard]] virtual common::Result<LaunchHandle> launch(const LaunchSpec &spec) = 0;
  [[nodiscard]] virtual bool is_running(const LaunchHandle &handle) = 0;
  [[nodiscard]] virtual common::Status stop(const LaunchHandle &handle) = 0;
};

} // namespace nexus::launch
