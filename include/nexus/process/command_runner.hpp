#pragma once

#include "nexus/common/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace nexus::process {

enum class OutputMode {
  Inherit,
  Discard,
};

struct CommandSpec {
  std::string program;
  std::vector<std::string> args;
  std::optional<std::filesystem::path> cwd;
  OutputMode output = OutputMode::Inherit;
};

[[nodiscard]] std::string describe(const CommandSpec &spec);

class ICommandRunner {
public:
  virtual ~ICommandRunner() = default;

  /// Runs to completion. The value is the exit code (128 + signal when killed);
  /// a program that cannot be executed is an error.
  [[nodiscard]] virtual common::Result<int> run(const CommandSpec &spec) = 0;

  /// Starts a process that outlives the caller: own session, stdio on the
  /// null device. The value is the new process id.
  [[nodiscard]] virtual common::Result<int> spawn_detached(const CommandSpec &spec) = 0;
  /// Runs to completion and returns stdout. A non-zero exit is an error.
  [[nodiscard]] virtual common::Result<std::string> capture(const CommandSpec &spec) = 0;
};

class SystemCommandRunner final : public ICommandRunner {
public:
  [[nodiscard]] common::Result<int> run(const CommandSpec &spec) override;
  [[nodiscard]] common::Result<int> spawn_detached(const CommandSpec &spec) override;
  [[nodiscard]] common::Result<std::string> capture(const CommandSpec &spec) override;
};

} // namespace nexus::process
