#pragma once

#include "nexus/agent/identity.hpp"
#include "nexus/common/result.hpp"
#include "nexus/process/command_runner.hpp"
#include "nexus/process/tool_probe.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace nexus::collab {

class ICollaborators {
public:
  virtual ~ICollaborators() = default;

  [[nodiscard]] virtual common::Status report_heartbeat(const std::string &agent_id) = 0;
  [[nodiscard]] virtual common::Status register_agent(const agent::AgentIdentity &identity) = 0;
  [[nodiscard]] virtual common::Status set_status(const std::string &agent_id,
                                                  const std::string &state,
                                                  const std::string &note) = 0;
  [[nodiscard]] virtual common::Status send_message(const std::string &from,
                                                    const std::string &to,
                                                    const std::string &text) = 0;
  [[nodiscard]] virtual common::Status generate_snapshot() = 0;

  [[nodiscard]] virtual process::CommandSpec watch_events_command() const = 0;
  [[nodiscard]] virtual process::CommandSpec list_statuses_command() const = 0;
};

[[nodiscard]] std::string message_payload(const std::string &from, const std::string &to,
                                          const std::string &text);

class ScriptCollaborators final : public ICollaborators {
public:
  /// `windows_shell` is required on Windows (bash.exe or sh.exe) and unused elsewhere.
  ScriptCollaborators(process::ICommandRunner &runner, std::filesystem::path scripts_dir,
                      process::Platform platform,
                      std::optional<std::string> windows_shell = std::nullopt);

  [[nodiscard]] common::Status report_heartbeat(const std::string &agent_id) override;
  [[nodiscard]] common::Status register_agent(const agent::AgentIdentity &identity) override;
  [[nodiscard]] common::Status set_status(const std::string &agent_id, const std::string &state,
                                          const std::string &note) override;
  [[nodiscard]] common::Status send_message(const std::string &from, const std::string &to,
                                            const std::string &text) override;
  [[nodiscard]] common::Status generate_snapshot() override;

  [[nodiscard]] process::CommandSpec watch_events_command() const override;
  [[nodiscard]] process::CommandSpec list_statuses_command() const override;

  [[nodiscard]] process::CommandSpec script_command(const std::string &script,
                                                    std::vector<std::string> args) const;

private:
  [[nodiscard]] common::Status run_script(const std::string &script,
                                          std::vector<std::string> args,
                                          process::OutputMode output);

  process::ICommandRunner &runner_;
  std::filesystem::path scripts_dir_;
  process::Platform platform_;
  std::optional<std::string> windows_shell_;
};

} // namespace nexus::collab
