#pragma once

#include "nexus/agent/identity.hpp"
#include "nexus/collab/collaborators.hpp"
#include "nexus/common/result.hpp"
#include "nexus/config/schema.hpp"
#include "nexus/heartbeat/scheduler.hpp"
#include "nexus/monitor/supervisor.hpp"
#include "nexus/process/tool_probe.hpp"
#include "nexus/setup/prompt.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace nexus::setup {

struct SetupOptions {
  std::optional<std::string> id;
  std::optional<std::string> kind;
  std::optional<std::string> description;
  bool non_interactive = false;
  bool skip_deps = false;
};

struct SetupContext {
  const process::IToolProbe &probe;
  process::Platform platform;
  collab::ICollaborators &collaborators;
  monitor::MonitorSupervisor &monitors;
  heartbeat::HeartbeatScheduler &heartbeat;
  IPrompter &prompter;
  std::ostream &out;
};

inline constexpr const char *STARTUP_NOTE = "Starting up and ready for collaboration";

/// The five-step bring-up followed by monitor launch, registration, heartbeat
/// start, announcement and snapshot. Only a missing dependency or an invalid
/// identity fails the run; collaborator failures are warnings.
class SetupOrchestrator {
public:
  SetupOrchestrator(const config::Config &config, SetupContext context);

  [[nodiscard]] common::Result<agent::AgentIdentity> run(const SetupOptions &options);

  [[nodiscard]] common::Status check_dependencies();
  [[nodiscard]] common::Status scaffold();
  [[nodiscard]] common::Result<agent::AgentIdentity> configure_agent(const SetupOptions &options);
  void print_quick_reference(const std::string &agent_id) const;

private:
  void warn_if_failed(const std::string &step, const common::Status &status);
  [[nodiscard]] std::string command_prefix() const;

  const config::Config &config_;
  SetupContext context_;
};

} // namespace nexus::setup
