#include "nexus/setup/orchestrator.hpp"

#include "nexus/common/fs.hpp"
#include "nexus/config/config.hpp"
#include "nexus/launch/windows_console.hpp"
#include "nexus/observability/global.hpp"
#include "nexus/setup/dependencies.hpp"
#include "nexus/setup/scaffold.hpp"

#include <ostream>

namespace nexus::setup {

namespace {

constexpr const char *COMPONENT = "setup";

std::optional<std::string> answer(IPrompter &prompter, const std::optional<std::string> &given,
                                  const std::string &question, const bool interactive) {
  if (given.has_value()) {
    return given;
  }
  if (!interactive) {
    return std::nullopt;
  }
  return prompter.ask(question);
}

} // namespace

SetupOrchestrator::SetupOrchestrator(const config::Config &config, SetupContext context)
    : config_(config), context_(context) {}

void SetupOrchestrator::warn_if_failed(const std::string &step, const common::Status &status) {
  if (status.ok()) {
    return;
  }
  context_.out << "Warning: " << step << " failed: " << status.error() << "\n";
  observability::record_warning(COMPONENT, step + ": " + status.error());
}

std::string SetupOrchestrator::command_prefix() const {
  if (context_.platform != process::Platform::Windows) {
    return "";
  }
  return launch::windows_shell(context_.probe).value_or("sh.exe") + " ";
}

common::Status SetupOrchestrator::check_dependencies() {
  auto &out = context_.out;
  out << "[1/5] Checking dependencies...\n";
  const auto missing = missing_dependencies(context_.platform, context_.probe);
  if (missing.empty()) {
    out << "All dependencies are installed.\n";
    return common::Status::success();
  }

  std::vector<std::string> names;
  for (const auto &dep : missing) {
    names.push_back(dep.package);
  }
  out << "Missing dependencies: " << common::join(names, ", ") << "\n";
  for (const auto &line : install_hints(context_.platform, context_.probe, missing)) {
    out << line << "\n";
  }
  out << "\nSetup cannot continue without required dependencies.\n";
  out << "Please install them manually and run this command again.\n";
  return common::Status::error(common::ErrorKind::DependencyMissing,
                               "missing dependencies: " + common::join(names, ", "));
}

common::Status SetupOrchestrator::scaffold() {
  auto &out = context_.out;
  const auto workspace = config::resolve_dir(config_, ".");

  out << "[2/5] Setting up directory structure...\n";
  auto dirs = create_workspace_dirs(workspace);
  if (!dirs.ok()) {
    return dirs.status();
  }
  out << "Directory structure set up.\n";

  out << "[3/5] Initializing log files...\n";
  auto files = initialize_files(workspace);
  if (!files.ok()) {
    return files.status();
  }
  out << "Log files initialized (" << files.value().size() << " created).\n";

  out << "[4/5] Making scripts executable...\n";
  auto scripts =
      make_scripts_executable(config::resolve_dir(config_, config_.scripts_dir), context_.platform);
  if (!scripts.ok()) {
    return scripts.status();
  }
  out << "Scripts are now executable.\n";
  return common::Status::success();
}

common::Result<agent::AgentIdentity>
SetupOrchestrator::configure_agent(const SetupOptions &options) {
  context_.out << "[5/5] Configuring your agent...\n";
  const bool interactive = !options.non_interactive;
  auto &prompter = context_.prompter;

  const auto id = answer(prompter, options.id, "Enter your agent ID (e.g., agent1): ", interactive);
  if (!id.has_value()) {
    return common::Result<agent::AgentIdentity>::failure(
        common::ErrorKind::InvalidIdentity, "an agent id is required (--id)");
  }
  const auto kind = answer(prompter, options.kind,
                           "Enter your agent type (e.g., llm, coding, research): ", interactive);
  if (!kind.has_value()) {
    return common::Result<agent::AgentIdentity>::failure(
        common::ErrorKind::InvalidIdentity, "an agent type is required (--kind)");
  }
  const auto description =
      answer(prompter, options.description, "Enter a brief agent description: ", interactive);

  return agent::make_identity(*id, *kind, description.value_or(""));
}

common::Result<agent::AgentIdentity> SetupOrchestrator::run(const SetupOptions &options) {
  auto &out = context_.out;
  out << "Multi-Agent Nexus setup\n";
  out << "Detected operating system: " << process::platform_name(context_.platform) << "\n\n";

  if (options.skip_deps) {
    out << "[1/5] Skipping dependency check.\n";
  } else if (auto deps = check_dependencies(); !deps.ok()) {
    observability::record_error(COMPONENT, deps.error());
    return common::Result<agent::AgentIdentity>::failure(deps);
  }

  warn_if_failed("scaffolding", scaffold());

  auto identity = configure_agent(options);
  if (!identity.ok()) {
    out << "Invalid agent identity: " << identity.error() << "\n";
    observability::record_error(COMPONENT, identity.error());
    return identity;
  }
  const auto &agent = identity.value();

  out << "\nStarting system services...\n";
  (void)context_.monitors.run();

  auto &collaborators = context_.collaborators;
  warn_if_failed("register", collaborators.register_agent(agent));
  warn_if_failed("status", collaborators.set_status(agent.id, "active", STARTUP_NOTE));

  out << "Starting automatic heartbeat...\n";
  warn_if_failed("heartbeat", context_.heartbeat.start(agent.id));

  warn_if_failed("announce",
                 collaborators.send_message(agent.id, "all",
                                            agent.kind + " agent '" + agent.id +
                                                "' has joined the collaboration."));
  warn_if_failed("snapshot", collaborators.generate_snapshot());

  out << "\nSetup complete!\n";
  out << "Your agent ID: " << agent.id << " is registered and active.\n";
  out << "Event monitoring is running in the background.\n";
  out << "You can now begin collaborating with other agents.\n";
  print_quick_reference(agent.id);
  out << "You're all set! Happy collaborating!\n";
  return identity;
}

void SetupOrchestrator::print_quick_reference(const std::string &agent_id) const {
  auto &out = context_.out;
  const std::string prefix = command_prefix();
  out << "\n=== Quick Reference Commands ===\n";
  out << "  Send message:      " << prefix << "scripts/log_event.sh message '"
      << collab::message_payload(agent_id, "all", "Hello") << "'\n";
  out << "  Make proposal:     " << prefix << "scripts/log_event.sh proposal '{\"from\":\""
      << agent_id << "\",\"component\":\"X\",\"description\":\"Y\"}'\n";
  out << "  Update status:     " << prefix << "scripts/agent_status.sh status " << agent_id
      << " active \"Working on task X\"\n";
  out << "  View messages:     cat communication.md\n";
  out << "  List agents:       " << prefix << "scripts/agent_status.sh list\n";
  out << "  Generate snapshot: " << prefix << "scripts/generate_snapshot.sh\n";
  out << "  Stop heartbeat:    nexus stop " << agent_id << "\n\n";
}

} // namespace nexus::setup
