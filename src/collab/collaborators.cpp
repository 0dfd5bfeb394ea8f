#include "nexus/collab/collaborators.hpp"

#include "nexus/common/json_util.hpp"

#include <iterator>

namespace nexus::collab {

namespace {

constexpr const char *STATUS_SCRIPT = "agent_status.sh";
constexpr const char *EVENT_SCRIPT = "log_event.sh";
constexpr const char *WATCH_SCRIPT = "watch_events.sh";
constexpr const char *SNAPSHOT_SCRIPT = "generate_snapshot.sh";

// Relative script paths need a directory component for execvp to skip PATH.
std::string runnable_path(const std::filesystem::path &script) {
  const std::string text = script.generic_string();
  if (script.is_absolute() || text.rfind("./", 0) == 0 || text.rfind("../", 0) == 0) {
    return text;
  }
  return "./" + text;
}

} // namespace

std::string message_payload(const std::string &from, const std::string &to,
                            const std::string &text) {
  return "{\"from\":\"" + common::json_escape(from) + "\",\"to\":\"" + common::json_escape(to) +
         "\",\"message\":\"" + common::json_escape(text) + "\"}";
}

ScriptCollaborators::ScriptCollaborators(process::ICommandRunner &runner,
                                         std::filesystem::path scripts_dir,
                                         const process::Platform platform,
                                         std::optional<std::string> windows_shell)
    : runner_(runner), scripts_dir_(std::move(scripts_dir)), platform_(platform),
      windows_shell_(std::move(windows_shell)) {}

process::CommandSpec ScriptCollaborators::script_command(const std::string &script,
                                                         std::vector<std::string> args) const {
  process::CommandSpec spec;
  if (platform_ == process::Platform::Windows) {
    spec.program = windows_shell_.value_or("bash.exe");
    spec.args.push_back((scripts_dir_ / script).generic_string());
  } else {
    spec.program = runnable_path(scripts_dir_ / script);
  }
  spec.args.insert(spec.args.end(), std::make_move_iterator(args.begin()),
                   std::make_move_iterator(args.end()));
  return spec;
}

common::Status ScriptCollaborators::run_script(const std::string &script,
                                               std::vector<std::string> args,
                                               const process::OutputMode output) {
  auto spec = script_command(script, std::move(args));
  spec.output = output;
  const auto rc = runner_.run(spec);
  if (!rc.ok()) {
    return rc.status();
  }
  if (rc.value() != 0) {
    return common::Status::error(common::ErrorKind::Io,
                                 script + " exited with code " + std::to_string(rc.value()));
  }
  return common::Status::success();
}

common::Status ScriptCollaborators::report_heartbeat(const std::string &agent_id) {
  auto status = run_script(STATUS_SCRIPT, {"heartbeat", agent_id}, process::OutputMode::Discard);
  if (!status.ok()) {
    return common::Status::error(common::ErrorKind::PeriodicTaskFailure, status.error());
  }
  return status;
}

common::Status ScriptCollaborators::register_agent(const agent::AgentIdentity &identity) {
  return run_script(STATUS_SCRIPT, {"register", identity.id, identity.kind, identity.description},
                    process::OutputMode::Inherit);
}

common::Status ScriptCollaborators::set_status(const std::string &agent_id,
                                               const std::string &state,
                                               const std::string &note) {
  return run_script(STATUS_SCRIPT, {"status", agent_id, state, note},
                    process::OutputMode::Inherit);
}

common::Status ScriptCollaborators::send_message(const std::string &from, const std::string &to,
                                                 const std::string &text) {
  return run_script(EVENT_SCRIPT, {"message", message_payload(from, to, text)},
                    process::OutputMode::Inherit);
}

common::Status ScriptCollaborators::generate_snapshot() {
  return run_script(SNAPSHOT_SCRIPT, {}, process::OutputMode::Inherit);
}

process::CommandSpec ScriptCollaborators::watch_events_command() const {
  return script_command(WATCH_SCRIPT, {});
}

process::CommandSpec ScriptCollaborators::list_statuses_command() const {
  return script_command(STATUS_SCRIPT, {"list"});
}

} // namespace nexus::collab
