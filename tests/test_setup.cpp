#include "test_framework.hpp"

#include "nexus/collab/collaborators.hpp"
#include "nexus/common/fs.hpp"
#include "nexus/setup/dependencies.hpp"
#include "nexus/setup/orchestrator.hpp"
#include "nexus/setup/prompt.hpp"
#include "nexus/setup/scaffold.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <sstream>

namespace {

namespace pr = nexus::process;
using nexus::testing::FakeCollaborators;
using nexus::testing::FakeProbe;
using nexus::testing::FakeProcessTable;
using nexus::testing::FakeRunner;

struct SetupRig {
  nexus::testing::TempWorkspace workspace;
  nexus::config::Config config = nexus::testing::temp_config(workspace);
  std::shared_ptr<FakeProcessTable> table = std::make_shared<FakeProcessTable>();
  nexus::daemon::PidFileStore store{workspace.path() / "run", table};
  FakeCollaborators collaborators;
  FakeRunner runner;
  FakeProbe probe;
  pr::Platform platform;
  std::ostringstream out;
  std::istringstream in;
  nexus::setup::StreamPrompter prompter{in, out};
  nexus::monitor::MonitorSupervisor monitors;
  nexus::heartbeat::HeartbeatScheduler heartbeat{store, collaborators, std::chrono::seconds(10)};

  explicit SetupRig(FakeProbe tools, const pr::Platform platform_ = pr::Platform::Linux,
                    const std::string &input = "")
      : probe(std::move(tools)), platform(platform_), in(input),
        monitors(nexus::monitor::options_from_config(config.monitor), store, collaborators, runner,
                 *table, probe, platform, out) {}

  nexus::setup::SetupOrchestrator orchestrator() {
    return nexus::setup::SetupOrchestrator(
        config, nexus::setup::SetupContext{.probe = probe,
                                           .platform = platform,
                                           .collaborators = collaborators,
                                           .monitors = monitors,
                                           .heartbeat = heartbeat,
                                           .prompter = prompter,
                                           .out = out});
  }

  [[nodiscard]] bool printed(const std::string &text) const {
    return out.str().find(text) != std::string::npos;
  }
};

nexus::setup::SetupOptions agent1_options() {
  nexus::setup::SetupOptions options;
  options.id = "agent1";
  options.kind = "llm";
  options.description = "helper";
  options.non_interactive = true;
  return options;
}

} // namespace

void register_setup_tests(std::vector<nexus::tests::TestCase> &tests) {
  using nexus::tests::require;
  namespace st = nexus::setup;
  namespace cb = nexus::collab;
  using nexus::common::ErrorKind;

  tests.push_back({"setup_required_dependencies_per_platform", [] {
                     const FakeProbe none;
                     auto linux_missing = st::missing_dependencies(pr::Platform::Linux, none);
                     require(linux_missing.size() == 2 && linux_missing[0].tool == "jq" &&
                                 linux_missing[1].package == "inotify-tools",
                             "linux needs jq and inotify-tools");
                     auto mac_missing = st::missing_dependencies(pr::Platform::MacOS, none);
                     require(mac_missing.size() == 2 && mac_missing[1].tool == "fswatch",
                             "macos needs fswatch");
                     require(st::missing_dependencies(pr::Platform::OtherUnix, none).size() == 1,
                             "other unix needs jq only");

                     const FakeProbe jq_exe{"jq.exe"};
                     require(st::missing_dependencies(pr::Platform::Windows, jq_exe).empty(),
                             "jq.exe satisfies jq on Windows");
                     const FakeProbe linux_ok{"jq", "inotifywait"};
                     require(st::missing_dependencies(pr::Platform::Linux, linux_ok).empty(),
                             "nothing missing");
                   }});

  tests.push_back({"setup_install_hints_follow_package_manager", [] {
                     const auto missing =
                         st::missing_dependencies(pr::Platform::Linux, FakeProbe{});
                     auto apt = st::install_hints(pr::Platform::Linux, FakeProbe{"apt-get"}, missing);
                     require(apt.size() == 1 &&
                                 apt[0] == "Install with: sudo apt-get update && sudo apt-get "
                                           "install -y jq inotify-tools",
                             "apt hint mismatch");
                     auto yum = st::install_hints(pr::Platform::Linux, FakeProbe{"yum"}, missing);
                     require(yum[0] == "Install with: sudo yum install -y jq inotify-tools",
                             "yum hint mismatch");
                     auto manual = st::install_hints(pr::Platform::Linux, FakeProbe{}, missing);
                     require(manual.size() == 3 &&
                                 nexus::common::starts_with(manual[0], "Unsupported Linux distribution"),
                             "manual hint mismatch");

                     const auto mac_missing =
                         st::missing_dependencies(pr::Platform::MacOS, FakeProbe{});
                     auto brew = st::install_hints(pr::Platform::MacOS, FakeProbe{"brew"}, mac_missing);
                     require(brew[0] == "Install with: brew install jq fswatch", "brew hint mismatch");
                     auto no_brew = st::install_hints(pr::Platform::MacOS, FakeProbe{}, mac_missing);
                     require(nexus::common::starts_with(no_brew[0], "Homebrew not found"),
                             "missing brew hint mismatch");

                     const auto win_missing =
                         st::missing_dependencies(pr::Platform::Windows, FakeProbe{});
                     auto choco =
                         st::install_hints(pr::Platform::Windows, FakeProbe{"choco"}, win_missing);
                     require(choco[0] == "Install with: choco install -y jq", "choco hint mismatch");
                     auto no_choco = st::install_hints(pr::Platform::Windows, FakeProbe{}, win_missing);
                     require(nexus::common::starts_with(no_choco[0], "Chocolatey not found"),
                             "missing choco hint mismatch");

                     require(st::install_hints(pr::Platform::Linux, FakeProbe{"apt-get"}, {}).empty(),
                             "nothing missing means no hints");
                   }});

  tests.push_back({"setup_scaffold_never_overwrites", [] {
                     nexus::testing::TempWorkspace workspace;
                     auto dirs = st::create_workspace_dirs(workspace.path());
                     require(dirs.ok() && dirs.value().size() == 1, "logs/ should be created");
                     require(std::filesystem::is_directory(workspace.path() / "logs"),
                             "logs/ missing");
                     auto again = st::create_workspace_dirs(workspace.path());
                     require(again.ok() && again.value().empty(), "second run creates nothing");

                     workspace.create_file("communication.md", "existing conversation\n");
                     auto files = st::initialize_files(workspace.path());
                     require(files.ok(), files.error());
                     require(files.value().size() == 3, "three seed files expected");
                     require(workspace.read("communication.md") == "existing conversation\n",
                             "existing files must not be touched");
                     require(workspace.read("agent_status.json") == "[]", "status seed mismatch");
                     require(workspace.read("archive.md") == "# Archived Communications\n",
                             "archive seed mismatch");
                     require(workspace.read("events.log").empty(), "event log starts empty");

                     auto rerun = st::initialize_files(workspace.path());
                     require(rerun.ok() && rerun.value().empty(), "rerun seeds nothing");
                   }});

  tests.push_back({"setup_scripts_become_executable", [] {
                     nexus::testing::TempWorkspace workspace;
                     workspace.create_file("scripts/watch_events.sh", "#!/bin/sh\n");
                     workspace.create_file("scripts/agent_status.sh", "#!/bin/sh\n");
                     workspace.create_file("scripts/README.txt", "docs");
                     const auto scripts = workspace.path() / "scripts";

                     auto changed = st::make_scripts_executable(scripts, pr::Platform::Linux);
                     require(changed.ok(), changed.error());
                     require(changed.value().size() == 2, "only *.sh files change");
                     require(changed.value()[0].filename() == "agent_status.sh",
                             "result should be sorted");
                     const auto perms = std::filesystem::status(scripts / "watch_events.sh").permissions();
                     require((perms & std::filesystem::perms::owner_exec) !=
                                 std::filesystem::perms::none,
                             "owner exec bit should be set");
                     const auto readme = std::filesystem::status(scripts / "README.txt").permissions();
                     require((readme & std::filesystem::perms::owner_exec) ==
                                 std::filesystem::perms::none,
                             "non-scripts keep their mode");

                     auto windows = st::make_scripts_executable(scripts, pr::Platform::Windows);
                     require(windows.ok() && windows.value().empty(), "Windows is a no-op");
                     auto absent =
                         st::make_scripts_executable(workspace.path() / "none", pr::Platform::Linux);
                     require(absent.ok() && absent.value().empty(), "missing dir is a no-op");
                   }});

  tests.push_back({"setup_stream_prompter_trims_and_detects_eof", [] {
                     std::istringstream in("  agent1 \n");
                     std::ostringstream out;
                     st::StreamPrompter prompter(in, out);
                     require(prompter.ask("Enter your agent ID (e.g., agent1): ") ==
                                 std::optional<std::string>("agent1"),
                             "answer should be trimmed");
                     require(out.str() == "Enter your agent ID (e.g., agent1): ",
                             "question should be printed");
                     require(!prompter.ask("again? ").has_value(), "EOF yields nothing");
                   }});

  tests.push_back({"setup_missing_dependencies_abort_before_side_effects", [] {
                     nexus::testing::ObserverCapture capture;
                     SetupRig rig(FakeProbe{"screen"});
                     auto orchestrator = rig.orchestrator();
                     auto result = orchestrator.run(agent1_options());
                     require(!result.ok(), "missing deps should fail setup");
                     require(result.kind() == ErrorKind::DependencyMissing, "kind mismatch");
                     require(rig.printed("Missing dependencies: jq, inotify-tools"),
                             "missing list should be printed");
                     require(rig.printed("Setup cannot continue without required dependencies."),
                             "abort message missing");
                     require(rig.runner.runs().empty() && rig.runner.spawned().empty(),
                             "no monitor should be launched");
                     require(rig.collaborators.calls().empty(), "no collaborator calls");
                     require(!rig.heartbeat.is_running(), "no heartbeat should start");
                     require(!std::filesystem::exists(rig.workspace.path() / "logs"),
                             "no scaffolding should happen");
                     require(capture.count<nexus::observability::ErrorEvent>() == 1,
                             "the abort should be recorded as an error");
                   }});

  tests.push_back({"setup_skip_deps_continues", [] {
                     SetupRig rig(FakeProbe{});
                     auto options = agent1_options();
                     options.skip_deps = true;
                     auto orchestrator = rig.orchestrator();
                     auto result = orchestrator.run(options);
                     require(result.ok(), result.error());
                     require(rig.printed("[1/5] Skipping dependency check."), "skip line missing");
                     rig.heartbeat.stop();
                   }});

  tests.push_back({"setup_full_run_orders_side_effects", [] {
                     SetupRig rig(FakeProbe{"jq", "inotifywait", "screen"});
                     auto orchestrator = rig.orchestrator();
                     auto result = orchestrator.run(agent1_options());
                     require(result.ok(), result.error());
                     require(result.value().id == "agent1" && result.value().kind == "llm",
                             "identity mismatch");

                     const auto calls = rig.collaborators.calls();
                     const std::vector<std::string> expected = {
                         "register agent1 llm helper",
                         "status agent1 active Starting up and ready for collaboration",
                         "message agent1 all llm agent 'agent1' has joined the collaboration.",
                         "snapshot"};
                     require(calls == expected, "collaborator call order mismatch");

                     require(rig.runner.count_runs("screen", "-dmS") == 2,
                             "watcher and poller sessions expected");
                     require(rig.heartbeat.is_running(), "heartbeat should run after setup");
                     require(rig.heartbeat.wait_for_ticks(1, std::chrono::milliseconds(2000)),
                             "heartbeat should tick");
                     require(rig.store.read("heartbeat_agent1") == pr::current_pid(),
                             "heartbeat record should name this process");

                     const auto text = rig.out.str();
                     std::size_t cursor = 0;
                     for (const std::string step :
                          {"[1/5] Checking dependencies...", "[2/5] Setting up directory structure...",
                           "[3/5] Initializing log files...", "[4/5] Making scripts executable...",
                           "[5/5] Configuring your agent...", "Monitoring strategy: screen",
                           "Starting automatic heartbeat...", "Setup complete!",
                           "=== Quick Reference Commands ==="}) {
                       const auto found = text.find(step, cursor);
                       require(found != std::string::npos, "missing or out of order: " + step);
                       cursor = found;
                     }
                     require(rig.printed("scripts/agent_status.sh status agent1 active"),
                             "quick reference should name the agent");
                     require(std::filesystem::exists(rig.workspace.path() / "communication.md"),
                             "seed files should exist");
                     rig.heartbeat.stop();
                   }});

  tests.push_back({"setup_interactive_prompts_for_identity", [] {
                     SetupRig rig(FakeProbe{"jq", "inotifywait"}, pr::Platform::Linux,
                                  "agent9\nresearch\nDigs up papers\n");
                     auto orchestrator = rig.orchestrator();
                     auto result = orchestrator.run(st::SetupOptions{});
                     require(result.ok(), result.error());
                     require(result.value().id == "agent9", "id from prompt mismatch");
                     require(result.value().description == "Digs up papers", "description mismatch");
                     require(rig.printed("Enter your agent ID (e.g., agent1): "), "id prompt missing");
                     require(rig.printed("Enter your agent type (e.g., llm, coding, research): "),
                             "type prompt missing");
                     require(rig.printed("Enter a brief agent description: "),
                             "description prompt missing");
                     rig.heartbeat.stop();
                   }});

  tests.push_back({"setup_invalid_identity_aborts_before_launch", [] {
                     nexus::testing::ObserverCapture capture;
                     SetupRig rig(FakeProbe{"jq", "inotifywait", "screen"});
                     auto options = agent1_options();
                     options.id = "../escape";
                     auto orchestrator = rig.orchestrator();
                     auto result = orchestrator.run(options);
                     require(!result.ok() && result.kind() == ErrorKind::InvalidIdentity,
                             "path-unsafe id should be rejected");
                     require(rig.runner.count_runs("screen", "-dmS") == 0, "no monitor launched");
                     require(rig.collaborators.calls().empty(), "nothing registered");
                     require(!rig.heartbeat.is_running(), "no heartbeat");
                     require(rig.store.list().empty(), "no records");
                     require(capture.count<nexus::observability::ErrorEvent>() == 1,
                             "the rejected identity should be recorded as an error");
                   }});

  tests.push_back({"setup_non_interactive_requires_id", [] {
                     SetupRig rig(FakeProbe{"jq", "inotifywait"}, pr::Platform::Linux, "agent5\n");
                     st::SetupOptions options;
                     options.non_interactive = true;
                     auto orchestrator = rig.orchestrator();
                     auto result = orchestrator.run(options);
                     require(!result.ok() && result.kind() == ErrorKind::InvalidIdentity,
                             "missing id should fail");
                     require(!rig.printed("Enter your agent ID"), "no prompt when non-interactive");
                   }});

  tests.push_back({"setup_prompt_eof_is_invalid_identity", [] {
                     SetupRig rig(FakeProbe{"jq", "inotifywait"}, pr::Platform::Linux, "agent5\n");
                     auto orchestrator = rig.orchestrator();
                     auto result = orchestrator.run(st::SetupOptions{});
                     require(!result.ok() && result.kind() == ErrorKind::InvalidIdentity,
                             "missing type should fail");
                     require(!rig.heartbeat.is_running(), "no heartbeat");
                   }});

  tests.push_back({"setup_collaborator_failures_are_warnings", [] {
                     SetupRig rig(FakeProbe{"jq", "inotifywait"});
                     rig.collaborators.fail_others = true;
                     auto orchestrator = rig.orchestrator();
                     auto result = orchestrator.run(agent1_options());
                     require(result.ok(), "collaborator failures must not fail setup");
                     require(rig.printed("Warning: register failed"), "register warning missing");
                     require(rig.printed("Warning: snapshot failed"), "snapshot warning missing");
                     require(rig.collaborators.calls().size() == 4, "every step is still attempted");
                     require(rig.heartbeat.is_running(), "heartbeat still starts");
                     require(rig.printed("Setup complete!"), "setup should complete");
                     rig.heartbeat.stop();
                   }});

  tests.push_back({"setup_quick_reference_uses_windows_shell", [] {
                     SetupRig rig(FakeProbe{"cmd", "sh.exe"}, pr::Platform::Windows);
                     const auto orchestrator = rig.orchestrator();
                     orchestrator.print_quick_reference("agent3");
                     require(rig.printed("sh.exe scripts/agent_status.sh list"),
                             "windows commands need the shell prefix");
                     require(rig.printed("nexus stop agent3"), "stop hint missing");
                   }});

  tests.push_back({"collab_script_commands_on_unix", [] {
                     FakeRunner runner;
                     cb::ScriptCollaborators scripts(runner, "scripts", pr::Platform::Linux);
                     require(scripts.register_agent({.id = "agent1", .kind = "llm", .description = "d"})
                                 .ok(),
                             "register failed");
                     require(scripts.report_heartbeat("agent1").ok(), "heartbeat failed");
                     require(scripts.send_message("agent1", "all", "hi").ok(), "message failed");

                     const auto runs = runner.runs();
                     require(runs[0].program == "./scripts/agent_status.sh", "program mismatch");
                     require(runs[0].args ==
                                 std::vector<std::string>{"register", "agent1", "llm", "d"},
                             "register args mismatch");
                     require(runs[1].args == std::vector<std::string>{"heartbeat", "agent1"} &&
                                 runs[1].output == pr::OutputMode::Discard,
                             "heartbeat output should be discarded");
                     require(runs[2].program == "./scripts/log_event.sh" &&
                                 runs[2].args == std::vector<std::string>{
                                                     "message", cb::message_payload("agent1", "all",
                                                                                    "hi")},
                             "message args mismatch");

                     cb::ScriptCollaborators absolute(runner, "/opt/nexus/scripts",
                                                      pr::Platform::Linux);
                     require(absolute.watch_events_command().program ==
                                 "/opt/nexus/scripts/watch_events.sh",
                             "absolute dirs are used as-is");
                   }});

  tests.push_back({"collab_script_failures_map_to_error_kinds", [] {
                     FakeRunner runner;
                     runner.set_exit_code("./scripts/agent_status.sh", 1);
                     cb::ScriptCollaborators scripts(runner, "scripts", pr::Platform::Linux);
                     auto heartbeat = scripts.report_heartbeat("agent1");
                     require(!heartbeat.ok() && heartbeat.kind() == ErrorKind::PeriodicTaskFailure,
                             "heartbeat failures are periodic task failures");
                     auto status = scripts.set_status("agent1", "active", "busy");
                     require(!status.ok() && status.kind() == ErrorKind::Io, "status failure is Io");
                     require(status.error() == "agent_status.sh exited with code 1",
                             "error text mismatch: " + status.error());

                     runner.set_unavailable("./scripts/generate_snapshot.sh");
                     require(!scripts.generate_snapshot().ok(), "exec failure is reported");
                   }});

  tests.push_back({"collab_script_commands_on_windows", [] {
                     FakeRunner runner;
                     cb::ScriptCollaborators scripts(runner, "scripts", pr::Platform::Windows,
                                                     std::string("sh.exe"));
                     const auto list = scripts.list_statuses_command();
                     require(list.program == "sh.exe", "shell should be the program");
                     require(list.args == std::vector<std::string>{"scripts/agent_status.sh", "list"},
                             "script path should be the first argument");
                   }});

  tests.push_back({"collab_message_payload_escapes", [] {
                     require(cb::message_payload("a", "all", "say \"hi\"\n") ==
                                 R"({"from":"a","to":"all","message":"say \"hi\"\n"})",
                             "payload mismatch: " + cb::message_payload("a", "all", "say \"hi\"\n"));
                   }});
}
