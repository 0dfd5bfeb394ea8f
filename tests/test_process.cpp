#include "test_framework.hpp"

#include "nexus/process/command_runner.hpp"
#include "nexus/process/process_table.hpp"
#include "nexus/process/tool_probe.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <random>
#include <string>
#include <thread>

namespace {

std::string unique_signature() {
  static std::mt19937_64 rng{std::random_device{}()};
  return "nexus-sig-" + std::to_string(rng());
}

// A shell that loops until SIGTERM; `signature` is its $0 so it shows in the command line.
nexus::process::CommandSpec looping_shell(const std::string &signature) {
  return nexus::process::CommandSpec{
      .program = "sh",
      .args = {"-c", "trap 'exit 0' TERM; while :; do sleep 1; done", signature},
      .cwd = std::nullopt,
      .output = nexus::process::OutputMode::Discard};
}

} // namespace

void register_process_tests(std::vector<nexus::tests::TestCase> &tests) {
  using nexus::tests::require;
  namespace pr = nexus::process;
  using namespace std::chrono_literals;

  tests.push_back({"process_run_reports_exit_code", [] {
                     pr::SystemCommandRunner runner;
                     auto rc = runner.run({.program = "sh",
                                           .args = {"-c", "exit 3"},
                                           .cwd = std::nullopt,
                                           .output = pr::OutputMode::Discard});
                     require(rc.ok(), rc.error());
                     require(rc.value() == 3, "exit code should be 3, got " +
                                                  std::to_string(rc.value()));
                   }});

  tests.push_back({"process_run_missing_program_is_error", [] {
                     pr::SystemCommandRunner runner;
                     auto rc = runner.run({.program = "nexus-definitely-not-installed",
                                           .args = {},
                                           .cwd = std::nullopt,
                                           .output = pr::OutputMode::Discard});
                     require(!rc.ok(), "exec failure should be an error, not an exit code");
                     require(rc.error().find("nexus-definitely-not-installed") != std::string::npos,
                             "error should name the program");
                   }});

  tests.push_back({"process_run_honours_cwd", [] {
                     nexus::testing::TempWorkspace workspace;
                     pr::SystemCommandRunner runner;
                     auto rc = runner.run({.program = "sh",
                                           .args = {"-c", "echo here > marker.txt"},
                                           .cwd = workspace.path(),
                                           .output = pr::OutputMode::Discard});
                     require(rc.ok() && rc.value() == 0, "command should succeed");
                     require(workspace.read("marker.txt") == "here\n",
                             "command should run inside cwd");
                   }});

  tests.push_back({"process_describe_quotes_arguments", [] {
                     const pr::CommandSpec spec{.program = "./scripts/agent_status.sh",
                                                .args = {"status", "agent1", "active",
                                                         "Working on it"},
                                                .cwd = std::nullopt,
                                                .output = pr::OutputMode::Inherit};
                     require(pr::describe(spec) ==
                                 "./scripts/agent_status.sh status agent1 active 'Working on it'",
                             "describe mismatch: " + pr::describe(spec));
                   }});

  tests.push_back({"process_spawn_detached_outlives_and_terminates", [] {
                     pr::SystemCommandRunner runner;
                     pr::SystemProcessTable table(500ms);
                     const auto signature = unique_signature();

                     auto pid = runner.spawn_detached(looping_shell(signature));
                     require(pid.ok(), pid.error());
                     require(pid.value() > 1, "pid should be positive");
                     require(table.is_alive(pid.value()), "detached process should be alive");

                     const bool found = nexus::testing::wait_until(
                         [&] {
                           const auto matches = table.find_by_signature(signature);
                           return matches.size() == 1 && matches.front() == pid.value();
                         },
                         2000ms);
                     require(found, "signature scan should find the detached process");

                     auto terminated = table.terminate(pid.value());
                     require(terminated.ok(), terminated.error());
                     require(nexus::testing::wait_until(
                                 [&] { return table.find_by_signature(signature).empty(); }, 3000ms),
                             "terminated process should disappear from the scan");
                   }});

  tests.push_back({"process_spawn_detached_missing_program_fails", [] {
                     pr::SystemCommandRunner runner;
                     auto pid = runner.spawn_detached({.program = "nexus-definitely-not-installed",
                                                       .args = {},
                                                       .cwd = std::nullopt,
                                                       .output = pr::OutputMode::Discard});
                     require(!pid.ok(), "exec failure should surface from the detached child");
                   }});

  tests.push_back({"process_terminate_never_sends_sigkill", [] {
                     // Ignores SIGTERM; a later SIGKILL would be the only way it dies.
                     const int pid = nexus::testing::spawn_child(
                         {"sh", "-c", "trap '' TERM; while :; do sleep 1; done"});
                     require(pid > 0, "spawn failed");
                     std::this_thread::sleep_for(100ms);
                     auto status = pr::terminate_and_wait(pid, 300ms);
                     const bool alive = pr::is_process_alive(pid);
                     nexus::testing::kill_child(pid);
                     require(!status.ok(), "a survivor should be reported");
                     require(status.kind() == nexus::common::ErrorKind::SignalDeliveryFailed,
                             "survivor kind mismatch");
                     require(alive, "SIGTERM-immune process must be left running");
                   }});

  tests.push_back({"process_terminate_refuses_init_and_self", [] {
                     for (const int pid : {0, 1, -4, pr::current_pid()}) {
                       auto status = pr::terminate_and_wait(pid, 10ms);
                       require(!status.ok(), "pid " + std::to_string(pid) + " must not be signalled");
                       require(status.kind() == nexus::common::ErrorKind::SignalDeliveryFailed,
                               "refusal kind mismatch");
                     }
                   }});

  tests.push_back({"process_terminate_missing_pid_is_success", [] {
                     auto status = pr::terminate_and_wait(2147483000, 10ms);
                     require(status.ok(), "a pid that does not exist counts as terminated");
                   }});

  tests.push_back({"process_liveness_probe", [] {
                     require(pr::is_process_alive(pr::current_pid()), "self should be alive");
                     require(!pr::is_process_alive(0), "pid 0 is never alive");
                     require(!pr::is_process_alive(-1), "negative pid is never alive");
                     require(!pr::is_process_alive(2147483000), "unused pid should not be alive");
                   }});

  tests.push_back({"process_signature_scan_excludes_self_and_blank", [] {
                     pr::SystemProcessTable table;
                     require(table.find_by_signature("").empty(), "blank signature matches nothing");
                     require(table.find_by_signature("   ").empty(),
                             "whitespace signature matches nothing");
                     for (const int pid : table.find_by_signature(unique_signature())) {
                       require(pid != pr::current_pid(), "scan must never report the caller");
                     }
                   }});

  tests.push_back({"tool_probe_searches_given_path", [] {
                     nexus::testing::TempWorkspace workspace;
                     workspace.create_script("bin/screen", "#!/bin/sh\nexit 0\n");
                     workspace.create_file("bin/tmux", "not executable");

                     const pr::PathToolProbe probe("/nonexistent:" +
                                                   (workspace.path() / "bin").string());
                     require(probe.has_tool("screen"), "executable on PATH should be found");
                     require(!probe.has_tool("tmux"), "non-executable file should not count");
                     require(!probe.has_tool("jq"), "absent tool should not be found");
                     require(!probe.has_tool(""), "empty name should not be found");

                     auto found = pr::find_executable("screen", (workspace.path() / "bin").string());
                     require(found.has_value() && found->filename() == "screen",
                             "find_executable should return the path");
                   }});

  tests.push_back({"tool_probe_platform_names", [] {
                     require(pr::platform_name(pr::Platform::Linux) == "linux", "linux name");
                     require(pr::platform_name(pr::Platform::MacOS) == "macos", "macos name");
                     require(pr::platform_name(pr::Platform::Windows) == "windows", "windows name");
                     require(pr::is_unix(pr::Platform::OtherUnix), "other unix is unix");
                     require(!pr::is_unix(pr::Platform::Windows), "windows is not unix");
#ifdef __linux__
                     require(pr::current_platform() == pr::Platform::Linux, "should detect linux");
#endif
                   }});
}
