#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<nexus::tests::TestCase> &tests);
void register_config_tests(std::vector<nexus::tests::TestCase> &tests);
void register_process_tests(std::vector<nexus::tests::TestCase> &tests);
void register_pid_file_tests(std::vector<nexus::tests::TestCase> &tests);
void register_launch_tests(std::vector<nexus::tests::TestCase> &tests);
void register_heartbeat_tests(std::vector<nexus::tests::TestCase> &tests);
void register_monitor_tests(std::vector<nexus::tests::TestCase> &tests);
void register_setup_tests(std::vector<nexus::tests::TestCase> &tests);
void register_daemon_tests(std::vector<nexus::tests::TestCase> &tests);
void register_cli_tests(std::vector<nexus::tests::TestCase> &tests);
void register_observability_health_doctor_tests(std::vector<nexus::tests::TestCase> &tests);
void register_supervision_integration_tests(std::vector<nexus::tests::TestCase> &tests);

int main() {
#ifndef _WIN32
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);
#endif

  std::vector<nexus::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_process_tests(tests);
  register_pid_file_tests(tests);
  register_launch_tests(tests);
  register_heartbeat_tests(tests);
  register_monitor_tests(tests);
  register_setup_tests(tests);
  register_daemon_tests(tests);
  register_cli_tests(tests);
  register_observability_health_doctor_tests(tests);
  register_supervision_integration_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}
