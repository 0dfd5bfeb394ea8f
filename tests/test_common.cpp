#include "test_framework.hpp"

#include "nexus/agent/identity.hpp"
#include "nexus/common/fs.hpp"
#include "nexus/common/json_util.hpp"
#include "nexus/common/result.hpp"
#include "nexus/common/toml.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <string>

void register_common_tests(std::vector<nexus::tests::TestCase> &tests) {
  using nexus::tests::require;
  namespace common = nexus::common;
  namespace agent = nexus::agent;

  tests.push_back({"common_trim_split_join", [] {
                     require(common::trim("  hi \n") == "hi", "trim failed");
                     require(common::trim("   ").empty(), "blank trim should be empty");
                     const auto parts = common::split("a,b,,c", ',');
                     require(parts.size() == 4, "split should keep empty fields");
                     require(common::join({"x", "y", "z"}, ", ") == "x, y, z", "join mismatch");
                     require(common::starts_with("--config=a", "--config="), "prefix mismatch");
                     require(common::to_lower("SCREEN") == "screen", "to_lower mismatch");
                   }});

  tests.push_back({"common_shell_quote_only_when_needed", [] {
                     require(common::shell_quote("./scripts/watch_events.sh") ==
                                 "./scripts/watch_events.sh",
                             "plain path should stay bare");
                     require(common::shell_quote("two words") == "'two words'",
                             "space should force quoting");
                     require(common::shell_quote("it's") == "'it'\\''s'",
                             "single quote should be escaped");
                     require(common::shell_quote("") == "''", "empty should be quoted");
                   }});

  tests.push_back({"common_result_carries_error_kind", [] {
                     auto ok = common::Result<int>::success(7);
                     require(ok.ok() && ok.value() == 7, "success value mismatch");
                     require(ok.kind() == common::ErrorKind::None, "success kind should be None");

                     auto failed = common::Result<int>::failure(common::ErrorKind::LaunchUnavailable,
                                                                "no screen");
                     require(!failed.ok(), "failure should not be ok");
                     require(failed.kind() == common::ErrorKind::LaunchUnavailable,
                             "kind should survive");
                     require(failed.status().kind() == common::ErrorKind::LaunchUnavailable,
                             "status() should keep kind");

                     auto forwarded = common::Result<std::string>::failure(failed.status());
                     require(forwarded.kind() == common::ErrorKind::LaunchUnavailable &&
                                 forwarded.error() == "no screen",
                             "forwarding a status should keep kind and message");

                     bool threw = false;
                     try {
                       (void)failed.value();
                     } catch (const std::logic_error &) {
                       threw = true;
                     }
                     require(threw, "value() on failure should throw");

                     const auto status = common::Status::error(common::ErrorKind::None, "odd");
                     require(!status.ok(), "an error status is never ok");
                     require(common::error_kind_name(common::ErrorKind::DependencyMissing) ==
                                 "dependency_missing",
                             "kind name mismatch");
                   }});

  tests.push_back({"common_json_escape_and_lookup", [] {
                     const std::string escaped = common::json_escape("say \"hi\"\n\\");
                     require(escaped == "say \\\"hi\\\"\\n\\\\", "escape mismatch: " + escaped);

                     const std::string json =
                         R"({"agent_id":"a\"1","pid":4242,"components":{"heartbeat":{"status":"ok"}}})";
                     require(common::json_get_string(json, "agent_id") == "a\"1",
                             "string lookup mismatch");
                     require(common::json_get_number(json, "pid") == "4242", "number lookup mismatch");
                     const auto heartbeat = common::json_get_object(json, "heartbeat");
                     require(common::json_get_string(heartbeat, "status") == "ok",
                             "nested object lookup mismatch");
                     require(common::json_get_string(json, "missing").empty(),
                             "missing field should be empty");
                   }});

  tests.push_back({"common_toml_sections_and_errors", [] {
                     auto doc = common::parse_toml("run_dir = \"/tmp/x\" # comment\n"
                                                   "[monitor]\n"
                                                   "poll_interval_secs = 1_0\n"
                                                   "strategy = 'tmux'\n");
                     require(doc.ok(), doc.error());
                     require(doc.value().get_string("run_dir") == "/tmp/x", "string mismatch");
                     require(doc.value().get_int("monitor.poll_interval_secs", 0) == 10,
                             "int with separator mismatch");
                     require(doc.value().get_string("monitor.strategy") == "tmux",
                             "literal string mismatch");

                     auto bad = common::parse_toml("[monitor\nstrategy = \"x\"\n");
                     require(!bad.ok(), "broken header should fail");
                     require(bad.kind() == common::ErrorKind::Config, "toml errors are Config");
                     require(!common::parse_toml("no_equals_here\n").ok(), "missing '=' should fail");
                   }});

  tests.push_back({"common_write_file_atomic_replaces_content", [] {
                     nexus::testing::TempWorkspace workspace;
                     const auto target = workspace.path() / "nested" / "file.txt";
                     auto first = common::write_file_atomic(target, "one");
                     require(first.ok(), first.error());
                     auto second = common::write_file_atomic(target, "two");
                     require(second.ok(), second.error());

                     auto content = common::read_file(target);
                     require(content.ok() && content.value() == "two", "content should be replaced");
                     std::size_t entries = 0;
                     for (const auto &entry :
                          std::filesystem::directory_iterator(workspace.path() / "nested")) {
                       (void)entry;
                       ++entries;
                     }
                     require(entries == 1, "temp files should not linger");
                   }});

  tests.push_back({"common_read_file_missing_is_io_error", [] {
                     nexus::testing::TempWorkspace workspace;
                     auto content = common::read_file(workspace.path() / "absent.txt");
                     require(!content.ok(), "missing file should fail");
                     require(content.kind() == common::ErrorKind::Io, "missing file is Io");
                   }});

  tests.push_back({"common_expand_path_env", [] {
                     const nexus::testing::EnvGuard guard("NEXUS_TEST_EXPAND", "value");
                     require(common::expand_path("$NEXUS_TEST_EXPAND/x") == "value/x",
                             "bare env expansion failed");
                     require(common::expand_path("${NEXUS_TEST_EXPAND}-y") == "value-y",
                             "braced env expansion failed");
                   }});

  tests.push_back({"identity_accepts_plain_ids", [] {
                     auto identity = agent::make_identity("  agent-7.b_x ", " coding ", " helps ");
                     require(identity.ok(), identity.error());
                     require(identity.value().id == "agent-7.b_x", "id should be trimmed");
                     require(identity.value().kind == "coding", "kind should be trimmed");
                     require(identity.value().description == "helps",
                             "description should be trimmed");

                     auto no_description = agent::make_identity("agent1", "llm", "");
                     require(no_description.ok(), "description is optional");
                   }});

  tests.push_back({"identity_rejects_path_unsafe_ids", [] {
                     for (const std::string id :
                          {"", "../etc", "a/b", "a b", ".hidden", "a\\b", "x;rm", "tab\tid"}) {
                       auto identity = agent::make_identity(id, "llm", "");
                       require(!identity.ok(), "id should be rejected: '" + id + "'");
                       require(identity.kind() == nexus::common::ErrorKind::InvalidIdentity,
                               "rejection should be InvalidIdentity");
                     }
                     auto too_long = agent::make_identity(std::string(65, 'a'), "llm", "");
                     require(!too_long.ok(), "65-byte id should be rejected");
                     auto max_len = agent::make_identity(std::string(64, 'a'), "llm", "");
                     require(max_len.ok(), "64-byte id should pass");
                     auto no_kind = agent::make_identity("agent1", "  ", "");
                     require(!no_kind.ok(), "empty kind should be rejected");
                   }});
}
