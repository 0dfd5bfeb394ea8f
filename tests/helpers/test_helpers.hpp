#pragma once

#include "nexus/collab/collaborators.hpp"
#include "nexus/config/schema.hpp"
#include "nexus/observability/observer.hpp"
#include "nexus/process/command_runner.hpp"
#include "nexus/process/process_table.hpp"
#include "nexus/process/tool_probe.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace nexus::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;
  /// Like create_file, then chmod 0755.
  void create_script(const std::string &name, const std::string &content) const;
  [[nodiscard]] std::string read(const std::string &name) const;

private:
  std::filesystem::path path_;
};

/// Config rooted at the workspace with the observer silenced.
config::Config temp_config(const TempWorkspace &workspace);

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();
};

/// Records every command; exit codes are scripted per "program" or "program arg0".
class FakeRunner final : public process::ICommandRunner {
public:
  [[nodiscard]] common::Result<int> run(const process::CommandSpec &spec) override;
  [[nodiscard]] common::Result<int> spawn_detached(const process::CommandSpec &spec) override;
  [[nodiscard]] common::Result<std::string> capture(const process::CommandSpec &spec) override;

  void set_exit_code(const std::string &key, int code);
  void set_output(const std::string &key, const std::string &output);
  void set_unavailable(const std::string &program);

  [[nodiscard]] std::vector<process::CommandSpec> runs() const;
  [[nodiscard]] std::vector<process::CommandSpec> spawned() const;
  [[nodiscard]] std::size_t count_runs(const std::string &program,
                                       const std::string &first_arg = "") const;

  int next_pid = 40000;

private:
  mutable std::mutex mutex_;
  std::vector<process::CommandSpec> runs_;
  std::vector<process::CommandSpec> spawned_;
  std::map<std::string, int> exit_codes_;
  std::map<std::string, std::string> outputs_;
  std::set<std::string> unavailable_;
};

class FakeProbe final : public process::IToolProbe {
public:
  FakeProbe() = default;
  FakeProbe(std::initializer_list<std::string> tools) : tools_(tools) {}

  [[nodiscard]] bool has_tool(const std::string &name) const override {
    return tools_.contains(name);
  }
  void add(const std::string &tool) { tools_.insert(tool); }

private:
  std::set<std::string> tools_;
};

class FakeProcessTable final : public process::IProcessTable {
public:
  [[nodiscard]] std::vector<int> find_by_signature(const std::string &signature) override;
  [[nodiscard]] bool is_alive(int pid) override;
  [[nodiscard]] common::Status terminate(int pid) override;

  void add_process(int pid, std::string cmdline);
  void fail_terminate(int pid) { refuse_.insert(pid); }
  [[nodiscard]] std::vector<int> terminated() const;

private:
  mutable std::mutex mutex_;
  std::map<int, std::string> processes_;
  std::set<int> refuse_;
  std::vector<int> terminated_;
};

class FakeCollaborators final : public collab::ICollaborators {
public:
  [[nodiscard]] common::Status report_heartbeat(const std::string &agent_id) override;
  [[nodiscard]] common::Status register_agent(const agent::AgentIdentity &identity) override;
  [[nodiscard]] common::Status set_status(const std::string &agent_id, const std::string &state,
                                          const std::string &note) override;
  [[nodiscard]] common::Status send_message(const std::string &from, const std::string &to,
                                            const std::string &text) override;
  [[nodiscard]] common::Status generate_snapshot() override;

  [[nodiscard]] process::CommandSpec watch_events_command() const override;
  [[nodiscard]] process::CommandSpec list_statuses_command() const override;

  [[nodiscard]] std::vector<std::string> calls() const;
  [[nodiscard]] std::size_t heartbeat_count() const { return heartbeats_; }

  std::atomic<bool> fail_heartbeat{false};
  std::atomic<bool> throw_heartbeat{false};
  std::atomic<bool> fail_others{false};
  std::string watch_program = "./scripts/watch_events.sh";

private:
  common::Status record(std::string call);

  mutable std::mutex mutex_;
  std::vector<std::string> calls_;
  std::atomic<std::size_t> heartbeats_{0};
};

/// Events captured from the global observer while the capture is alive.
class ObserverCapture {
public:
  ObserverCapture();
  ~ObserverCapture();

  ObserverCapture(const ObserverCapture &) = delete;
  ObserverCapture &operator=(const ObserverCapture &) = delete;

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::size_t metrics() const;
  template <typename T> [[nodiscard]] std::size_t count() const {
    std::size_t n = 0;
    for (const auto &event : events()) {
      if (std::holds_alternative<T>(event)) {
        ++n;
      }
    }
    return n;
  }

  struct State {
    std::mutex mutex;
    std::vector<observability::ObserverEvent> events;
    std::size_t metrics = 0;
  };

private:
  std::shared_ptr<State> state_;
};

/// Forks `argv` as a child of the test process. Returns the pid or -1.
int spawn_child(const std::vector<std::string> &argv);
/// Waits for a child started by spawn_child; true when it exited or died.
bool reap_child(int pid, std::chrono::milliseconds timeout);
void kill_child(int pid);

/// Polls `predicate` every 20 ms until it holds or `timeout` passes.
bool wait_until(const std::function<bool()> &predicate, std::chrono::milliseconds timeout);

} // namespace nexus::testing
