#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>

namespace nexus::daemon {

class StateWriter {
public:
  StateWriter(std::filesystem::path state_file, std::string agent_id,
              std::chrono::milliseconds period = std::chrono::seconds(5));
  ~StateWriter();

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;

  void set_strategy(const std::string &strategy);
  void write_state() const;

private:
  void write_loop();

  std::filesystem::path state_file_;
  std::string agent_id_;
  std::chrono::milliseconds period_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  mutable std::mutex mutex_;
  std::condition_variable wake_;
  std::string strategy_;
  std::chrono::steady_clock::time_point started_at_{std::chrono::steady_clock::now()};
};

} // namespace nexus::daemon
