#pragma once

#include "nexus/collab/collaborators.hpp"
#include "nexus/common/result.hpp"
#include "nexus/daemon/pid_file.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace nexus::heartbeat {

/// Reports liveness for one agent on a fixed interval from a background
/// thread. A failed report is counted and retried on the next tick; nothing
/// stops the loop except stop() or process exit.
class HeartbeatScheduler {
public:
  HeartbeatScheduler(daemon::PidFileStore &store, collab::ICollaborators &collaborators,
                     std::chrono::milliseconds interval = std::chrono::seconds(60));
  ~HeartbeatScheduler();

  HeartbeatScheduler(const HeartbeatScheduler &) = delete;
  HeartbeatScheduler &operator=(const HeartbeatScheduler &) = delete;

  /// Replaces any heartbeat already recorded for `agent_id`, in this process
  /// or another, then records this process as the host and starts ticking.
  [[nodiscard]] common::Status start(const std::string &agent_id);
  void stop();

  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::string agent_id() const;
  [[nodiscard]] std::chrono::milliseconds interval() const { return interval_; }

  [[nodiscard]] std::uint64_t ticks() const { return ticks_; }
  [[nodiscard]] std::uint64_t failures() const { return failures_; }
  [[nodiscard]] std::uint64_t consecutive_failures() const { return consecutive_failures_; }

  [[nodiscard]] bool wait_for_ticks(std::uint64_t count, std::chrono::milliseconds timeout) const;

private:
  void run_loop(std::string agent_id);
  void tick(const std::string &agent_id);

  daemon::PidFileStore &store_;
  collab::ICollaborators &collaborators_;
  std::chrono::milliseconds interval_;

  mutable std::mutex mutex_;
  std::condition_variable wake_;
  mutable std::condition_variable ticked_;
  bool stop_requested_ = false;
  std::string agent_id_;
  std::thread thread_;
  std::atomic<bool> running_{false};

  std::atomic<std::uint64_t> ticks_{0};
  std::atomic<std::uint64_t> failures_{0};
  std::atomic<std::uint64_t> consecutive_failures_{0};
};

} // namespace nexus::heartbeat
