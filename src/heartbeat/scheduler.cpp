#include "nexus/heartbeat/scheduler.hpp"

#include "nexus/health/health.hpp"
#include "nexus/observability/global.hpp"
#include "nexus/process/process_table.hpp"

namespace nexus::heartbeat {

namespace {

constexpr const char *COMPONENT = "heartbeat";

} // namespace

HeartbeatScheduler::HeartbeatScheduler(daemon::PidFileStore &store,
                                       collab::ICollaborators &collaborators,
                                       const std::chrono::milliseconds interval)
    : store_(store), collaborators_(collaborators),
      interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1)) {}

HeartbeatScheduler::~HeartbeatScheduler() { stop(); }

common::Status HeartbeatScheduler::start(const std::string &agent_id) {
  if (agent_id.empty()) {
    return common::Status::error(common::ErrorKind::InvalidIdentity,
                                 "heartbeat needs an agent id");
  }
  const bool restarting = running_;
  stop();

  const std::string owner_key = daemon::heartbeat_owner_key(agent_id);
  auto lock = store_.lock(owner_key);
  if (!lock.ok()) {
    observability::record_warning(COMPONENT, lock.error());
  }

  // A record naming this process is only cleared, never signalled.
  const auto replaced = store_.terminate_and_clear(owner_key);
  if (auto written = store_.write(owner_key, process::current_pid()); !written.ok()) {
    observability::record_warning(COMPONENT, written.error());
  }

  {
    std::lock_guard<std::mutex> guard(mutex_);
    stop_requested_ = false;
    agent_id_ = agent_id;
  }
  ticks_ = 0;
  failures_ = 0;
  consecutive_failures_ = 0;
  health::mark_component_starting(COMPONENT);
  if (restarting || replaced.has_value()) {
    health::bump_component_restart(COMPONENT);
  }
  running_ = true;
  thread_ = std::thread([this, agent_id]() { run_loop(agent_id); });
  return common::Status::success();
}

void HeartbeatScheduler::stop() {
  {
    std::lock_guard<std::mutex> guard(mutex_);
    stop_requested_ = true;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  if (!running_.exchange(false)) {
    return;
  }

  const std::string owner_key = daemon::heartbeat_owner_key(agent_id());
  if (const auto pid = store_.read(owner_key); pid.has_value() && *pid == process::current_pid()) {
    if (auto removed = store_.remove(owner_key); !removed.ok()) {
      observability::record_warning(COMPONENT, removed.error());
    }
  }
  health::mark_component_stopped(COMPONENT);
}

bool HeartbeatScheduler::is_running() const { return running_; }

std::string HeartbeatScheduler::agent_id() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return agent_id_;
}

bool HeartbeatScheduler::wait_for_ticks(const std::uint64_t count,
                                        const std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> guard(mutex_);
  return ticked_.wait_for(guard, timeout, [this, count]() { return ticks_ >= count; });
}

void HeartbeatScheduler::run_loop(const std::string agent_id) {
  while (true) {
    tick(agent_id);
    std::unique_lock<std::mutex> guard(mutex_);
    if (wake_.wait_for(guard, interval_, [this]() { return stop_requested_; })) {
      return;
    }
  }
}

void HeartbeatScheduler::tick(const std::string &agent_id) {
  const auto started = std::chrono::steady_clock::now();
  common::Status status = common::Status::success();
  try {
    status = collaborators_.report_heartbeat(agent_id);
  } catch (const std::exception &ex) {
    status = common::Status::error(common::ErrorKind::PeriodicTaskFailure, ex.what());
  }
  const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (status.ok()) {
    consecutive_failures_ = 0;
    health::mark_component_ok(COMPONENT);
  } else {
    ++failures_;
    ++consecutive_failures_;
    health::mark_component_error(COMPONENT, status.error());
  }
  observability::record_heartbeat_tick(agent_id, status.ok());
  observability::record_metric(observability::HeartbeatLatencyMetric{.latency = latency});
  observability::record_metric(
      observability::ConsecutiveFailuresMetric{.count = consecutive_failures_});

  {
    std::lock_guard<std::mutex> guard(mutex_);
    ++ticks_;
  }
  ticked_.notify_all();
}

} // namespace nexus::heartbeat
