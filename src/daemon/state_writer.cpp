#include "nexus/daemon/state_writer.hpp"

#include "nexus/common/fs.hpp"
#include "nexus/common/json_util.hpp"
#include "nexus/health/health.hpp"
#include "nexus/process/process_table.hpp"

#include <iostream>
#include <sstream>

namespace nexus::daemon {

StateWriter::StateWriter(std::filesystem::path state_file, std::string agent_id,
                         const std::chrono::milliseconds period)
    : state_file_(std::move(state_file)), agent_id_(std::move(agent_id)), period_(period) {}

StateWriter::~StateWriter() { stop(); }

void StateWriter::start() {
  if (running_) {
    return;
  }
  running_ = true;
  started_at_ = std::chrono::steady_clock::now();
  thread_ = std::thread([this]() { write_loop(); });
}

void StateWriter::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool StateWriter::is_running() const { return running_; }

void StateWriter::set_strategy(const std::string &strategy) {
  std::lock_guard<std::mutex> lock(mutex_);
  strategy_ = strategy;
}

void StateWriter::write_loop() {
  while (running_) {
    write_state();
    std::unique_lock<std::mutex> lock(mutex_);
    wake_.wait_for(lock, period_, [this]() { return !running_; });
  }
  write_state();
}

void StateWriter::write_state() const {
  const auto snapshot = health::snapshot();
  const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
                          std::chrono::steady_clock::now() - started_at_)
                          .count();
  std::string strategy;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    strategy = strategy_;
  }

  std::ostringstream json;
  json << "{";
  json << "\"written_at\":\"" << common::now_rfc3339() << "\",";
  json << "\"pid\":" << process::current_pid() << ",";
  json << "\"agent_id\":\"" << common::json_escape(agent_id_) << "\",";
  json << "\"strategy\":\"" << common::json_escape(strategy) << "\",";
  json << "\"uptime_seconds\":" << uptime << ",";
  json << "\"components\":{";
  bool first = true;
  for (const auto &[name, state] : snapshot.components) {
    if (!first) {
      json << ",";
    }
    first = false;
    json << "\"" << common::json_escape(name) << "\":{";
    json << "\"status\":\"" << state.status << "\",";
    json << "\"restart_count\":" << state.restart_count;
    if (state.last_ok.has_value()) {
      json << ",\"last_ok\":\"" << *state.last_ok << "\"";
    }
    if (state.last_error.has_value()) {
      json << ",\"last_error\":\"" << common::json_escape(*state.last_error) << "\"";
    }
    json << "}";
  }
  json << "}}";

  const auto written = common::write_file_atomic(state_file_, json.str());
  if (!written.ok()) {
    std::cerr << "[state] " << written.error() << "\n";
  }
}

} // namespace nexus::daemon
