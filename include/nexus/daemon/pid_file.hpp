#pragma once

#include "nexus/common/result.hpp"
#include "nexus/process/process_table.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nexus::daemon {

struct PidRecord {
  std::string owner_key;
  int pid = 0;
};

/// Injective file-name escaping: `[A-Za-z0-9_-]` pass through, every other
/// byte becomes `%XX`.
[[nodiscard]] std::string encode_owner_key(const std::string &owner_key);
[[nodiscard]] std::optional<std::string> decode_owner_key(const std::string &encoded);

[[nodiscard]] std::string heartbeat_owner_key(const std::string &agent_id);

class PidFileLock {
public:
  PidFileLock() = default;
  ~PidFileLock();

  PidFileLock(const PidFileLock &) = delete;
  PidFileLock &operator=(const PidFileLock &) = delete;
  PidFileLock(PidFileLock &&other) noexcept;
  PidFileLock &operator=(PidFileLock &&other) noexcept;

  [[nodiscard]] bool held() const { return handle_ >= 0; }
  void release();

private:
  friend class PidFileStore;
  explicit PidFileLock(std::intptr_t handle) : handle_(handle) {}

  std::intptr_t handle_ = -1;
};

class PidFileStore {
public:
  explicit PidFileStore(std::filesystem::path run_dir,
                        std::shared_ptr<process::IProcessTable> processes = nullptr);

  [[nodiscard]] common::Status write(const std::string &owner_key, int pid) const;
  [[nodiscard]] std::optional<int> read(const std::string &owner_key) const;
  [[nodiscard]] common::Status remove(const std::string &owner_key) const;

  /// Signals the recorded process (never pid <= 1 or the caller) and removes
  /// the record whatever its content. Returns the pid that was terminated.
  std::optional<int> terminate_and_clear(const std::string &owner_key) const;

  [[nodiscard]] std::vector<PidRecord> list() const;
  [[nodiscard]] common::Result<PidFileLock> lock(const std::string &owner_key) const;

  [[nodiscard]] std::filesystem::path path_for(const std::string &owner_key) const;
  [[nodiscard]] const std::filesystem::path &run_dir() const { return run_dir_; }

private:
  std::filesystem::path run_dir_;
  std::shared_ptr<process::IProcessTable> processes_;
};

} // namespace nexus::daemon
