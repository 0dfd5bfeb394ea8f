#pragma once

#include "nexus/common/result.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace nexus::process {

[[nodiscard]] int current_pid();

[[nodiscard]] bool is_process_alive(int pid);

/// SIGTERM, then wait up to `grace`. A survivor is SignalDeliveryFailed; a missing pid is success.
[[nodiscard]] common::Status terminate_and_wait(int pid, std::chrono::milliseconds grace);

class IProcessTable {
public:
  virtual ~IProcessTable() = default;

  [[nodiscard]] virtual std::vector<int> find_by_signature(const std::string &signature) = 0;
  [[nodiscard]] virtual bool is_alive(int pid) = 0;
  [[nodiscard]] virtual common::Status terminate(int pid) = 0;
};

class SystemProcessTable final : public IProcessTable {
public:
  explicit SystemProcessTable(std::chrono::milliseconds grace = std::chrono::milliseconds(1000));

  [[nodiscard]] std::vector<int> find_by_signature(const std::string &signature) override;
  [[nodiscard]] bool is_alive(int pid) override;
  [[nodiscard]] common::Status terminate(int pid) override;

private:
  std::chrono::milliseconds grace_;
};

} // namespace nexus::process
