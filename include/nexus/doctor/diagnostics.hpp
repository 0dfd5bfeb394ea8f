#pragma once

#include "nexus/config/schema.hpp"
#include "nexus/process/process_table.hpp"
#include "nexus/process/tool_probe.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace nexus::doctor {

enum class CheckStatus {
  Pass,
  Fail,
  Warn,
};

struct DiagnosticCheck {
  std::string name;
  CheckStatus status = CheckStatus::Pass;
  std::string message;
};

struct DiagnosticsReport {
  std::vector<DiagnosticCheck> checks;
  int passed = 0;
  int failed = 0;
  int warnings = 0;
};

[[nodiscard]] DiagnosticsReport run_diagnostics(const config::Config &config,
                                                const process::IToolProbe &probe,
                                                process::IProcessTable &processes,
                                                process::Platform platform);
void print_diagnostics_report(const DiagnosticsReport &report, std::ostream &out);

} // namespace nexus::doctor
