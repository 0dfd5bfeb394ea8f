#pragma once

#include "nexus/process/tool_probe.hpp"

#include <string>
#include <vector>

namespace nexus::setup {

struct Dependency {
  std::string tool;
  std::string package;
};

[[nodiscard]] std::vector<Dependency> required_dependencies(process::Platform platform);
[[nodiscard]] std::vector<Dependency> missing_dependencies(process::Platform platform,
                                                           const process::IToolProbe &probe);

[[nodiscard]] std::vector<std::string> install_hints(process::Platform platform,
                                                     const process::IToolProbe &probe,
                                                     const std::vector<Dependency> &missing);

} // namespace nexus::setup
