#pragma once

#include "nexus/common/result.hpp"
#include "nexus/process/tool_probe.hpp"

#include <filesystem>
#include <vector>

namespace nexus::setup {

[[nodiscard]] common::Result<std::vector<std::filesystem::path>>
create_workspace_dirs(const std::filesystem::path &workspace);

[[nodiscard]] common::Result<std::vector<std::filesystem::path>>
initialize_files(const std::filesystem::path &workspace);

[[nodiscard]] common::Result<std::vector<std::filesystem::path>>
make_scripts_executable(const std::filesystem::path &scripts_dir, process::Platform platform);

} // namespace nexus::setup
