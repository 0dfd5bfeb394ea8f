#pragma once

#include "nexus/common/result.hpp"
#include "nexus/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace nexus::config {

[[nodiscard]] std::filesystem::path config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);
[[nodiscard]] common::Status save_config(const Config &config);

/// Hard errors fail the result; soft issues come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

[[nodiscard]] std::filesystem::path resolve_dir(const Config &config, const std::string &dir);
[[nodiscard]] std::filesystem::path state_file_path(const Config &config);

} // namespace nexus::config
