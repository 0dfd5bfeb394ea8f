#pragma once

#include "nexus/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace nexus::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char delimiter);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &sep);
[[nodiscard]] std::string shell_quote(const std::string &value);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

[[nodiscard]] std::string now_rfc3339();

} // namespace nexus::common
