#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace nexus::process {

enum class Platform {
  Linux,
  MacOS,
  Windows,
  OtherUnix,
};

[[nodiscard]] Platform current_platform();
[[nodiscard]] std::string_view platform_name(Platform platform);
[[nodiscard]] constexpr bool is_unix(const Platform platform) {
  return platform != Platform::Windows;
}

[[nodiscard]] std::optional<std::filesystem::path> find_executable(const std::string &name,
                                                                   const std::string &path_env);

class IToolProbe {
public:
  virtual ~IToolProbe() = default;
  [[nodiscard]] virtual bool has_tool(const std::string &name) const = 0;
};

class PathToolProbe final : public IToolProbe {
public:
  PathToolProbe() = default;
  explicit PathToolProbe(std::string path_env);

  [[nodiscard]] bool has_tool(const std::string &name) const override;

private:
  std::optional<std::string> path_env_;
};

} // namespace nexus::process
