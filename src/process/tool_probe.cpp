#include "nexus/process/tool_probe.hpp"

#include "nexus/common/fs.hpp"

#include <cstdlib>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace nexus::process {

namespace {

#ifdef _WIN32
constexpr char PATH_SEPARATOR = ';';
#else
constexpr char PATH_SEPARATOR = ':';
#endif

bool is_executable_file(const std::filesystem::path &candidate) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(candidate, ec) || ec) {
    return false;
  }
#ifdef _WIN32
  return true;
#else
  return access(candidate.c_str(), X_OK) == 0;
#endif
}

} // namespace

Platform current_platform() {
#if defined(_WIN32)
  return Platform::Windows;
#elif defined(__APPLE__)
  return Platform::MacOS;
#elif defined(__linux__)
  return Platform::Linux;
#else
  return Platform::OtherUnix;
#endif
}

std::string_view platform_name(const Platform platform) {
  switch (platform) {
  case Platform::Linux:
    return "linux";
  case Platform::MacOS:
    return "macos";
  case Platform::Windows:
    return "windows";
  case Platform::OtherUnix:
    return "unix";
  }
  return "unknown";
}

std::optional<std::filesystem::path> find_executable(const std::string &name,
                                                     const std::string &path_env) {
  if (name.empty()) {
    return std::nullopt;
  }
  if (name.find('/') != std::string::npos) {
    if (is_executable_file(name)) {
      return std::filesystem::path(name);
    }
    return std::nullopt;
  }

  for (const auto &dir : common::split(path_env, PATH_SEPARATOR)) {
    if (dir.empty()) {
      continue;
    }
    const auto candidate = std::filesystem::path(dir) / name;
    if (is_executable_file(candidate)) {
      return candidate;
    }
#ifdef _WIN32
    for (const char *ext : {".exe", ".cmd", ".bat"}) {
      auto with_ext = candidate;
      with_ext += ext;
      if (is_executable_file(with_ext)) {
        return with_ext;
      }
    }
#endif
  }
  return std::nullopt;
}

PathToolProbe::PathToolProbe(std::string path_env) : path_env_(std::move(path_env)) {}

bool PathToolProbe::has_tool(const std::string &name) const {
  if (path_env_.has_value()) {
    return find_executable(name, *path_env_).has_value();
  }
  const char *path_raw = std::getenv("PATH");
  if (path_raw == nullptr || *path_raw == '\0') {
    return false;
  }
  return find_executable(name, path_raw).has_value();
}

} // namespace nexus::process
