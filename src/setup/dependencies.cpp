#include "nexus/setup/dependencies.hpp"

#include "nexus/common/fs.hpp"

namespace nexus::setup {

namespace {

std::string package_list(const std::vector<Dependency> &missing) {
  std::vector<std::string> packages;
  packages.reserve(missing.size());
  for (const auto &dep : missing) {
    packages.push_back(dep.package);
  }
  return common::join(packages, " ");
}

void append_manual(std::vector<std::string> &lines, const std::vector<Dependency> &missing) {
  for (const auto &dep : missing) {
    lines.push_back("  - " + dep.package + " (provides " + dep.tool + ")");
  }
}

} // namespace

std::vector<Dependency> required_dependencies(const process::Platform platform) {
  std::vector<Dependency> deps = {{.tool = "jq", .package = "jq"}};
  if (platform == process::Platform::Linux) {
    deps.push_back({.tool = "inotifywait", .package = "inotify-tools"});
  } else if (platform == process::Platform::MacOS) {
    deps.push_back({.tool = "fswatch", .package = "fswatch"});
  }
  return deps;
}

std::vector<Dependency> missing_dependencies(const process::Platform platform,
                                             const process::IToolProbe &probe) {
  std::vector<Dependency> missing;
  for (auto &dep : required_dependencies(platform)) {
    const bool found = probe.has_tool(dep.tool) ||
                       (platform == process::Platform::Windows && probe.has_tool(dep.tool + ".exe"));
    if (!found) {
      missing.push_back(std::move(dep));
    }
  }
  return missing;
}

std::vector<std::string> install_hints(const process::Platform platform,
                                       const process::IToolProbe &probe,
                                       const std::vector<Dependency> &missing) {
  std::vector<std::string> lines;
  if (missing.empty()) {
    return lines;
  }

  switch (platform) {
  case process::Platform::Linux:
  case process::Platform::OtherUnix:
    if (probe.has_tool("apt-get")) {
      lines.push_back("Install with: sudo apt-get update && sudo apt-get install -y " +
                      package_list(missing));
    } else if (probe.has_tool("yum")) {
      lines.push_back("Install with: sudo yum install -y " + package_list(missing));
    } else {
      lines.push_back("Unsupported Linux distribution. Please install dependencies manually:");
      append_manual(lines, missing);
    }
    break;
  case process::Platform::MacOS:
    if (probe.has_tool("brew")) {
      lines.push_back("Install with: brew install " + package_list(missing));
    } else {
      lines.push_back("Homebrew not found. Please install it first:");
      lines.push_back("  /bin/bash -c \"$(curl -fsSL "
                      "https://raw.githubusercontent.com/Homebrew/install/HEAD/install.sh)\"");
      append_manual(lines, missing);
    }
    break;
  case process::Platform::Windows:
    if (probe.has_tool("choco")) {
      lines.push_back("Install with: choco install -y " + package_list(missing));
    } else {
      lines.push_back("Chocolatey not found. Please install it first:");
      lines.push_back("  https://chocolatey.org/install");
      lines.push_back("Or install these dependencies manually:");
      lines.push_back("  - jq: https://stedolan.github.io/jq/download/");
    }
    break;
  }
  return lines;
}

} // namespace nexus::setup
