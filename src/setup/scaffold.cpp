#include "nexus/setup/scaffold.hpp"

#include "nexus/common/fs.hpp"

#include <algorithm>
#include <fstream>

namespace nexus::setup {

namespace {

struct SeedFile {
  const char *name;
  const char *content;
};

constexpr SeedFile SEED_FILES[] = {
    {"events.log", ""},
    {"agent_status.json", "[]"},
    {"communication.md", "# Communication Log\n"},
    {"archive.md", "# Archived Communications\n"},
};

} // namespace

common::Result<std::vector<std::filesystem::path>>
create_workspace_dirs(const std::filesystem::path &workspace) {
  using PathsResult = common::Result<std::vector<std::filesystem::path>>;
  std::vector<std::filesystem::path> created;
  const auto logs = workspace / "logs";
  std::error_code ec;
  const bool existed = std::filesystem::is_directory(logs, ec);
  auto ensured = common::ensure_dir(logs);
  if (!ensured.ok()) {
    return PathsResult::failure(ensured.status());
  }
  if (!existed) {
    created.push_back(logs);
  }
  return PathsResult::success(std::move(created));
}

common::Result<std::vector<std::filesystem::path>>
initialize_files(const std::filesystem::path &workspace) {
  using PathsResult = common::Result<std::vector<std::filesystem::path>>;
  std::vector<std::filesystem::path> created;
  for (const auto &seed : SEED_FILES) {
    const auto path = workspace / seed.name;
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
      continue;
    }
    std::ofstream out(path, std::ios::binary);
    if (!out) {
      return PathsResult::failure(common::ErrorKind::Io, "Unable to create " + path.string());
    }
    out << seed.content;
    if (!out) {
      return PathsResult::failure(common::ErrorKind::Io, "Unable to write " + path.string());
    }
    created.push_back(path);
  }
  return PathsResult::success(std::move(created));
}

common::Result<std::vector<std::filesystem::path>>
make_scripts_executable(const std::filesystem::path &scripts_dir,
                        const process::Platform platform) {
  using PathsResult = common::Result<std::vector<std::filesystem::path>>;
  std::vector<std::filesystem::path> changed;
  std::error_code ec;
  if (!process::is_unix(platform) || !std::filesystem::is_directory(scripts_dir, ec)) {
    return PathsResult::success(std::move(changed));
  }

  for (std::filesystem::directory_iterator it(scripts_dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::error_code file_ec;
    if (it->path().extension() != ".sh" || !it->is_regular_file(file_ec)) {
      continue;
    }
    using std::filesystem::perms;
    std::filesystem::permissions(it->path(),
                                 perms::owner_all | perms::group_read | perms::group_exec |
                                     perms::others_read | perms::others_exec,
                                 std::filesystem::perm_options::replace, file_ec);
    if (file_ec) {
      return PathsResult::failure(common::ErrorKind::Io,
                                  "chmod " + it->path().string() + ": " + file_ec.message());
    }
    changed.push_back(it->path());
  }
  if (ec) {
    return PathsResult::failure(common::ErrorKind::Io,
                                "Unable to list " + scripts_dir.string() + ": " + ec.message());
  }
  std::sort(changed.begin(), changed.end());
  return PathsResult::success(std::move(changed));
}

} // namespace nexus::setup
