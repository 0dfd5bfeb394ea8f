#include "nexus/daemon/pid_file.hpp"

#include "nexus/common/fs.hpp"
#include "nexus/observability/global.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <thread>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace nexus::daemon {

namespace {

constexpr const char *PID_SUFFIX = ".pid";
constexpr const char *LOCK_SUFFIX = ".lock";

bool is_plain_key_char(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
         ch == '_' || ch == '-';
}

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  return -1;
}

std::optional<int> parse_pid(const std::string &content) {
  const std::string text = common::trim(content);
  if (text.empty() || text.size() > 10 ||
      text.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  const long long value = std::stoll(text);
  if (value <= 0 || value > 0x7fffffffLL) {
    return std::nullopt;
  }
  return static_cast<int>(value);
}

void close_lock_handle(const std::intptr_t handle) {
#ifdef _WIN32
  CloseHandle(reinterpret_cast<HANDLE>(handle));
#else
  const int fd = static_cast<int>(handle);
  (void)flock(fd, LOCK_UN);
  close(fd);
#endif
}

} // namespace

std::string encode_owner_key(const std::string &owner_key) {
  static constexpr char HEX[] = "0123456789ABCDEF";
  std::string encoded;
  encoded.reserve(owner_key.size());
  for (const char ch : owner_key) {
    if (is_plain_key_char(ch)) {
      encoded.push_back(ch);
      continue;
    }
    const auto byte = static_cast<unsigned char>(ch);
    encoded.push_back('%');
    encoded.push_back(HEX[byte >> 4]);
    encoded.push_back(HEX[byte & 0x0F]);
  }
  return encoded;
}

std::optional<std::string> decode_owner_key(const std::string &encoded) {
  std::string decoded;
  decoded.reserve(encoded.size());
  for (std::size_t i = 0; i < encoded.size(); ++i) {
    const char ch = encoded[i];
    if (is_plain_key_char(ch)) {
      decoded.push_back(ch);
      continue;
    }
    if (ch != '%' || i + 2 >= encoded.size()) {
      return std::nullopt;
    }
    const int high = hex_value(encoded[i + 1]);
    const int low = hex_value(encoded[i + 2]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<char>((high << 4) | low));
    i += 2;
  }
  return decoded;
}

std::string heartbeat_owner_key(const std::string &agent_id) { return "heartbeat_" + agent_id; }

PidFileLock::~PidFileLock() { release(); }

PidFileLock::PidFileLock(PidFileLock &&other) noexcept : handle_(other.handle_) {
  other.handle_ = -1;
}

PidFileLock &PidFileLock::operator=(PidFileLock &&other) noexcept {
  if (this != &other) {
    release();
    handle_ = other.handle_;
    other.handle_ = -1;
  }
  return *this;
}

void PidFileLock::release() {
  if (handle_ < 0) {
    return;
  }
  close_lock_handle(handle_);
  handle_ = -1;
}

PidFileStore::PidFileStore(std::filesystem::path run_dir,
                           std::shared_ptr<process::IProcessTable> processes)
    : run_dir_(std::move(run_dir)), processes_(std::move(processes)) {
  if (processes_ == nullptr) {
    processes_ = std::make_shared<process::SystemProcessTable>();
  }
}

std::filesystem::path PidFileStore::path_for(const std::string &owner_key) const {
  return run_dir_ / ("." + encode_owner_key(owner_key) + PID_SUFFIX);
}

common::Status PidFileStore::write(const std::string &owner_key, const int pid) const {
  if (owner_key.empty()) {
    return common::Status::error(common::ErrorKind::Io, "pid record needs an owner key");
  }
  if (pid <= 0) {
    return common::Status::error(common::ErrorKind::Io,
                                 "invalid pid " + std::to_string(pid) + " for " + owner_key);
  }
  return common::write_file_atomic(path_for(owner_key), std::to_string(pid) + "\n");
}

std::optional<int> PidFileStore::read(const std::string &owner_key) const {
  const auto path = path_for(owner_key);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::nullopt;
  }
  const auto content = common::read_file(path);
  if (!content.ok()) {
    return std::nullopt;
  }
  return parse_pid(content.value());
}

common::Status PidFileStore::remove(const std::string &owner_key) const {
  std::error_code ec;
  std::filesystem::remove(path_for(owner_key), ec);
  if (ec) {
    return common::Status::error(common::ErrorKind::Io,
                                 "failed to remove pid record " + owner_key + ": " + ec.message());
  }
  return common::Status::success();
}

std::optional<int> PidFileStore::terminate_and_clear(const std::string &owner_key) const {
  const auto path = path_for(owner_key);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }

  std::optional<int> terminated;
  const auto pid = read(owner_key);
  if (!pid.has_value()) {
    observability::record_warning("pid_file", "discarding unreadable record " + path.string());
  } else if (*pid > 1 && *pid != process::current_pid()) {
    auto status = processes_->terminate(*pid);
    if (status.ok()) {
      terminated = *pid;
      observability::record_stale_terminated(owner_key, *pid);
    } else {
      observability::record_warning("pid_file", status.error());
    }
  }

  if (auto removed = remove(owner_key); !removed.ok()) {
    observability::record_warning("pid_file", removed.error());
  }
  return terminated;
}

std::vector<PidRecord> PidFileStore::list() const {
  std::vector<PidRecord> records;
  std::error_code ec;
  if (!std::filesystem::is_directory(run_dir_, ec)) {
    return records;
  }
  const std::string suffix(PID_SUFFIX);
  for (std::filesystem::directory_iterator it(run_dir_, ec), end; !ec && it != end;
       it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (name.size() <= suffix.size() + 1 || name.front() != '.' ||
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
      continue;
    }
    const auto owner_key = decode_owner_key(name.substr(1, name.size() - suffix.size() - 1));
    if (!owner_key.has_value() || owner_key->empty()) {
      continue;
    }
    if (const auto pid = read(*owner_key); pid.has_value()) {
      records.push_back(PidRecord{.owner_key = *owner_key, .pid = *pid});
    }
  }
  std::sort(records.begin(), records.end(),
            [](const PidRecord &a, const PidRecord &b) { return a.owner_key < b.owner_key; });
  return records;
}

common::Result<PidFileLock> PidFileStore::lock(const std::string &owner_key) const {
  auto ensured = common::ensure_dir(run_dir_);
  if (!ensured.ok()) {
    return common::Result<PidFileLock>::failure(ensured.status());
  }
  const auto lock_path = run_dir_ / ("." + encode_owner_key(owner_key) + LOCK_SUFFIX);

#ifdef _WIN32
  for (int attempt = 0; attempt < 100; ++attempt) {
    HANDLE handle = CreateFileA(lock_path.string().c_str(), GENERIC_READ | GENERIC_WRITE, 0,
                                nullptr, OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (handle != INVALID_HANDLE_VALUE) {
      return common::Result<PidFileLock>::success(
          PidFileLock(reinterpret_cast<std::intptr_t>(handle)));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  return common::Result<PidFileLock>::failure(common::ErrorKind::Io,
                                              "timed out locking " + lock_path.string());
#else
  const int fd = open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    return common::Result<PidFileLock>::failure(
        common::ErrorKind::Io, "failed to open " + lock_path.string() + ": " + std::strerror(errno));
  }
  while (flock(fd, LOCK_EX) != 0) {
    if (errno == EINTR) {
      continue;
    }
    const std::string error = std::strerror(errno);
    close(fd);
    return common::Result<PidFileLock>::failure(common::ErrorKind::Io,
                                                "failed to lock " + lock_path.string() + ": " +
                                                    error);
  }
  return common::Result<PidFileLock>::success(PidFileLock(static_cast<std::intptr_t>(fd)));
#endif
}

} // namespace nexus::daemon
