#include "nexus/process/process_table.hpp"

#include "nexus/common/fs.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>

#ifdef _WIN32
#include <windows.h>
#else
#include <csignal>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace nexus::process {

namespace {

#ifdef __linux__
bool is_zombie(const int pid) {
  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  if (!stat) {
    return false;
  }
  std::string line;
  std::getline(stat, line);
  // Field 3 follows the parenthesised command name, which may contain spaces.
  const auto close_paren = line.rfind(')');
  if (close_paren == std::string::npos || close_paren + 2 >= line.size()) {
    return false;
  }
  return line[close_paren + 2] == 'Z';
}

std::vector<int> scan_proc(const std::string &signature) {
  std::vector<int> matches;
  const int self = current_pid();
  std::error_code ec;
  for (std::filesystem::directory_iterator it("/proc", ec), end; !ec && it != end;
       it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) {
      continue;
    }
    const int pid = std::stoi(name);
    if (pid == self) {
      continue;
    }
    std::ifstream in(it->path() / "cmdline", std::ios::binary);
    if (!in) {
      continue;
    }
    std::string cmdline((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (cmdline.empty()) {
      continue;
    }
    for (char &ch : cmdline) {
      if (ch == '\0') {
        ch = ' ';
      }
    }
    if (cmdline.find(signature) != std::string::npos && !is_zombie(pid)) {
      matches.push_back(pid);
    }
  }
  return matches;
}
#elif !defined(_WIN32)
std::vector<int> run_pgrep(const std::string &signature) {
  std::vector<int> matches;
  int out_pipe[2] = {-1, -1};
  if (pipe(out_pipe) != 0) {
    return matches;
  }
  const pid_t pid = fork();
  if (pid < 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    return matches;
  }
  if (pid == 0) {
    (void)dup2(out_pipe[1], STDOUT_FILENO);
    close(out_pipe[0]);
    close(out_pipe[1]);
    execlp("pgrep", "pgrep", "-f", signature.c_str(), static_cast<char *>(nullptr));
    _exit(127);
  }
  close(out_pipe[1]);
  std::string output;
  char buf[256];
  ssize_t n = 0;
  while ((n = read(out_pipe[0], buf, sizeof(buf))) > 0 || (n < 0 && errno == EINTR)) {
    if (n > 0) {
      output.append(buf, static_cast<std::size_t>(n));
    }
  }
  close(out_pipe[0]);
  int status = 0;
  (void)waitpid(pid, &status, 0);

  const int self = current_pid();
  for (const auto &line : common::split(output, '\n')) {
    const auto trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.find_first_not_of("0123456789") != std::string::npos) {
      continue;
    }
    const int found = std::stoi(trimmed);
    if (found != self) {
      matches.push_back(found);
    }
  }
  return matches;
}
#endif

#ifndef _WIN32
// Reaps `pid` if it is our child so it does not linger as a zombie.
void reap_if_child(const int pid) {
  int status = 0;
  (void)waitpid(pid, &status, WNOHANG);
}

bool gone(const int pid) {
  reap_if_child(pid);
  if (!is_process_alive(pid)) {
    return true;
  }
#ifdef __linux__
  return is_zombie(pid);
#else
  return false;
#endif
}

bool wait_gone(const int pid, const std::chrono::milliseconds budget) {
  const auto deadline = std::chrono::steady_clock::now() + budget;
  while (std::chrono::steady_clock::now() < deadline) {
    if (gone(pid)) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  return gone(pid);
}
#endif

} // namespace

int current_pid() {
#ifdef _WIN32
  return static_cast<int>(GetCurrentProcessId());
#else
  return static_cast<int>(getpid());
#endif
}

bool is_process_alive(const int pid) {
  if (pid <= 0) {
    return false;
  }
#ifdef _WIN32
  HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
  if (process == nullptr) {
    return false;
  }
  DWORD code = 0;
  const bool active = GetExitCodeProcess(process, &code) != 0 && code == STILL_ACTIVE;
  CloseHandle(process);
  return active;
#else
  return kill(pid, 0) == 0 || errno == EPERM;
#endif
}

common::Status terminate_and_wait(const int pid, const std::chrono::milliseconds grace) {
  if (pid <= 1 || pid == current_pid()) {
    return common::Status::error(common::ErrorKind::SignalDeliveryFailed,
                                 "refusing to signal pid " + std::to_string(pid));
  }
#ifdef _WIN32
  HANDLE process = OpenProcess(PROCESS_TERMINATE | SYNCHRONIZE, FALSE, static_cast<DWORD>(pid));
  if (process == nullptr) {
    return common::Status::success();
  }
  const bool terminated = TerminateProcess(process, 1) != 0;
  if (terminated) {
    (void)WaitForSingleObject(process, static_cast<DWORD>(grace.count()));
  }
  CloseHandle(process);
  if (!terminated) {
    return common::Status::error(common::ErrorKind::SignalDeliveryFailed,
                                 "failed to terminate pid " + std::to_string(pid));
  }
  return common::Status::success();
#else
  if (kill(pid, SIGTERM) != 0) {
    if (errno == ESRCH) {
      return common::Status::success();
    }
    return common::Status::error(common::ErrorKind::SignalDeliveryFailed,
                                 "SIGTERM to pid " + std::to_string(pid) +
                                     " failed: " + std::strerror(errno));
  }
  if (!wait_gone(pid, grace)) {
    return common::Status::error(common::ErrorKind::SignalDeliveryFailed,
                                 "pid " + std::to_string(pid) + " still running after SIGTERM");
  }
  return common::Status::success();
#endif
}

SystemProcessTable::SystemProcessTable(const std::chrono::milliseconds grace) : grace_(grace) {}

std::vector<int> SystemProcessTable::find_by_signature(const std::string &signature) {
  if (common::trim(signature).empty()) {
    return {};
  }
#if defined(__linux__)
  return scan_proc(signature);
#elif defined(_WIN32)
  return {};
#else
  return run_pgrep(signature);
#endif
}

bool SystemProcessTable::is_alive(const int pid) { return is_process_alive(pid); }

common::Status SystemProcessTable::terminate(const int pid) {
  return terminate_and_wait(pid, grace_);
}

} // namespace nexus::process
