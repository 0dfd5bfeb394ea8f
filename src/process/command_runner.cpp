#include "nexus/process/command_runner.hpp"

#include "nexus/common/fs.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>

#ifdef _WIN32
#include <cstdlib>
#include <process.h>
#else
#include <csignal>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace nexus::process {

std::string describe(const CommandSpec &spec) {
  std::vector<std::string> parts;
  parts.reserve(spec.args.size() + 1);
  parts.push_back(common::shell_quote(spec.program));
  for (const auto &arg : spec.args) {
    parts.push_back(common::shell_quote(arg));
  }
  return common::join(parts, " ");
}

#ifdef _WIN32

namespace {

std::string windows_command_line(const CommandSpec &spec) {
  std::string line;
  if (spec.cwd.has_value()) {
    line += "cd /d \"" + spec.cwd->string() + "\" && ";
  }
  line += "\"" + spec.program + "\"";
  for (const auto &arg : spec.args) {
    line += " \"" + arg + "\"";
  }
  if (spec.output == OutputMode::Discard) {
    line += " >NUL 2>&1";
  }
  return line;
}

} // namespace

common::Result<int> SystemCommandRunner::run(const CommandSpec &spec) {
  const int rc = std::system(windows_command_line(spec).c_str());
  if (rc == -1) {
    return common::Result<int>::failure(common::ErrorKind::Io,
                                        "failed to execute " + spec.program);
  }
  return common::Result<int>::success(rc);
}

common::Result<int> SystemCommandRunner::spawn_detached(const CommandSpec &spec) {
  std::vector<const char *> argv;
  argv.reserve(spec.args.size() + 2);
  argv.push_back(spec.program.c_str());
  for (const auto &arg : spec.args) {
    argv.push_back(arg.c_str());
  }
  argv.push_back(nullptr);
  const auto handle = _spawnvp(_P_DETACH, spec.program.c_str(), argv.data());
  if (handle == -1) {
    return common::Result<int>::failure(common::ErrorKind::Io, "failed to start " + spec.program +
                                                                   ": " + std::strerror(errno));
  }
  return common::Result<int>::success(static_cast<int>(handle));
}

#else

namespace {

int make_cloexec_pipe(int fds[2]) {
#ifdef __linux__
  if (pipe2(fds, O_CLOEXEC) == 0) {
    return 0;
  }
#endif
  if (pipe(fds) != 0) {
    return -1;
  }
  (void)fcntl(fds[0], F_SETFD, fcntl(fds[0], F_GETFD) | FD_CLOEXEC);
  (void)fcntl(fds[1], F_SETFD, fcntl(fds[1], F_GETFD) | FD_CLOEXEC);
  return 0;
}

std::vector<char *> make_argv(const CommandSpec &spec) {
  std::vector<char *> argv;
  argv.reserve(spec.args.size() + 2);
  argv.push_back(const_cast<char *>(spec.program.c_str()));
  for (const auto &arg : spec.args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);
  return argv;
}

void redirect_to_null(const bool include_stdin) {
  const int null_fd = open("/dev/null", O_RDWR);
  if (null_fd < 0) {
    return;
  }
  if (include_stdin) {
    (void)dup2(null_fd, STDIN_FILENO);
  }
  (void)dup2(null_fd, STDOUT_FILENO);
  (void)dup2(null_fd, STDERR_FILENO);
  if (null_fd > STDERR_FILENO) {
    close(null_fd);
  }
}

// Runs in the forked child: never returns. Exec failures are reported as an
// errno written to `error_fd`.
[[noreturn]] void exec_child(const CommandSpec &spec, char *const *argv, const int error_fd) {
  (void)signal(SIGPIPE, SIG_DFL);
  if (spec.cwd.has_value() && chdir(spec.cwd->c_str()) != 0) {
    const int err = errno;
    (void)!write(error_fd, &err, sizeof(err));
    _exit(127);
  }
  execvp(argv[0], argv);
  const int err = errno;
  (void)!write(error_fd, &err, sizeof(err));
  _exit(127);
}

bool read_int(const int fd, int &out) {
  std::size_t got = 0;
  auto *bytes = reinterpret_cast<char *>(&out);
  while (got < sizeof(out)) {
    const ssize_t n = read(fd, bytes + got, sizeof(out) - got);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return false;
    }
    got += static_cast<std::size_t>(n);
  }
  return true;
}

int wait_for_exit(const pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

std::string exec_error(const CommandSpec &spec, const int err) {
  return "failed to execute " + spec.program + ": " + std::strerror(err);
}

} // namespace

common::Result<int> SystemCommandRunner::run(const CommandSpec &spec) {
  if (spec.program.empty()) {
    return common::Result<int>::failure(common::ErrorKind::Io, "empty program");
  }
  auto argv = make_argv(spec);

  int error_pipe[2] = {-1, -1};
  if (make_cloexec_pipe(error_pipe) != 0) {
    return common::Result<int>::failure(common::ErrorKind::Io,
                                        std::string("pipe failed: ") + std::strerror(errno));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close(error_pipe[0]);
    close(error_pipe[1]);
    return common::Result<int>::failure(common::ErrorKind::Io,
                                        std::string("fork failed: ") + std::strerror(errno));
  }

  if (pid == 0) {
    close(error_pipe[0]);
    if (spec.output == OutputMode::Discard) {
      redirect_to_null(true);
    }
    exec_child(spec, argv.data(), error_pipe[1]);
  }

  close(error_pipe[1]);
  int child_errno = 0;
  const bool exec_failed = read_int(error_pipe[0], child_errno);
  close(error_pipe[0]);

  const int code = wait_for_exit(pid);
  if (exec_failed) {
    return common::Result<int>::failure(common::ErrorKind::Io, exec_error(spec, child_errno));
  }
  if (code < 0) {
    return common::Result<int>::failure(common::ErrorKind::Io,
                                        "failed to wait for " + spec.program);
  }
  return common::Result<int>::success(code);
}

common::Result<int> SystemCommandRunner::spawn_detached(const CommandSpec &spec) {
  if (spec.program.empty()) {
    return common::Result<int>::failure(common::ErrorKind::Io, "empty program");
  }
  auto argv = make_argv(spec);

  // pid_pipe carries the grandchild pid from the intermediate child,
  // error_pipe carries an exec errno from the grandchild.
  int pid_pipe[2] = {-1, -1};
  int error_pipe[2] = {-1, -1};
  if (make_cloexec_pipe(pid_pipe) != 0) {
    return common::Result<int>::failure(common::ErrorKind::Io,
                                        std::string("pipe failed: ") + std::strerror(errno));
  }
  if (make_cloexec_pipe(error_pipe) != 0) {
    close(pid_pipe[0]);
    close(pid_pipe[1]);
    return common::Result<int>::failure(common::ErrorKind::Io,
                                        std::string("pipe failed: ") + std::strerror(errno));
  }

  const pid_t intermediate = fork();
  if (intermediate < 0) {
    close(pid_pipe[0]);
    close(pid_pipe[1]);
    close(error_pipe[0]);
    close(error_pipe[1]);
    return common::Result<int>::failure(common::ErrorKind::Io,
                                        std::string("fork failed: ") + std::strerror(errno));
  }

  if (intermediate == 0) {
    close(pid_pipe[0]);
    close(error_pipe[0]);
    (void)setsid();
    const pid_t grandchild = fork();
    if (grandchild == 0) {
      close(pid_pipe[1]);
      redirect_to_null(true);
      exec_child(spec, argv.data(), error_pipe[1]);
    }
    const int reported = grandchild < 0 ? -errno : static_cast<int>(grandchild);
    (void)!write(pid_pipe[1], &reported, sizeof(reported));
    _exit(0);
  }

  close(pid_pipe[1]);
  close(error_pipe[1]);

  int grandchild = 0;
  const bool got_pid = read_int(pid_pipe[0], grandchild);
  close(pid_pipe[0]);
  int child_errno = 0;
  const bool exec_failed = read_int(error_pipe[0], child_errno);
  close(error_pipe[0]);
  (void)wait_for_exit(intermediate);

  if (!got_pid) {
    return common::Result<int>::failure(common::ErrorKind::Io,
                                        "detached launch of " + spec.program + " lost its pid");
  }
  if (grandchild < 0) {
    return common::Result<int>::failure(common::ErrorKind::Io,
                                        std::string("fork failed: ") + std::strerror(-grandchild));
  }
  if (exec_failed) {
    return common::Result<int>::failure(common::ErrorKind::Io, exec_error(spec, child_errno));
  }
  return common::Result<int>::success(grandchild);
}

#endif

namespace {

std::string capture_command_line(const CommandSpec &spec) {
#ifdef _WIN32
  CommandSpec shown = spec;
  shown.output = OutputMode::Inherit;
  return windows_command_line(shown) + " 2>NUL";
#else
  std::string line;
  if (spec.cwd.has_value()) {
    line += "cd " + common::shell_quote(spec.cwd->string()) + " && ";
  }
  return line + describe(spec) + " 2>/dev/null";
#endif
}

} // namespace

common::Result<std::string> SystemCommandRunner::capture(const CommandSpec &spec) {
  if (spec.program.empty()) {
    return common::Result<std::string>::failure(common::ErrorKind::Io, "empty program");
  }
#ifdef _WIN32
  FILE *pipe = _popen(capture_command_line(spec).c_str(), "r");
#else
  FILE *pipe = popen(capture_command_line(spec).c_str(), "r");
#endif
  if (pipe == nullptr) {
    return common::Result<std::string>::failure(common::ErrorKind::Io,
                                                "failed to launch " + spec.program);
  }

  std::array<char, 4096> buffer{};
  std::string output;
  while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
    output += buffer.data();
  }
#ifdef _WIN32
  const int rc = _pclose(pipe);
#else
  const int rc = pclose(pipe);
#endif
  if (rc != 0) {
    return common::Result<std::string>::failure(
        common::ErrorKind::Io, spec.program + " failed with status " + std::to_string(rc));
  }
  return common::Result<std::string>::success(output);
}

} // namespace nexus::process
