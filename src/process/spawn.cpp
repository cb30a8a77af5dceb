#include "mcpbridge/process/spawn.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

extern char **environ;

namespace mcpbridge::process {

using error::BridgeError;
using error::ErrorKind;

namespace {

struct Pipe {
  int read_fd{-1};
  int write_fd{-1};
};

void CloseFd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

void ClosePipe(Pipe &pipe) {
  CloseFd(pipe.read_fd);
  CloseFd(pipe.write_fd);
}

auto MakePipe() -> std::expected<Pipe, BridgeError> {
  std::array<int, 2> fds{-1, -1};
  if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kProcessDown,
        std::string("Failed to create pipe: ") + std::strerror(errno));
  }
  return Pipe{.read_fd = fds[0], .write_fd = fds[1]};
}

auto BuildEnvironment(const config::LaunchConfig &launch)
    -> std::vector<std::string> {
  std::map<std::string, std::string> merged;
  if (launch.inherit_env) {
    for (char **entry = environ; entry != nullptr && *entry != nullptr;
         ++entry) {
      std::string_view kv(*entry);
      auto eq = kv.find('=');
      if (eq == std::string_view::npos) {
        continue;
      }
      merged[std::string(kv.substr(0, eq))] = std::string(kv.substr(eq + 1));
    }
  }
  for (const auto &[key, value] : launch.env) {
    merged[key] = value;
  }

  std::vector<std::string> env;
  env.reserve(merged.size());
  for (const auto &[key, value] : merged) {
    env.push_back(key + "=" + value);
  }
  return env;
}

auto ToArgv(std::vector<std::string> &storage) -> std::vector<char *> {
  std::vector<char *> argv;
  argv.reserve(storage.size() + 1);
  for (auto &item : storage) {
    argv.push_back(item.data());
  }
  argv.push_back(nullptr);
  return argv;
}

// Runs in the forked child. Only async-signal-safe calls from here on.
[[noreturn]] void ExecChild(
    const Pipe &in, const Pipe &out, const Pipe &err, int status_fd,
    const char *cwd, const char *file, char *const argv[],
    char *const envp[]) {
  auto fail = [status_fd]() {
    int code = errno;
    [[maybe_unused]] auto n = ::write(status_fd, &code, sizeof(code));
    ::_exit(127);
  };

  ::prctl(PR_SET_PDEATHSIG, SIGTERM);
  ::signal(SIGPIPE, SIG_DFL);

  if (::dup2(in.read_fd, STDIN_FILENO) < 0 ||
      ::dup2(out.write_fd, STDOUT_FILENO) < 0 ||
      ::dup2(err.write_fd, STDERR_FILENO) < 0) {
    fail();
  }

  if (cwd != nullptr && ::chdir(cwd) != 0) {
    fail();
  }

  ::execvpe(file, argv, envp);
  fail();
  ::_exit(127);
}

}  // namespace

void IgnoreSigpipe() {
  static std::once_flag once;
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

auto Spawn(const config::LaunchConfig &launch)
    -> std::expected<SpawnedProcess, BridgeError> {
  if (launch.command.empty()) {
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kProcessDown, "No command to launch");
  }

  IgnoreSigpipe();

  auto in = MakePipe();
  auto out = MakePipe();
  auto err = MakePipe();
  auto status = MakePipe();
  auto close_all = [&] {
    for (auto *p : {&in, &out, &err, &status}) {
      if (p->has_value()) {
        ClosePipe(**p);
      }
    }
  };
  for (auto *p : {&in, &out, &err, &status}) {
    if (!p->has_value()) {
      auto failure = p->error();
      close_all();
      return std::unexpected(failure);
    }
  }

  // Everything the child needs is built before fork.
  std::vector<std::string> arg_storage;
  arg_storage.push_back(launch.command);
  arg_storage.insert(arg_storage.end(), launch.args.begin(), launch.args.end());
  auto env_storage = BuildEnvironment(launch);
  auto argv = ToArgv(arg_storage);
  auto envp = ToArgv(env_storage);
  std::string cwd = launch.cwd ? launch.cwd->string() : std::string();

  pid_t pid = ::fork();
  if (pid < 0) {
    auto failure = BridgeError::FromKind(
        ErrorKind::kProcessDown,
        std::string("Failed to fork: ") + std::strerror(errno));
    close_all();
    return std::unexpected(failure);
  }

  if (pid == 0) {
    ExecChild(
        *in, *out, *err, status->write_fd,
        cwd.empty() ? nullptr : cwd.c_str(), launch.command.c_str(),
        argv.data(), envp.data());
  }

  CloseFd(in->read_fd);
  CloseFd(out->write_fd);
  CloseFd(err->write_fd);
  CloseFd(status->write_fd);

  // The status pipe is closed on a successful exec; otherwise it carries the
  // child's errno.
  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(status->read_fd, &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  CloseFd(status->read_fd);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int wait_status = 0;
    ::waitpid(pid, &wait_status, 0);
    CloseFd(in->write_fd);
    CloseFd(out->read_fd);
    CloseFd(err->read_fd);
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kProcessDown, "Failed to start '" + launch.command +
                                     "': " + std::strerror(child_errno));
  }

  spdlog::debug("Spawned '{}' as pid {}", launch.command, pid);
  return SpawnedProcess{
      .pid = pid,
      .stdin_fd = in->write_fd,
      .stdout_fd = out->read_fd,
      .stderr_fd = err->read_fd};
}

auto TryReap(pid_t pid) -> std::optional<int> {
  int status = 0;
  pid_t result = 0;
  do {
    result = ::waitpid(pid, &status, WNOHANG);
  } while (result < 0 && errno == EINTR);

  if (result == 0) {
    return std::nullopt;
  }
  if (result < 0) {
    // Already reaped elsewhere or not our child.
    return -1;
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

auto SendSignal(pid_t pid, int signal) -> bool {
  return pid > 0 && ::kill(pid, signal) == 0;
}

}  // namespace mcpbridge::process
