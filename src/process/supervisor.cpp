#include "mcpbridge/process/supervisor.hpp"

#include <csignal>

#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <fmt/ranges.h>

#include "mcpbridge/bridge/response_router.hpp"
#include "mcpbridge/process/spawn.hpp"
#include "mcpbridge/utils/string_utils.hpp"

namespace mcpbridge::process {

using error::BridgeError;
using error::ErrorKind;

namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds(10);

constexpr auto kEarlyReapBudget = std::chrono::milliseconds(100);

constexpr auto kExitPollInterval = std::chrono::milliseconds(100);

// Longest stderr excerpt carried in a ProcessDown message.
constexpr std::size_t kStderrExcerptBytes = 512;

auto LastStderrExcerpt(std::string_view tail) -> std::string {
  std::string trimmed = utils::Trim(tail);
  if (trimmed.size() > kStderrExcerptBytes) {
    trimmed.erase(0, trimmed.size() - kStderrExcerptBytes);
  }
  return trimmed;
}

auto LogOnException(std::shared_ptr<spdlog::logger> logger, std::string task) {
  return [logger = std::move(logger),
          task = std::move(task)](const std::exception_ptr &eptr) {
    if (!eptr) {
      return;
    }
    try {
      std::rethrow_exception(eptr);
    } catch (const std::exception &ex) {
      logger->error("{} failed: {}", task, ex.what());
    }
  };
}

}  // namespace

auto ToString(ProcessState state) -> std::string_view {
  switch (state) {
    case ProcessState::kStarting:
      return "starting";
    case ProcessState::kRunning:
      return "running";
    case ProcessState::kExited:
      return "exited";
    case ProcessState::kRestarting:
      return "restarting";
  }
  return "unknown";
}

auto MaxRestartsPolicy(std::size_t max_restarts) -> RestartPolicy {
  return [max_restarts](const ProcessHandle &exited) {
    return exited.restarts < max_restarts;
  };
}

ProcessSupervisor::ProcessSupervisor(
    asio::any_io_executor executor, bridge::PendingTable &pending,
    std::shared_ptr<spdlog::logger> logger,
    std::chrono::milliseconds shutdown_grace)
    : executor_(std::move(executor)),
      pending_(pending),
      logger_(logger ? logger : spdlog::default_logger()),
      shutdown_grace_(shutdown_grace) {
  IgnoreSigpipe();
}

ProcessSupervisor::~ProcessSupervisor() {
  std::shared_ptr<transport::LineChannel> channel;
  pid_t pid = -1;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ProcessState::kRunning) {
      return;
    }
    channel = channel_;
    pid = handle_.pid;
  }

  Logger()->warn(
      "ProcessSupervisor destroyed while process {} is running, killing it",
      pid);
  if (channel) {
    channel->CloseNow();
  }
  SendSignal(pid, SIGKILL);
}

auto ProcessSupervisor::Start(config::LaunchConfig launch)
    -> asio::awaitable<std::expected<ProcessHandle, BridgeError>> {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ProcessState::kRunning) {
      Logger()->debug("MCP process {} already running", handle_.pid);
      co_return handle_;
    }
    if (launching_) {
      co_return BridgeError::UnexpectedFromKind(
          ErrorKind::kConfigError, "MCP process is already starting");
    }
    launching_ = true;
    state_ = ProcessState::kStarting;
    shutting_down_ = false;
    last_launch_ = launch;
  }
  co_return co_await Launch(std::move(launch));
}

auto ProcessSupervisor::Restart()
    -> asio::awaitable<std::expected<ProcessHandle, BridgeError>> {
  std::optional<config::LaunchConfig> launch;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    launch = last_launch_;
  }
  if (!launch) {
    co_return BridgeError::UnexpectedFromKind(
        ErrorKind::kConfigError, "MCP process was never started");
  }

  co_await Shutdown();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (launching_ || state_ == ProcessState::kRunning) {
      co_return BridgeError::UnexpectedFromKind(
          ErrorKind::kConfigError, "MCP process is already starting");
    }
    ++restarts_;
    launching_ = true;
    shutting_down_ = false;
    state_ = ProcessState::kRestarting;
  }
  co_return co_await Launch(std::move(*launch));
}

auto ProcessSupervisor::Launch(config::LaunchConfig launch)
    -> asio::awaitable<std::expected<ProcessHandle, BridgeError>> {
  Logger()->info(
      "Starting MCP process: {} {}", launch.command,
      fmt::join(launch.args, " "));

  auto spawned = Spawn(launch);
  if (!spawned) {
    Logger()->error("{}", spawned.error().Message());
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = ProcessState::kExited;
    handle_.alive = false;
    launching_ = false;
    co_return std::unexpected(spawned.error());
  }

  auto channel = std::make_shared<transport::LineChannel>(
      executor_, spawned->stdin_fd, spawned->stdout_fd, spawned->stderr_fd,
      logger_);

  uint64_t generation = 0;
  ProcessHandle handle;
  bool cancelled = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled = shutting_down_;
    if (!cancelled) {
      generation = ++generation_;
      channel_ = channel;
      exit_latch_ = std::make_shared<ExitLatch>(executor_);
      last_stderr_.clear();
      if (reaped_pid_ == spawned->pid) {
        reaped_pid_ = -1;
      }
      handle_ = ProcessHandle{
          .pid = spawned->pid,
          .alive = true,
          .started_at = std::chrono::system_clock::now(),
          .exit_code = std::nullopt,
          .restarts = restarts_};
      state_ = ProcessState::kRunning;
      launching_ = false;
      handle = handle_;
    }
  }

  if (cancelled) {
    // Shutdown waits on launching_, so the child is gone before it returns.
    Logger()->warn(
        "Shutdown requested during launch, stopping MCP process {}",
        spawned->pid);
    co_await channel->Close();
    co_await ReapWithEscalation(spawned->pid);
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = ProcessState::kExited;
    handle_.alive = false;
    launching_ = false;
    co_return BridgeError::UnexpectedFromKind(
        ErrorKind::kProcessDown, "MCP process launch cancelled by shutdown");
  }

  asio::co_spawn(
      channel->GetStrand(), WatchLoop(channel, generation, handle.pid),
      LogOnException(logger_, "MCP stdout reader"));
  asio::co_spawn(
      channel->GetStrand(), channel->DrainStderr(),
      LogOnException(logger_, "MCP stderr reader"));
  asio::co_spawn(
      executor_, ExitWatch(channel, generation, handle.pid),
      LogOnException(logger_, "MCP exit watcher"));

  Logger()->info("MCP process started with pid {}", handle.pid);
  co_return handle;
}

auto ProcessSupervisor::Shutdown() -> asio::awaitable<void> {
  std::shared_ptr<transport::LineChannel> channel;
  std::shared_ptr<ExitLatch> latch;
  pid_t pid = -1;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutting_down_ = true;
  }

  // A launch in progress sees the flag and stops its own process.
  asio::steady_timer timer(executor_);
  while (true) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!launching_) {
        latch = exit_latch_;
        if (state_ == ProcessState::kRunning) {
          channel = channel_;
          pid = handle_.pid;
        }
        break;
      }
    }
    timer.expires_after(kReapPollInterval);
    co_await timer.async_wait(asio::as_tuple(asio::use_awaitable));
  }

  if (channel) {
    Logger()->info("Shutting down MCP process {}", pid);
    // Closing stdin asks the process to exit; closing stdout ends the
    // reader, which reaps the process and escalates to signals if needed.
    co_await channel->Close();
  }
  // Also waits out an exit that was already being handled.
  if (latch) {
    co_await latch->async_receive(asio::as_tuple(asio::use_awaitable));
  }
}

auto ProcessSupervisor::WaitForExit() -> asio::awaitable<ProcessHandle> {
  std::shared_ptr<ExitLatch> latch;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ProcessState::kRunning || !exit_latch_) {
      co_return handle_;
    }
    latch = exit_latch_;
  }
  co_await latch->async_receive(asio::as_tuple(asio::use_awaitable));
  co_return Handle();
}

void ProcessSupervisor::SetRestartPolicy(RestartPolicy policy) {
  std::lock_guard<std::mutex> lock(mutex_);
  restart_policy_ = std::move(policy);
}

auto ProcessSupervisor::IsAlive() const -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_ == ProcessState::kRunning;
}

auto ProcessSupervisor::State() const -> ProcessState {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

auto ProcessSupervisor::Handle() const -> ProcessHandle {
  std::lock_guard<std::mutex> lock(mutex_);
  return handle_;
}

auto ProcessSupervisor::Channel() const
    -> std::shared_ptr<transport::LineChannel> {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != ProcessState::kRunning) {
    return nullptr;
  }
  return channel_;
}

auto ProcessSupervisor::StderrTail() const -> std::string {
  std::shared_ptr<transport::LineChannel> channel;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!last_stderr_.empty() || !channel_) {
      return last_stderr_;
    }
    channel = channel_;
  }
  return channel->StderrTail();
}

auto ProcessSupervisor::DownError() const -> BridgeError {
  ProcessHandle handle = Handle();
  std::string message = "MCP process is not running";
  if (handle.exit_code) {
    message = fmt::format("MCP process exited with code {}", *handle.exit_code);
  }
  auto excerpt = LastStderrExcerpt(StderrTail());
  if (!excerpt.empty()) {
    message += ". Stderr: " + excerpt;
  }
  return BridgeError::FromKind(ErrorKind::kProcessDown, message);
}

auto ProcessSupervisor::IsCurrent(uint64_t generation) const -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation == generation_ && state_ == ProcessState::kRunning;
}

auto ProcessSupervisor::ReapChild(pid_t pid) -> std::optional<int> {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pid == reaped_pid_) {
    return reaped_code_;
  }
  auto code = TryReap(pid);
  if (code && pid == handle_.pid) {
    reaped_pid_ = pid;
    reaped_code_ = *code;
  }
  return code;
}

auto ProcessSupervisor::WatchLoop(
    std::shared_ptr<transport::LineChannel> channel, uint64_t generation,
    pid_t pid) -> asio::awaitable<void> {
  while (auto line = co_await channel->ReadLine()) {
    if (utils::Trim(*line).empty()) {
      continue;
    }

    auto routed = bridge::RouteLine(pending_, *line, *Logger());
    if (!routed.reply) {
      continue;
    }

    // Replies go out on their own so a full stdin pipe never stalls reading.
    asio::co_spawn(
        executor_,
        [channel, reply = routed.reply->ToJson(),
         logger = logger_]() -> asio::awaitable<void> {
          auto written = co_await channel->WriteMessage(reply);
          if (!written) {
            logger->warn(
                "Failed to answer MCP process request: {}",
                written.error().Message());
          }
        },
        LogOnException(logger_, "MCP reply writer"));
  }

  co_await HandleExit(std::move(channel), generation, pid);
}

auto ProcessSupervisor::ExitWatch(
    std::shared_ptr<transport::LineChannel> channel, uint64_t generation,
    pid_t pid) -> asio::awaitable<void> {
  asio::steady_timer timer(executor_);
  do {
    timer.expires_after(kExitPollInterval);
    co_await timer.async_wait(asio::as_tuple(asio::use_awaitable));
    if (!IsCurrent(generation)) {
      co_return;
    }
  } while (!ReapChild(pid));

  // Output normally ends with the process; let the reader drain what is left
  // before closing a stream that a descendant keeps open.
  timer.expires_after(kEarlyReapBudget);
  co_await timer.async_wait(asio::as_tuple(asio::use_awaitable));
  if (!IsCurrent(generation)) {
    co_return;
  }

  Logger()->warn("MCP process {} exited but its output is still open", pid);
  co_await channel->Close();
}

auto ProcessSupervisor::HandleExit(
    std::shared_ptr<transport::LineChannel> channel, uint64_t generation,
    pid_t pid) -> asio::awaitable<void> {
  bool superseded = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    superseded = generation != generation_;
    if (!superseded) {
      // Mark the process down before failing calls so no new call can slip
      // in between and wait forever.
      state_ = ProcessState::kExited;
      handle_.alive = false;
    }
  }

  if (superseded) {
    Logger()->warn("Stopping MCP process {} from an earlier launch", pid);
    co_await channel->Close();
    co_await ReapWithEscalation(pid);
    co_return;
  }

  Logger()->warn("MCP process {} closed its output", pid);

  // A crashed process is usually reaped here already, which lets the failed
  // calls carry its exit code.
  auto exit_code = co_await PollReap(pid, kEarlyReapBudget);
  std::shared_ptr<ExitLatch> latch;
  RestartPolicy policy;
  bool shutting_down = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handle_.exit_code = exit_code;
    last_stderr_ = channel->StderrTail();
  }

  auto failed = pending_.FailAll(DownError());
  if (failed > 0) {
    Logger()->warn("Failed {} pending call(s): MCP process is down", failed);
  }

  if (!exit_code) {
    exit_code = co_await ReapWithEscalation(pid);
  }
  co_await channel->Close();

  ProcessHandle exited;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handle_.exit_code = exit_code;
    last_stderr_ = channel->StderrTail();
    latch = exit_latch_;
    policy = restart_policy_;
    shutting_down = shutting_down_;
    exited = handle_;
  }

  if (*exit_code == 0) {
    Logger()->info("MCP process {} exited with code 0", pid);
  } else {
    Logger()->error("MCP process {} exited with code {}", pid, *exit_code);
  }

  latch->close();

  if (shutting_down || !policy || !policy(exited)) {
    co_return;
  }

  std::optional<config::LaunchConfig> launch;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_ || shutting_down_ || launching_ ||
        !last_launch_) {
      co_return;
    }
    ++restarts_;
    launching_ = true;
    state_ = ProcessState::kRestarting;
    launch = last_launch_;
  }

  Logger()->info("Restarting MCP process (restart {})", exited.restarts + 1);
  auto restarted = co_await Launch(std::move(*launch));
  if (!restarted) {
    Logger()->error(
        "Failed to restart MCP process: {}", restarted.error().Message());
  }
}

auto ProcessSupervisor::PollReap(pid_t pid, std::chrono::milliseconds budget)
    -> asio::awaitable<std::optional<int>> {
  asio::steady_timer timer(executor_);
  auto deadline = std::chrono::steady_clock::now() + budget;
  while (std::chrono::steady_clock::now() < deadline) {
    if (auto code = ReapChild(pid)) {
      co_return code;
    }
    timer.expires_after(kReapPollInterval);
    co_await timer.async_wait(asio::as_tuple(asio::use_awaitable));
  }
  co_return ReapChild(pid);
}

auto ProcessSupervisor::ReapWithEscalation(pid_t pid) -> asio::awaitable<int> {
  if (auto code = co_await PollReap(pid, shutdown_grace_)) {
    co_return *code;
  }

  Logger()->warn("MCP process {} did not exit, sending SIGTERM", pid);
  SendSignal(pid, SIGTERM);
  if (auto code = co_await PollReap(pid, shutdown_grace_)) {
    co_return *code;
  }

  Logger()->warn("MCP process {} ignored SIGTERM, sending SIGKILL", pid);
  SendSignal(pid, SIGKILL);
  while (true) {
    if (auto code = co_await PollReap(pid, shutdown_grace_)) {
      co_return *code;
    }
  }
}

}  // namespace mcpbridge::process
