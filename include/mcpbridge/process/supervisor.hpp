#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <asio.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <spdlog/spdlog.h>
#include <sys/types.h>

#include "mcpbridge/bridge/pending_table.hpp"
#include "mcpbridge/config/config.hpp"
#include "mcpbridge/error/error.hpp"
#include "mcpbridge/transport/line_channel.hpp"

namespace mcpbridge::process {

enum class ProcessState {
  kStarting,
  kRunning,
  kExited,
  kRestarting,
};

auto ToString(ProcessState state) -> std::string_view;

/// Snapshot of the supervised process.
struct ProcessHandle {
  pid_t pid{-1};
  bool alive{false};
  std::chrono::system_clock::time_point started_at{};
  std::optional<int> exit_code;
  std::size_t restarts{0};
};

/// Decides whether an exited process is relaunched. `exited.restarts` is the
/// number of restarts performed so far.
using RestartPolicy = std::function<bool(const ProcessHandle &exited)>;

auto MaxRestartsPolicy(std::size_t max_restarts) -> RestartPolicy;

/**
 * @brief Owns the MCP process and the single reader of its output.
 *
 * On end of stdout, or once the process itself has exited, the supervisor
 * moves to kExited, fails every pending call with kProcessDown, reaps the
 * child and, if a restart policy allows it, launches it again. Shutdown()
 * must complete before destruction.
 */
class ProcessSupervisor {
 public:
  ProcessSupervisor(
      asio::any_io_executor executor, bridge::PendingTable &pending,
      std::shared_ptr<spdlog::logger> logger = nullptr,
      std::chrono::milliseconds shutdown_grace = std::chrono::milliseconds(
          2000));

  ProcessSupervisor(const ProcessSupervisor &) = delete;
  ProcessSupervisor(ProcessSupervisor &&) = delete;
  auto operator=(const ProcessSupervisor &) -> ProcessSupervisor & = delete;
  auto operator=(ProcessSupervisor &&) -> ProcessSupervisor & = delete;

  ~ProcessSupervisor();

  /**
   * @brief Launches the process and its background reader.
   *
   * Returns the current handle if the process is already running. Fails with
   * kConfigError while another launch is in progress.
   */
  auto Start(config::LaunchConfig launch)
      -> asio::awaitable<std::expected<ProcessHandle, error::BridgeError>>;

  /// Stops the current process, if any, and launches the last config again.
  auto Restart()
      -> asio::awaitable<std::expected<ProcessHandle, error::BridgeError>>;

  /**
   * @brief Closes the streams, terminates the process and waits for it.
   *
   * Pending calls fail with kProcessDown. No restart is attempted. A launch
   * in progress is stopped before this returns.
   */
  auto Shutdown() -> asio::awaitable<void>;

  /// Completes once the current process has exited and been reaped.
  auto WaitForExit() -> asio::awaitable<ProcessHandle>;

  void SetRestartPolicy(RestartPolicy policy);

  [[nodiscard]] auto IsAlive() const -> bool;

  [[nodiscard]] auto State() const -> ProcessState;

  [[nodiscard]] auto Handle() const -> ProcessHandle;

  /// The live channel, or nullptr when no process is running.
  [[nodiscard]] auto Channel() const -> std::shared_ptr<transport::LineChannel>;

  [[nodiscard]] auto StderrTail() const -> std::string;

  /// The error handed to callers while the process is down.
  [[nodiscard]] auto DownError() const -> error::BridgeError;

 private:
  using ExitLatch =
      asio::experimental::concurrent_channel<void(asio::error_code)>;

  auto Launch(config::LaunchConfig launch)
      -> asio::awaitable<std::expected<ProcessHandle, error::BridgeError>>;

  auto WatchLoop(std::shared_ptr<transport::LineChannel> channel,
                 uint64_t generation, pid_t pid) -> asio::awaitable<void>;

  /// Closes the output of a process that exited while a descendant still
  /// holds its stdout, so the reader ends.
  auto ExitWatch(std::shared_ptr<transport::LineChannel> channel,
                 uint64_t generation, pid_t pid) -> asio::awaitable<void>;

  auto HandleExit(std::shared_ptr<transport::LineChannel> channel,
                  uint64_t generation, pid_t pid) -> asio::awaitable<void>;

  [[nodiscard]] auto IsCurrent(uint64_t generation) const -> bool;

  /// TryReap that remembers the exit code of the current process, so the
  /// exit watcher and the reader can both ask for it.
  auto ReapChild(pid_t pid) -> std::optional<int>;

  auto PollReap(pid_t pid, std::chrono::milliseconds budget)
      -> asio::awaitable<std::optional<int>>;

  /// Waits for `pid`, sending SIGTERM and then SIGKILL after each grace.
  auto ReapWithEscalation(pid_t pid) -> asio::awaitable<int>;

  auto Logger() const -> std::shared_ptr<spdlog::logger> {
    return logger_;
  }

  asio::any_io_executor executor_;

  bridge::PendingTable &pending_;

  std::shared_ptr<spdlog::logger> logger_;

  std::chrono::milliseconds shutdown_grace_;

  mutable std::mutex mutex_;

  ProcessState state_{ProcessState::kStarting};

  ProcessHandle handle_;

  std::shared_ptr<transport::LineChannel> channel_;

  std::shared_ptr<ExitLatch> exit_latch_;

  std::optional<config::LaunchConfig> last_launch_;

  RestartPolicy restart_policy_;

  std::size_t restarts_{0};

  uint64_t generation_{0};

  bool shutting_down_{false};

  // Set while a launch runs, so concurrent launches are refused.
  bool launching_{false};

  pid_t reaped_pid_{-1};

  int reaped_code_{0};

  // Stderr of the most recent process, kept after its channel is gone.
  std::string last_stderr_;
};

}  // namespace mcpbridge::process
