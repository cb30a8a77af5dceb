#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <deque>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <asio.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "mcpbridge/bridge/completion.hpp"
#include "mcpbridge/error/error.hpp"

namespace mcpbridge::transport {

constexpr std::size_t kDefaultMaxLineBytes = 16 * 1024 * 1024;

constexpr std::size_t kStderrTailBytes = 8 * 1024;

/**
 * @brief Newline-delimited message channel over a child's stdio pipes.
 *
 * All descriptor work runs on one strand. Writes are queued and drained by a
 * single write loop so concurrent writers never interleave partial lines.
 * ReadLine and DrainStderr must each be driven by a single coroutine spawned
 * on GetStrand(). Instances must be owned by a std::shared_ptr.
 */
class LineChannel : public std::enable_shared_from_this<LineChannel> {
 public:
  /**
   * @brief Takes ownership of the given descriptors.
   *
   * @param executor Executor for the descriptors and the strand
   * @param stdin_fd Write end of the child's stdin
   * @param stdout_fd Read end of the child's stdout
   * @param stderr_fd Read end of the child's stderr, or -1
   * @param logger Logger to use, defaults to spdlog's default logger
   * @param max_line_bytes Longest line accepted from stdout
   */
  LineChannel(
      asio::any_io_executor executor, int stdin_fd, int stdout_fd,
      int stderr_fd = -1, std::shared_ptr<spdlog::logger> logger = nullptr,
      std::size_t max_line_bytes = kDefaultMaxLineBytes);

  ~LineChannel();

  LineChannel(const LineChannel&) = delete;
  auto operator=(const LineChannel&) -> LineChannel& = delete;

  LineChannel(LineChannel&&) = delete;
  auto operator=(LineChannel&&) -> LineChannel& = delete;

  /// Serializes `message` on one line and writes it with a trailing newline.
  auto WriteMessage(
      const nlohmann::json& message,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt)
      -> asio::awaitable<std::expected<void, error::BridgeError>>;

  /**
   * @brief Writes one line; the newline terminator is appended here.
   *
   * Completes once the bytes reached the pipe. Fails with kWriteError if the
   * channel is closed, the pipe is broken, or `line` contains a newline.
   * Fails with kTimeout if the line has not been written within `timeout`;
   * a line still queued at that point is dropped, one already being written
   * is finished so that the stream stays line-aligned.
   */
  auto WriteLine(
      std::string line,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt)
      -> asio::awaitable<std::expected<void, error::BridgeError>>;

  /**
   * @brief Reads the next line from stdout.
   *
   * @return The line without its terminator, or std::nullopt once the stream
   * has ended or the channel was closed
   */
  auto ReadLine() -> asio::awaitable<std::optional<std::string>>;

  /// Reads stderr until it closes, logging it and keeping the tail.
  auto DrainStderr() -> asio::awaitable<void>;

  auto Close() -> asio::awaitable<void>;

  void CloseNow();

  [[nodiscard]] auto IsOpen() const -> bool {
    return !is_closed_.load();
  }

  [[nodiscard]] auto StderrTail() const -> std::string;

  [[nodiscard]] auto GetStrand() -> asio::strand<asio::any_io_executor>& {
    return strand_;
  }

 protected:
  auto Logger() -> std::shared_ptr<spdlog::logger> {
    return logger_;
  }

 private:
  struct PendingWrite {
    std::string data;
    std::shared_ptr<bridge::Completion<asio::error_code>> done;
  };

  auto WriteLoop() -> asio::awaitable<void>;

  void FailQueuedWrites(const asio::error_code& ec);

  void CloseDescriptors();

  void AppendStderr(std::string_view chunk);

  std::shared_ptr<spdlog::logger> logger_;
  asio::any_io_executor executor_;
  asio::strand<asio::any_io_executor> strand_;

  asio::posix::stream_descriptor stdin_;
  asio::posix::stream_descriptor stdout_;
  asio::posix::stream_descriptor stderr_;

  std::size_t max_line_bytes_;
  std::atomic<bool> is_closed_{false};

  // Write lane
  std::deque<PendingWrite> send_queue_;
  bool sending_{false};

  // Stdout bytes not yet returned as a line
  std::string read_buffer_;

  // Stderr diagnostics
  std::array<char, 1024> stderr_chunk_{};
  std::string stderr_line_;
  mutable std::mutex stderr_mutex_;
  std::string stderr_tail_;
};

}  // namespace mcpbridge::transport
