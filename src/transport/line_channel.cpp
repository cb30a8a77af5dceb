#include "mcpbridge/transport/line_channel.hpp"

#include <fmt/format.h>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>

#include "mcpbridge/utils/string_utils.hpp"

namespace mcpbridge::transport {

using error::BridgeError;
using error::ErrorKind;

namespace {
auto MakeDescriptor(const asio::any_io_executor &executor, int fd)
    -> asio::posix::stream_descriptor {
  if (fd < 0) {
    return asio::posix::stream_descriptor(executor);
  }
  return asio::posix::stream_descriptor(executor, fd);
}
}  // namespace

LineChannel::LineChannel(
    asio::any_io_executor executor, int stdin_fd, int stdout_fd, int stderr_fd,
    std::shared_ptr<spdlog::logger> logger, std::size_t max_line_bytes)
    : logger_(logger ? logger : spdlog::default_logger()),
      executor_(std::move(executor)),
      strand_(asio::make_strand(executor_)),
      stdin_(MakeDescriptor(strand_, stdin_fd)),
      stdout_(MakeDescriptor(strand_, stdout_fd)),
      stderr_(MakeDescriptor(strand_, stderr_fd)),
      max_line_bytes_(max_line_bytes) {
}

LineChannel::~LineChannel() {
  if (!is_closed_) {
    Logger()->debug("LineChannel destructor triggering CloseNow()");
    try {
      CloseNow();
    } catch (const std::exception &e) {
      Logger()->error("LineChannel destructor error: {}", e.what());
    }
  }
}

auto LineChannel::WriteMessage(
    const nlohmann::json &message,
    std::optional<std::chrono::milliseconds> timeout)
    -> asio::awaitable<std::expected<void, BridgeError>> {
  std::string line;
  try {
    line = message.dump();
  } catch (const nlohmann::json::exception &ex) {
    co_return BridgeError::UnexpectedFromKind(
        ErrorKind::kWriteError,
        "Failed to serialize message: " + std::string(ex.what()));
  }
  co_return co_await WriteLine(std::move(line), timeout);
}

auto LineChannel::WriteLine(
    std::string line, std::optional<std::chrono::milliseconds> timeout)
    -> asio::awaitable<std::expected<void, BridgeError>> {
  if (line.find('\n') != std::string::npos) {
    co_return BridgeError::UnexpectedFromKind(
        ErrorKind::kWriteError, "Message contains a newline");
  }

  if (is_closed_) {
    co_return BridgeError::UnexpectedFromKind(
        ErrorKind::kWriteError, "Attempt to write on a closed channel");
  }

  Logger()->debug("LineChannel sending: {}", utils::Preview(line));
  line.push_back('\n');

  auto done = std::make_shared<bridge::Completion<asio::error_code>>(executor_);
  asio::post(
      strand_, [self = shared_from_this(), line = std::move(line), done]() {
        if (self->is_closed_) {
          done->Fulfill(asio::error::bad_descriptor);
          return;
        }
        self->send_queue_.push_back(
            PendingWrite{.data = std::move(line), .done = done});
        if (!self->sending_) {
          self->sending_ = true;
          asio::co_spawn(self->strand_, self->WriteLoop(), asio::detached);
        }
      });

  auto ec = timeout ? co_await done->Wait(*timeout) : co_await done->Wait();
  if (!ec && timeout && !is_closed_) {
    // Closing the slot tells the write loop to skip the line if it has not
    // started on it yet.
    done->Close();
    Logger()->warn(
        "LineChannel write timed out after {} ms", timeout->count());
    co_return BridgeError::UnexpectedFromKind(
        ErrorKind::kTimeout,
        fmt::format("Write timed out after {} ms", timeout->count()));
  }
  if (!ec) {
    co_return BridgeError::UnexpectedFromKind(
        ErrorKind::kWriteError, "Channel closed before the write completed");
  }
  if (*ec) {
    co_return BridgeError::UnexpectedFromKind(
        ErrorKind::kWriteError,
        "Failed to write to MCP process: " + ec->message());
  }
  co_return error::Ok();
}

auto LineChannel::WriteLoop() -> asio::awaitable<void> {
  auto self = shared_from_this();

  while (!send_queue_.empty()) {
    auto item = std::move(send_queue_.front());
    send_queue_.pop_front();

    if (item.done->IsFulfilled()) {
      Logger()->debug("LineChannel dropping abandoned line");
      continue;
    }

    if (is_closed_ || !stdin_.is_open()) {
      item.done->Fulfill(asio::error::bad_descriptor);
      continue;
    }

    asio::error_code ec;
    std::size_t written = co_await asio::async_write(
        stdin_, asio::buffer(item.data),
        asio::redirect_error(asio::use_awaitable, ec));

    if (ec) {
      Logger()->error("LineChannel error writing to stdin: {}", ec.message());
      item.done->Fulfill(ec);
      FailQueuedWrites(ec);
      break;
    }

    Logger()->debug("LineChannel wrote {} bytes", written);
    item.done->Fulfill(asio::error_code{});
  }

  sending_ = false;
}

void LineChannel::FailQueuedWrites(const asio::error_code &ec) {
  while (!send_queue_.empty()) {
    send_queue_.front().done->Fulfill(ec);
    send_queue_.pop_front();
  }
}

auto LineChannel::ReadLine() -> asio::awaitable<std::optional<std::string>> {
  bool discard_next = false;

  while (!is_closed_ && stdout_.is_open()) {
    asio::error_code ec;
    std::size_t n = co_await asio::async_read_until(
        stdout_, asio::dynamic_buffer(read_buffer_, max_line_bytes_), '\n',
        asio::redirect_error(asio::use_awaitable, ec));

    if (!ec) {
      std::string line = read_buffer_.substr(0, n - 1);
      read_buffer_.erase(0, n);
      if (discard_next) {
        discard_next = false;
        continue;
      }
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      co_return line;
    }

    if (ec == asio::error::not_found) {
      // The rest of the oversized line is dropped when its newline arrives.
      Logger()->error(
          "LineChannel discarding line longer than {} bytes", max_line_bytes_);
      read_buffer_.clear();
      discard_next = true;
      continue;
    }

    if (ec == asio::error::eof) {
      Logger()->debug("LineChannel stdout reached end of stream");
      if (!read_buffer_.empty() && !discard_next) {
        std::string line = std::move(read_buffer_);
        read_buffer_.clear();
        co_return line;
      }
      co_return std::nullopt;
    }

    if (ec == asio::error::operation_aborted) {
      Logger()->debug("LineChannel read aborted");
    } else {
      Logger()->error("LineChannel error reading stdout: {}", ec.message());
    }
    co_return std::nullopt;
  }

  co_return std::nullopt;
}

auto LineChannel::DrainStderr() -> asio::awaitable<void> {
  auto self = shared_from_this();

  while (!is_closed_ && stderr_.is_open()) {
    asio::error_code ec;
    std::size_t n = co_await stderr_.async_read_some(
        asio::buffer(stderr_chunk_),
        asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
      if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
        Logger()->warn("LineChannel error reading stderr: {}", ec.message());
      }
      break;
    }
    AppendStderr(std::string_view(stderr_chunk_.data(), n));
  }

  if (!stderr_line_.empty()) {
    Logger()->warn("MCP stderr: {}", stderr_line_);
    stderr_line_.clear();
  }
}

void LineChannel::AppendStderr(std::string_view chunk) {
  {
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    stderr_tail_.append(chunk);
    if (stderr_tail_.size() > kStderrTailBytes) {
      stderr_tail_.erase(0, stderr_tail_.size() - kStderrTailBytes);
    }
  }

  for (char c : chunk) {
    if (c == '\n') {
      if (!stderr_line_.empty() && stderr_line_.back() == '\r') {
        stderr_line_.pop_back();
      }
      Logger()->warn("MCP stderr: {}", stderr_line_);
      stderr_line_.clear();
    } else if (stderr_line_.size() < kStderrTailBytes) {
      stderr_line_.push_back(c);
    }
  }
}

auto LineChannel::StderrTail() const -> std::string {
  std::lock_guard<std::mutex> lock(stderr_mutex_);
  return stderr_tail_;
}

auto LineChannel::Close() -> asio::awaitable<void> {
  Logger()->debug("LineChannel closing");
  co_await asio::co_spawn(
      strand_,
      [self = shared_from_this()]() -> asio::awaitable<void> {
        self->CloseDescriptors();
        co_return;
      },
      asio::use_awaitable);
}

void LineChannel::CloseNow() {
  CloseDescriptors();
  Logger()->debug("LineChannel closed synchronously");
}

void LineChannel::CloseDescriptors() {
  if (is_closed_.exchange(true)) {
    return;
  }

  for (auto *descriptor : {&stdin_, &stdout_, &stderr_}) {
    if (!descriptor->is_open()) {
      continue;
    }
    asio::error_code ec;
    descriptor->cancel(ec);
    if (ec) {
      Logger()->warn(
          "LineChannel error canceling descriptor: {}", ec.message());
    }
    descriptor->close(ec);
    if (ec) {
      Logger()->warn("LineChannel error closing descriptor: {}", ec.message());
    }
  }

  FailQueuedWrites(asio::error::operation_aborted);
}

}  // namespace mcpbridge::transport
