#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <variant>

#include <asio/any_io_executor.hpp>
#include <asio/as_tuple.hpp>
#include <asio/awaitable.hpp>
#include <asio/error_code.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

namespace mcpbridge::bridge {

/**
 * @brief A one-shot slot that one producer fills and one consumer awaits.
 *
 * The first call to Fulfill wins; later calls are ignored. Fulfill may be
 * called from any thread. The waiter suspends on a channel receive and is
 * never polled.
 *
 * @tparam T The value handed from producer to consumer.
 */
template <typename T>
class Completion {
 public:
  /**
   * @brief Construct a new Completion
   *
   * @param executor Executor the underlying channel is bound to
   */
  explicit Completion(asio::any_io_executor executor)
      : channel_(std::move(executor), 1) {
  }

  Completion(const Completion&) = delete;
  auto operator=(const Completion&) -> Completion& = delete;
  Completion(Completion&&) = delete;
  auto operator=(Completion&&) -> Completion& = delete;

  ~Completion() = default;

  /**
   * @brief Hands the value to the waiter
   *
   * @param value The value to deliver
   * @return true if this call delivered the value, false if the slot was
   * already fulfilled
   */
  auto Fulfill(T value) -> bool {
    if (fulfilled_.exchange(true)) {
      return false;
    }
    return channel_.try_send(asio::error_code{}, std::move(value));
  }

  /**
   * @brief Waits until the value arrives
   *
   * @return The value, or std::nullopt if the channel was closed
   */
  auto Wait() -> asio::awaitable<std::optional<T>> {
    auto [ec, value] =
        co_await channel_.async_receive(asio::as_tuple(asio::use_awaitable));
    if (ec) {
      co_return std::nullopt;
    }
    co_return std::move(value);
  }

  /**
   * @brief Waits until the value arrives or the timeout expires
   *
   * @param timeout How long to wait
   * @return The value, or std::nullopt on timeout or a closed channel
   */
  auto Wait(std::chrono::milliseconds timeout)
      -> asio::awaitable<std::optional<T>> {
    using namespace asio::experimental::awaitable_operators;

    asio::steady_timer timer(co_await asio::this_coro::executor, timeout);
    auto outcome = co_await (
        channel_.async_receive(asio::as_tuple(asio::use_awaitable)) ||
        timer.async_wait(asio::as_tuple(asio::use_awaitable)));

    if (outcome.index() != 0) {
      co_return std::nullopt;
    }

    auto [ec, value] = std::get<0>(std::move(outcome));
    if (ec) {
      co_return std::nullopt;
    }
    co_return std::move(value);
  }

  /// Closes the channel so that a pending Wait returns std::nullopt.
  void Close() {
    fulfilled_ = true;
    channel_.close();
  }

  [[nodiscard]] auto IsFulfilled() const -> bool {
    return fulfilled_.load();
  }

 private:
  std::atomic<bool> fulfilled_{false};

  asio::experimental::concurrent_channel<void(asio::error_code, T)> channel_;
};

}  // namespace mcpbridge::bridge
