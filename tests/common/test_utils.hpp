#pragma once

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <utility>

#include <asio.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "mcpbridge/config/config.hpp"

namespace mcpbridge::testing {

inline auto TestLogger() -> std::shared_ptr<spdlog::logger> {
  auto logger = spdlog::get("test");
  if (!logger) {
    logger = spdlog::stdout_color_mt("test");
    logger->set_level(spdlog::level::debug);
    logger->flush_on(spdlog::level::debug);
    spdlog::set_default_logger(logger);
  }
  return logger;
}

// Runs a coroutine test body to completion on a fresh io_context and rethrows
// whatever it threw, so REQUIRE failures inside the coroutine fail the test.
// Background work still pending when the body returns is abandoned.
template <typename F>
void RunTest(F&& test_fn) {
  TestLogger();
  asio::io_context io_ctx;
  std::exception_ptr failure;
  asio::co_spawn(
      io_ctx, std::forward<F>(test_fn)(io_ctx.get_executor()),
      [&](std::exception_ptr eptr) {
        failure = eptr;
        io_ctx.stop();
      });
  io_ctx.run();
  if (failure) {
    std::rethrow_exception(failure);
  }
}

// Runs `body` on `pool` so that completions race across threads, waits for
// it and stops the pool. Catch2 assertions are not thread-safe: the body
// records what it saw and the caller checks it after this returns. Objects
// the body uses must outlive the pool's threads, so declare them next to the
// pool rather than inside the body.
inline void RunOnPool(asio::thread_pool& pool, asio::awaitable<void> body) {
  TestLogger();
  std::promise<std::exception_ptr> done;
  auto finished = done.get_future();
  asio::co_spawn(
      pool, std::move(body),
      [&done](std::exception_ptr eptr) { done.set_value(eptr); });
  auto failure = finished.get();
  pool.stop();
  pool.join();
  if (failure) {
    std::rethrow_exception(failure);
  }
}

// Polls `predicate` every few milliseconds until it holds or `timeout` passes.
template <typename Predicate>
auto WaitUntil(
    Predicate predicate,
    std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
    -> asio::awaitable<bool> {
  asio::steady_timer timer(co_await asio::this_coro::executor);
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!predicate()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      co_return false;
    }
    timer.expires_after(std::chrono::milliseconds(10));
    co_await timer.async_wait(asio::use_awaitable);
  }
  co_return true;
}

inline auto Sleep(std::chrono::milliseconds duration) -> asio::awaitable<void> {
  asio::steady_timer timer(co_await asio::this_coro::executor, duration);
  co_await timer.async_wait(asio::use_awaitable);
}

inline auto FakeServerLaunch() -> config::LaunchConfig {
  config::LaunchConfig launch;
  launch.command = MCPBRIDGE_FAKE_SERVER_PATH;
  return launch;
}

inline auto ShellLaunch(std::string script) -> config::LaunchConfig {
  config::LaunchConfig launch;
  launch.command = "/bin/sh";
  launch.args = {"-c", std::move(script)};
  return launch;
}

}  // namespace mcpbridge::testing
