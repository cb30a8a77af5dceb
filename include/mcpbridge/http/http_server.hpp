#pragma once

#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "mcpbridge/bridge/rpc_bridge.hpp"
#include "mcpbridge/error/error.hpp"
#include "mcpbridge/http/http_codec.hpp"

namespace mcpbridge::http {

/// Status for a POST /mcp reply that carries a body.
auto StatusForFailure(std::optional<error::ErrorKind> failure) -> int;

/**
 * @brief Minimal HTTP/1.1 front end for an RpcBridge.
 *
 * Serves POST /mcp and GET /health. Run() must be spawned on GetStrand();
 * each accepted connection runs as its own coroutine on its own strand.
 */
class HttpServer {
 public:
  HttpServer(
      asio::any_io_executor executor, std::string address, uint16_t port,
      bridge::RpcBridge &bridge,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  auto operator=(const HttpServer &) -> HttpServer & = delete;

  HttpServer(HttpServer &&) = delete;
  auto operator=(HttpServer &&) -> HttpServer & = delete;

  /// Binds and listens. Port 0 picks a free port; see LocalPort().
  auto Start() -> asio::awaitable<std::expected<void, error::BridgeError>>;

  /// Accepts connections until Stop() is called.
  auto Run() -> asio::awaitable<void>;

  /// Closes the listener. Safe to call from any thread.
  void Stop();

  [[nodiscard]] auto LocalPort() const -> uint16_t {
    return local_port_.load();
  }

  /// Routes one parsed request.
  auto Handle(const HttpRequest &request) -> asio::awaitable<HttpResponse>;

  [[nodiscard]] auto GetStrand() -> asio::strand<asio::any_io_executor> & {
    return strand_;
  }

 private:
  auto Session(asio::ip::tcp::socket socket) -> asio::awaitable<void>;

  auto HandleRpc(const HttpRequest &request) -> asio::awaitable<HttpResponse>;

  auto HandleHealth() -> HttpResponse;

  auto Logger() -> std::shared_ptr<spdlog::logger> {
    return logger_;
  }

  std::shared_ptr<spdlog::logger> logger_;
  asio::any_io_executor executor_;
  asio::strand<asio::any_io_executor> strand_;
  asio::ip::tcp::acceptor acceptor_;
  std::string address_;
  uint16_t port_;
  std::atomic<uint16_t> local_port_{0};
  std::atomic<bool> is_stopped_{false};

  bridge::RpcBridge &bridge_;
};

}  // namespace mcpbridge::http
