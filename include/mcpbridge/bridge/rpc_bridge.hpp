#pragma once

#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>

#include <asio.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "mcpbridge/bridge/id_generator.hpp"
#include "mcpbridge/bridge/pending_table.hpp"
#include "mcpbridge/error/error.hpp"
#include "mcpbridge/message/request.hpp"
#include "mcpbridge/message/response.hpp"
#include "mcpbridge/message/types.hpp"
#include "mcpbridge/process/supervisor.hpp"

namespace mcpbridge::bridge {

/// What HandleRpc hands back to the HTTP layer.
struct RpcReply {
  // JSON-RPC response (or batch of responses); std::nullopt when the body
  // held only notifications.
  std::optional<nlohmann::json> body;

  // Set when a single message failed inside the bridge rather than in the
  // MCP process, so the caller can pick a matching status.
  std::optional<error::ErrorKind> failure;
};

/**
 * @brief Call interface over the supervised MCP process.
 *
 * Each call gets a fresh id, a pending entry and a one-shot completion that
 * the background reader fulfills. Calls run concurrently and are matched by
 * id, never by order.
 */
class RpcBridge {
 public:
  /**
   * @brief Construct a new RpcBridge
   *
   * @param supervisor The started (or to be started) process owner
   * @param pending The table the supervisor's reader resolves into
   * @param default_timeout Timeout for calls that do not name one
   * @param logger Logger to use, defaults to spdlog's default logger
   * @param id_generator Source of request ids sent to the process
   */
  RpcBridge(
      process::ProcessSupervisor &supervisor, PendingTable &pending,
      std::chrono::milliseconds default_timeout = message::kDefaultCallTimeout,
      std::shared_ptr<spdlog::logger> logger = nullptr,
      std::unique_ptr<IdGenerator> id_generator =
          std::make_unique<IncrementalIdGenerator>());

  RpcBridge(const RpcBridge &) = delete;
  RpcBridge(RpcBridge &&) = delete;
  auto operator=(const RpcBridge &) -> RpcBridge & = delete;
  auto operator=(RpcBridge &&) -> RpcBridge & = delete;

  ~RpcBridge() = default;

  /**
   * @brief Sends a request and waits for the matching response.
   *
   * @param method Method name
   * @param params Optional params object or array
   * @param timeout Overrides the default timeout
   * @return The response's `result`, or kRpcError carrying the process's own
   * error object, kTimeout, kProcessDown, kWriteError or kDuplicateId
   */
  auto Call(
      std::string method, std::optional<nlohmann::json> params = std::nullopt,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt)
      -> asio::awaitable<std::expected<nlohmann::json, error::BridgeError>>;

  /**
   * @brief Writes a notification. Completes once the line was written.
   *
   * Fails with kWriteError, including when the process is down, or with
   * kTimeout if the process stops reading for the default timeout.
   */
  auto Notify(
      std::string method, std::optional<nlohmann::json> params = std::nullopt)
      -> asio::awaitable<std::expected<void, error::BridgeError>>;

  /**
   * @brief Handles one decoded HTTP body: a message or a batch of them.
   *
   * Requests are forwarded under a bridge-allocated id and answered with the
   * client's own id. Notifications produce no response entry.
   */
  auto HandleRpc(const nlohmann::json &body) -> asio::awaitable<RpcReply>;

  /// Liveness snapshot for the health endpoint.
  [[nodiscard]] auto HealthCheck() const -> nlohmann::json;

  [[nodiscard]] auto IsAlive() const -> bool {
    return supervisor_.IsAlive();
  }

  [[nodiscard]] auto DefaultTimeout() const -> std::chrono::milliseconds {
    return default_timeout_;
  }

 private:
  struct EntryReply {
    std::optional<nlohmann::json> body;
    std::optional<error::ErrorKind> failure;
  };

  // Register, write and wait. The Response may still carry an error object.
  auto Exchange(const message::Request &request,
                std::chrono::milliseconds timeout)
      -> asio::awaitable<std::expected<message::Response, error::BridgeError>>;

  auto HandleEntry(const nlohmann::json &entry) -> asio::awaitable<EntryReply>;

  auto ForwardRequest(const message::Request &request)
      -> asio::awaitable<EntryReply>;

  auto Logger() const -> std::shared_ptr<spdlog::logger> {
    return logger_;
  }

  process::ProcessSupervisor &supervisor_;

  PendingTable &pending_;

  std::chrono::milliseconds default_timeout_;

  std::shared_ptr<spdlog::logger> logger_;

  std::unique_ptr<IdGenerator> id_generator_;
};

}  // namespace mcpbridge::bridge
