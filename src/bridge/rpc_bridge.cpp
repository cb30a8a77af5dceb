#include "mcpbridge/bridge/rpc_bridge.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "mcpbridge/utils/string_utils.hpp"

namespace mcpbridge::bridge {

using error::BridgeError;
using error::ErrorKind;
using message::Notification;
using message::Request;
using message::RequestId;
using message::Response;

namespace {

// Id to answer with when an inbound message is rejected before forwarding.
auto RecoverClientId(const nlohmann::json &entry) -> std::optional<RequestId> {
  if (entry.is_object() && entry.contains("id")) {
    return message::RequestIdFromJson(entry["id"]);
  }
  return std::nullopt;
}

}  // namespace

RpcBridge::RpcBridge(
    process::ProcessSupervisor &supervisor, PendingTable &pending,
    std::chrono::milliseconds default_timeout,
    std::shared_ptr<spdlog::logger> logger,
    std::unique_ptr<IdGenerator> id_generator)
    : supervisor_(supervisor),
      pending_(pending),
      default_timeout_(default_timeout),
      logger_(logger ? logger : spdlog::default_logger()),
      id_generator_(std::move(id_generator)) {
}

auto RpcBridge::Call(
    std::string method, std::optional<nlohmann::json> params,
    std::optional<std::chrono::milliseconds> timeout)
    -> asio::awaitable<std::expected<nlohmann::json, BridgeError>> {
  Request request(
      std::move(method), std::move(params), id_generator_->NextId());

  auto response =
      co_await Exchange(request, timeout.value_or(default_timeout_));
  if (!response) {
    co_return std::unexpected(response.error());
  }
  if (!response->IsSuccess()) {
    co_return std::unexpected(
        BridgeError::FromErrorObject(response->GetError()));
  }
  co_return response->GetResult();
}

auto RpcBridge::Notify(
    std::string method, std::optional<nlohmann::json> params)
    -> asio::awaitable<std::expected<void, BridgeError>> {
  auto channel = supervisor_.Channel();
  if (!channel) {
    co_return BridgeError::UnexpectedFromKind(
        ErrorKind::kWriteError,
        "Cannot send notification: " +
            std::string(supervisor_.DownError().Message()));
  }

  Notification notification(std::move(method), std::move(params));
  Logger()->debug("Forwarding notification '{}'", notification.GetMethod());

  auto written =
      co_await channel->WriteMessage(notification.ToJson(), default_timeout_);
  if (!written) {
    Logger()->error(
        "Failed to send notification '{}': {}", notification.GetMethod(),
        written.error().Message());
    co_return std::unexpected(written.error());
  }

  pending_.Sweep();
  co_return error::Ok();
}

auto RpcBridge::Exchange(
    const Request &request, std::chrono::milliseconds timeout)
    -> asio::awaitable<std::expected<Response, BridgeError>> {
  if (!supervisor_.IsAlive()) {
    co_return std::unexpected(supervisor_.DownError());
  }

  auto id = std::get<int64_t>(request.GetId());
  auto handle = pending_.Register(id);
  if (!handle) {
    co_return std::unexpected(handle.error());
  }

  // The supervisor marks the process down before failing pending calls, so
  // a call registered after that point is caught here.
  auto channel = supervisor_.Channel();
  if (!channel) {
    pending_.Remove(id);
    co_return std::unexpected(supervisor_.DownError());
  }

  Logger()->debug("Forwarding request '{}' as id {}", request.GetMethod(), id);

  // One deadline covers both the write and the wait for the reply, so a
  // process that stops reading its stdin cannot stall the caller.
  auto deadline = std::chrono::steady_clock::now() + timeout;
  auto timed_out = [&]() {
    pending_.Remove(id);
    Logger()->warn(
        "Request '{}' (id {}) timed out after {} ms", request.GetMethod(), id,
        timeout.count());
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kTimeout,
        fmt::format("Request timed out after {} ms", timeout.count()));
  };

  auto written = co_await channel->WriteMessage(request.ToJson(), timeout);
  if (!written) {
    if (written.error().Kind() == ErrorKind::kTimeout) {
      co_return timed_out();
    }
    pending_.Remove(id);
    Logger()->error(
        "Failed to send request '{}' (id {}): {}", request.GetMethod(), id,
        written.error().Message());
    co_return std::unexpected(written.error());
  }

  auto remaining = std::max(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now()),
      std::chrono::milliseconds(0));
  auto outcome = co_await (*handle)->Wait(remaining);
  if (!outcome) {
    co_return timed_out();
  }

  if (*outcome) {
    pending_.Sweep();
  }
  co_return std::move(*outcome);
}

auto RpcBridge::HandleRpc(const nlohmann::json &body)
    -> asio::awaitable<RpcReply> {
  if (!body.is_array()) {
    auto reply = co_await HandleEntry(body);
    co_return RpcReply{.body = std::move(reply.body), .failure = reply.failure};
  }

  if (body.empty() || body.size() > message::kDefaultMaxBatchSize) {
    auto error = BridgeError::FromKind(
        ErrorKind::kInvalidRequest,
        body.empty() ? "Empty batch"
                     : fmt::format(
                           "Batch exceeds {} entries",
                           message::kDefaultMaxBatchSize));
    co_return RpcReply{
        .body = Response::CreateError(error).ToJson(),
        .failure = ErrorKind::kInvalidRequest};
  }

  Logger()->debug("Handling batch of {} message(s)", body.size());

  nlohmann::json responses = nlohmann::json::array();
  for (const auto &entry : body) {
    auto reply = co_await HandleEntry(entry);
    if (reply.body) {
      responses.push_back(std::move(*reply.body));
    }
  }

  if (responses.empty()) {
    co_return RpcReply{.body = std::nullopt, .failure = std::nullopt};
  }
  co_return RpcReply{.body = std::move(responses), .failure = std::nullopt};
}

auto RpcBridge::HandleEntry(const nlohmann::json &entry)
    -> asio::awaitable<EntryReply> {
  bool has_id = entry.is_object() && entry.contains("id");

  if (has_id) {
    auto request = Request::FromJson(entry);
    if (!request) {
      Logger()->warn(
          "Rejecting invalid request: {}", request.error().Message());
      co_return EntryReply{
          .body =
              Response::CreateError(request.error(), RecoverClientId(entry))
                  .ToJson(),
          .failure = request.error().Kind()};
    }
    co_return co_await ForwardRequest(*request);
  }

  auto notification = Notification::FromJson(entry);
  if (!notification) {
    Logger()->warn(
        "Rejecting invalid message: {}", notification.error().Message());
    co_return EntryReply{
        .body = Response::CreateError(notification.error()).ToJson(),
        .failure = notification.error().Kind()};
  }

  auto sent = co_await Notify(
      notification->GetMethod(), notification->GetParams());
  if (!sent) {
    co_return EntryReply{
        .body = Response::CreateError(sent.error()).ToJson(),
        .failure = sent.error().Kind()};
  }
  co_return EntryReply{.body = std::nullopt, .failure = std::nullopt};
}

auto RpcBridge::ForwardRequest(const Request &request)
    -> asio::awaitable<EntryReply> {
  const RequestId &client_id = request.GetId();

  Request forwarded(
      request.GetMethod(), request.GetParams(), id_generator_->NextId());
  auto response = co_await Exchange(forwarded, default_timeout_);
  if (!response) {
    co_return EntryReply{
        .body = Response::CreateError(response.error(), client_id).ToJson(),
        .failure = response.error().Kind()};
  }

  // The process's result or error object goes back untouched, under the
  // client's own id.
  auto body = response->ToJson();
  body["id"] = message::RequestIdToJson(client_id);
  Logger()->debug(
      "Request '{}' (client id {}) answered: {}", request.GetMethod(),
      message::RequestIdToString(client_id), utils::Preview(body.dump()));
  co_return EntryReply{.body = std::move(body), .failure = std::nullopt};
}

auto RpcBridge::HealthCheck() const -> nlohmann::json {
  auto state = supervisor_.State();
  auto handle = supervisor_.Handle();
  bool alive = state == process::ProcessState::kRunning;

  nlohmann::json health;
  health["alive"] = alive;
  health["status"] = alive ? "healthy" : "unhealthy";
  health["state"] = std::string(process::ToString(state));
  health["pid"] = handle.pid > 0 ? nlohmann::json(handle.pid) : nullptr;
  health["pending"] = pending_.Size();
  health["restarts"] = handle.restarts;
  health["exit_code"] =
      handle.exit_code ? nlohmann::json(*handle.exit_code) : nullptr;
  return health;
}

}  // namespace mcpbridge::bridge
