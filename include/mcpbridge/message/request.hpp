#pragma once

#include <expected>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "mcpbridge/error/error.hpp"
#include "mcpbridge/message/types.hpp"

namespace mcpbridge::message {

/// A JSON-RPC call that expects a reply.
class Request {
 public:
  Request(
      std::string method, std::optional<nlohmann::json> params, RequestId id);

  static auto FromJson(const nlohmann::json& json_obj)
      -> std::expected<Request, error::BridgeError>;

  [[nodiscard]] auto GetMethod() const -> const std::string& {
    return method_;
  }

  [[nodiscard]] auto GetParams() const -> const std::optional<nlohmann::json>& {
    return params_;
  }

  [[nodiscard]] auto GetId() const -> const RequestId& {
    return id_;
  }

  [[nodiscard]] auto ToJson() const -> nlohmann::json;

 private:
  std::string method_;
  std::optional<nlohmann::json> params_;
  RequestId id_;
};

/// A JSON-RPC message without an id. No reply is ever sent for it.
class Notification {
 public:
  explicit Notification(
      std::string method, std::optional<nlohmann::json> params = std::nullopt);

  static auto FromJson(const nlohmann::json& json_obj)
      -> std::expected<Notification, error::BridgeError>;

  [[nodiscard]] auto GetMethod() const -> const std::string& {
    return method_;
  }

  [[nodiscard]] auto GetParams() const -> const std::optional<nlohmann::json>& {
    return params_;
  }

  [[nodiscard]] auto ToJson() const -> nlohmann::json;

 private:
  std::string method_;
  std::optional<nlohmann::json> params_;
};

}  // namespace mcpbridge::message
