#include "mcpbridge/message/request.hpp"

namespace mcpbridge::message {

using error::BridgeError;
using error::ErrorKind;

namespace {

auto ValidateEnvelope(const nlohmann::json& json_obj)
    -> std::expected<void, BridgeError> {
  if (!json_obj.is_object()) {
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kInvalidRequest, "Request must be a JSON object");
  }

  if (!json_obj.contains("jsonrpc") || !json_obj["jsonrpc"].is_string() ||
      json_obj["jsonrpc"].get<std::string>() != kJsonRpcVersion) {
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kInvalidRequest, "Missing or invalid 'jsonrpc' version");
  }

  if (!json_obj.contains("method") || !json_obj["method"].is_string()) {
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kInvalidRequest, "Missing or invalid 'method'");
  }

  if (json_obj.contains("params")) {
    const auto& p = json_obj["params"];
    if (!p.is_array() && !p.is_object() && !p.is_null()) {
      return BridgeError::UnexpectedFromKind(
          ErrorKind::kInvalidRequest,
          "'params' must be object, array, or null");
    }
  }

  return error::Ok();
}

auto ParamsOf(const nlohmann::json& json_obj) -> std::optional<nlohmann::json> {
  if (json_obj.contains("params")) {
    return json_obj["params"];
  }
  return std::nullopt;
}

}  // namespace

Request::Request(
    std::string method, std::optional<nlohmann::json> params, RequestId id)
    : method_(std::move(method)),
      params_(std::move(params)),
      id_(std::move(id)) {
}

auto Request::FromJson(const nlohmann::json& json_obj)
    -> std::expected<Request, BridgeError> {
  if (auto valid = ValidateEnvelope(json_obj); !valid) {
    return std::unexpected(valid.error());
  }

  if (!json_obj.contains("id")) {
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kInvalidRequest, "Request is missing 'id'");
  }

  auto id = RequestIdFromJson(json_obj["id"]);
  if (!id) {
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kInvalidRequest, "Invalid 'id' type");
  }

  return Request(
      json_obj["method"].get<std::string>(), ParamsOf(json_obj),
      std::move(*id));
}

auto Request::ToJson() const -> nlohmann::json {
  nlohmann::json json_obj;
  json_obj["jsonrpc"] = kJsonRpcVersion;
  json_obj["method"] = method_;

  if (params_.has_value()) {
    json_obj["params"] = params_.value();
  }

  json_obj["id"] = RequestIdToJson(id_);
  return json_obj;
}

Notification::Notification(
    std::string method, std::optional<nlohmann::json> params)
    : method_(std::move(method)), params_(std::move(params)) {
}

auto Notification::FromJson(const nlohmann::json& json_obj)
    -> std::expected<Notification, BridgeError> {
  if (auto valid = ValidateEnvelope(json_obj); !valid) {
    return std::unexpected(valid.error());
  }

  if (json_obj.contains("id")) {
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kInvalidRequest, "Notification must not carry an 'id'");
  }

  return Notification(
      json_obj["method"].get<std::string>(), ParamsOf(json_obj));
}

auto Notification::ToJson() const -> nlohmann::json {
  nlohmann::json json_obj;
  json_obj["jsonrpc"] = kJsonRpcVersion;
  json_obj["method"] = method_;

  if (params_.has_value()) {
    json_obj["params"] = params_.value();
  }

  return json_obj;
}

}  // namespace mcpbridge::message
