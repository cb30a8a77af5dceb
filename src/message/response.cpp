#include "mcpbridge/message/response.hpp"

#include <stdexcept>

namespace mcpbridge::message {

using error::BridgeError;
using error::ErrorCode;
using error::ErrorKind;

namespace {
void AttachId(nlohmann::json& response, const std::optional<RequestId>& id) {
  if (id) {
    response["id"] = RequestIdToJson(*id);
  } else {
    response["id"] = nullptr;
  }
}
}  // namespace

auto Response::FromJson(const nlohmann::json& json)
    -> std::expected<Response, BridgeError> {
  Response r{json};
  if (auto result = r.ValidateResponse(); !result) {
    return std::unexpected(result.error());
  }
  return r;
}

auto Response::CreateSuccess(
    const nlohmann::json& result, const std::optional<RequestId>& id)
    -> Response {
  nlohmann::json response = {{"jsonrpc", kJsonRpcVersion}, {"result", result}};
  AttachId(response, id);
  return Response{std::move(response)};
}

auto Response::CreateError(ErrorCode code, const std::optional<RequestId>& id)
    -> Response {
  std::string_view message = "Server error";
  switch (code) {
    case ErrorCode::kParseError:
      message = "Parse error";
      break;
    case ErrorCode::kInvalidRequest:
      message = "Invalid request";
      break;
    case ErrorCode::kMethodNotFound:
      message = "Method not found";
      break;
    case ErrorCode::kInvalidParams:
      message = "Invalid parameters";
      break;
    case ErrorCode::kInternalError:
      message = "Internal error";
      break;
    default:
      break;
  }

  nlohmann::json error = {
      {"code", static_cast<int>(code)}, {"message", message}};
  return CreateError(error, id);
}

auto Response::CreateError(
    const BridgeError& error, const std::optional<RequestId>& id) -> Response {
  return CreateError(error.ToJson(), id);
}

auto Response::CreateError(
    const nlohmann::json& error, const std::optional<RequestId>& id)
    -> Response {
  nlohmann::json response = {{"jsonrpc", kJsonRpcVersion}, {"error", error}};
  AttachId(response, id);
  return Response{std::move(response)};
}

auto Response::IsSuccess() const -> bool {
  return response_.contains("result");
}

auto Response::GetResult() const -> const nlohmann::json& {
  if (!IsSuccess()) {
    throw std::runtime_error("Response is not a success response");
  }
  return response_["result"];
}

auto Response::GetError() const -> const nlohmann::json& {
  if (IsSuccess()) {
    throw std::runtime_error("Response is not an error response");
  }
  return response_["error"];
}

auto Response::GetId() const -> std::optional<RequestId> {
  if (!response_.contains("id")) {
    return std::nullopt;
  }
  return RequestIdFromJson(response_["id"]);
}

auto Response::ToJson() const -> nlohmann::json {
  return response_;
}

auto Response::ValidateResponse() const -> std::expected<void, BridgeError> {
  if (!response_.is_object()) {
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kMalformedMessage, "Response must be a JSON object");
  }

  if (!response_.contains("jsonrpc") ||
      response_["jsonrpc"] != kJsonRpcVersion) {
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kMalformedMessage, "Invalid JSON-RPC version");
  }

  if (!response_.contains("result") && !response_.contains("error")) {
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kMalformedMessage,
        "Response must contain either 'result' or 'error' field");
  }

  if (response_.contains("result") && response_.contains("error")) {
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kMalformedMessage,
        "Response cannot contain both 'result' and 'error' fields");
  }

  if (response_.contains("error")) {
    const auto& error = response_["error"];
    if (!error.is_object() || !error.contains("code") ||
        !error["code"].is_number_integer() || !error.contains("message") ||
        !error["message"].is_string()) {
      return BridgeError::UnexpectedFromKind(
          ErrorKind::kMalformedMessage,
          "Error object must contain integer 'code' and string 'message'");
    }
  }

  return {};
}

}  // namespace mcpbridge::message
