#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mcpbridge::error {

enum class ErrorKind {
  kMalformedMessage,
  kRpcError,
  kTimeout,
  kProcessDown,
  kWriteError,
  kDuplicateId,
  kInvalidRequest,
  kConfigError,
};

enum class ErrorCode {
  // Standard errors
  kParseError = -32700,
  kInvalidRequest = -32600,
  kMethodNotFound = -32601,
  kInvalidParams = -32602,
  kInternalError = -32603,

  // Implementation-defined server errors
  kServerError = -32000,
  kTimeoutError = -32001,
  kProcessDown = -32002,
  kWriteError = -32003,
  kConfigError = -32004,
};

namespace detail {
inline auto DefaultMessageFor(ErrorKind kind) -> std::string_view {
  switch (kind) {
    case ErrorKind::kMalformedMessage:
      return "Malformed message";
    case ErrorKind::kRpcError:
      return "Server error";
    case ErrorKind::kTimeout:
      return "Request timed out";
    case ErrorKind::kProcessDown:
      return "MCP process is not running";
    case ErrorKind::kWriteError:
      return "Failed to write to MCP process";
    case ErrorKind::kDuplicateId:
      return "Duplicate request id";
    case ErrorKind::kInvalidRequest:
      return "Invalid request";
    case ErrorKind::kConfigError:
      return "Invalid configuration";
  }
  return "Unknown error";
}

inline auto DefaultCodeFor(ErrorKind kind) -> ErrorCode {
  switch (kind) {
    case ErrorKind::kMalformedMessage:
      return ErrorCode::kParseError;
    case ErrorKind::kRpcError:
      return ErrorCode::kServerError;
    case ErrorKind::kTimeout:
      return ErrorCode::kTimeoutError;
    case ErrorKind::kProcessDown:
      return ErrorCode::kProcessDown;
    case ErrorKind::kWriteError:
      return ErrorCode::kWriteError;
    case ErrorKind::kDuplicateId:
      return ErrorCode::kInternalError;
    case ErrorKind::kInvalidRequest:
      return ErrorCode::kInvalidRequest;
    case ErrorKind::kConfigError:
      return ErrorCode::kConfigError;
  }
  return ErrorCode::kInternalError;
}
}  // namespace detail

inline auto ToString(ErrorKind kind) -> std::string_view {
  switch (kind) {
    case ErrorKind::kMalformedMessage:
      return "MalformedMessageError";
    case ErrorKind::kRpcError:
      return "RpcError";
    case ErrorKind::kTimeout:
      return "TimeoutError";
    case ErrorKind::kProcessDown:
      return "ProcessDownError";
    case ErrorKind::kWriteError:
      return "WriteError";
    case ErrorKind::kDuplicateId:
      return "DuplicateIdError";
    case ErrorKind::kInvalidRequest:
      return "InvalidRequestError";
    case ErrorKind::kConfigError:
      return "ConfigError";
  }
  return "UnknownError";
}

// Error value shared by every layer of the bridge. For kRpcError the code,
// message and data are the ones the MCP process replied with.
class BridgeError {
 public:
  BridgeError(
      ErrorKind kind, int code, std::string message,
      std::optional<nlohmann::json> data = std::nullopt)
      : kind_(kind),
        code_(code),
        message_(std::move(message)),
        data_(std::move(data)) {
  }

  [[nodiscard]] auto ToJson() const -> nlohmann::json {
    nlohmann::json json;
    json["code"] = code_;
    json["message"] = message_;
    if (data_.has_value()) {
      json["data"] = *data_;
    }
    return json;
  }

  [[nodiscard]] auto Kind() const -> ErrorKind {
    return kind_;
  }

  [[nodiscard]] auto Code() const -> int {
    return code_;
  }

  [[nodiscard]] auto Message() const -> std::string_view {
    return message_;
  }

  [[nodiscard]] auto Data() const -> const std::optional<nlohmann::json>& {
    return data_;
  }

  auto operator==(const BridgeError& other) const -> bool {
    return Kind() == other.Kind() && Code() == other.Code() &&
           Message() == other.Message();
  }

  auto operator!=(const BridgeError& other) const -> bool {
    return !(*this == other);
  }

  static auto FromKind(ErrorKind kind, std::string message = "")
      -> BridgeError {
    if (message.empty()) {
      message = std::string(detail::DefaultMessageFor(kind));
    }
    return {
        kind, static_cast<int>(detail::DefaultCodeFor(kind)),
        std::move(message)};
  }

  static auto UnexpectedFromKind(ErrorKind kind, std::string message = "")
      -> std::unexpected<BridgeError> {
    return std::unexpected(FromKind(kind, std::move(message)));
  }

  /// Builds a kRpcError from a JSON-RPC `error` object sent by the process.
  static auto FromErrorObject(const nlohmann::json& error) -> BridgeError {
    int code = static_cast<int>(ErrorCode::kServerError);
    std::string message(detail::DefaultMessageFor(ErrorKind::kRpcError));
    std::optional<nlohmann::json> data;

    if (error.is_object()) {
      if (error.contains("code") && error["code"].is_number_integer()) {
        code = error["code"].get<int>();
      }
      if (error.contains("message") && error["message"].is_string()) {
        message = error["message"].get<std::string>();
      }
      if (error.contains("data")) {
        data = error["data"];
      }
    }
    return {ErrorKind::kRpcError, code, std::move(message), std::move(data)};
  }

 private:
  ErrorKind kind_;
  int code_;
  std::string message_;
  std::optional<nlohmann::json> data_;
};

inline auto Ok() -> std::expected<void, BridgeError> {
  return {};
}

}  // namespace mcpbridge::error
