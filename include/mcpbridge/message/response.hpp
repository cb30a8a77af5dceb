#pragma once

#include <expected>
#include <optional>

#include <nlohmann/json.hpp>

#include "mcpbridge/error/error.hpp"
#include "mcpbridge/message/types.hpp"

namespace mcpbridge::message {

class Response {
 public:
  Response() = default;
  Response(const Response&) = default;
  Response(Response&& other) = default;
  auto operator=(const Response&) -> Response& = default;
  auto operator=(Response&& other) noexcept -> Response& = default;

  ~Response() = default;

  static auto FromJson(const nlohmann::json& json)
      -> std::expected<Response, error::BridgeError>;

  static auto CreateSuccess(
      const nlohmann::json& result, const std::optional<RequestId>& id)
      -> Response;

  static auto CreateError(
      error::ErrorCode code, const std::optional<RequestId>& id = std::nullopt)
      -> Response;

  static auto CreateError(
      const error::BridgeError& error,
      const std::optional<RequestId>& id = std::nullopt) -> Response;

  static auto CreateError(
      const nlohmann::json& error, const std::optional<RequestId>& id)
      -> Response;

  [[nodiscard]] auto IsSuccess() const -> bool;

  [[nodiscard]] auto GetResult() const -> const nlohmann::json&;

  [[nodiscard]] auto GetError() const -> const nlohmann::json&;

  [[nodiscard]] auto GetId() const -> std::optional<RequestId>;

  [[nodiscard]] auto ToJson() const -> nlohmann::json;

 private:
  explicit Response(nlohmann::json response) : response_(std::move(response)) {
  }

  [[nodiscard]] auto ValidateResponse() const
      -> std::expected<void, error::BridgeError>;

  nlohmann::json response_;
};

}  // namespace mcpbridge::message

namespace nlohmann {
template <>
struct adl_serializer<mcpbridge::message::Response> {
  static void to_json(json& j, const mcpbridge::message::Response& r) {
    j = r.ToJson();
  }
};
}  // namespace nlohmann
