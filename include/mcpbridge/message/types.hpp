#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace mcpbridge::message {

constexpr std::string_view kJsonRpcVersion = "2.0";

using RequestId = std::variant<int64_t, std::string>;

constexpr auto kDefaultCallTimeout = std::chrono::milliseconds(30000);

constexpr size_t kDefaultMaxBatchSize = 100;

/// Reads a JSON-RPC id. Only strings and integers that fit in int64_t are
/// valid ids.
inline auto RequestIdFromJson(const nlohmann::json& id)
    -> std::optional<RequestId> {
  if (id.is_string()) {
    return id.get<std::string>();
  }
  if (id.is_number_unsigned() &&
      id.get<uint64_t>() >
          static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    return std::nullopt;
  }
  if (id.is_number_integer()) {
    return id.get<int64_t>();
  }
  return std::nullopt;
}

inline auto RequestIdToJson(const RequestId& id) -> nlohmann::json {
  return std::visit([](const auto& v) { return nlohmann::json(v); }, id);
}

inline auto RequestIdToString(const RequestId& id) -> std::string {
  if (std::holds_alternative<int64_t>(id)) {
    return std::to_string(std::get<int64_t>(id));
  }
  return "\"" + std::get<std::string>(id) + "\"";
}

}  // namespace mcpbridge::message
