#pragma once

#include <expected>
#include <optional>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "mcpbridge/error/error.hpp"
#include "mcpbridge/message/request.hpp"
#include "mcpbridge/message/response.hpp"
#include "mcpbridge/message/types.hpp"

namespace mcpbridge::message {

using JsonRpcMessage = std::variant<Request, Response, Notification>;

enum class MessageKind {
  kRequest,
  kResponse,
  kNotification,
};

/**
 * @brief A line that could not be turned into a JsonRpcMessage.
 *
 * When the line was response-shaped (no `method`) and carried a usable `id`,
 * `id` is set so the pending call it belongs to can be failed instead of
 * left waiting.
 */
struct MalformedMessage {
  error::BridgeError error;
  std::optional<RequestId> id;
};

class MessageClassifier {
 public:
  /**
   * @brief Parses one line of process output.
   *
   * @param line A single line without its newline terminator.
   * @return The classified message, or a MalformedMessage when the line is
   * not valid JSON or lacks required JSON-RPC fields.
   */
  static auto Parse(std::string_view line)
      -> std::expected<JsonRpcMessage, MalformedMessage>;

  /**
   * @brief Classifies an already parsed JSON object.
   *
   * `method` with `id` is a Request, `id` without `method` is a Response and
   * anything without an `id` is a Notification.
   */
  static auto Classify(const nlohmann::json& message) -> MessageKind;
};

}  // namespace mcpbridge::message
