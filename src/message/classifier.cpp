#include "mcpbridge/message/classifier.hpp"

namespace mcpbridge::message {

using error::BridgeError;
using error::ErrorKind;

namespace {
auto Malformed(std::string message, std::optional<RequestId> id = std::nullopt)
    -> std::unexpected<MalformedMessage> {
  return std::unexpected(MalformedMessage{
      .error = BridgeError::FromKind(
          ErrorKind::kMalformedMessage, std::move(message)),
      .id = std::move(id)});
}
}  // namespace

auto MessageClassifier::Classify(const nlohmann::json& message)
    -> MessageKind {
  if (message.contains("method")) {
    return message.contains("id") ? MessageKind::kRequest
                                  : MessageKind::kNotification;
  }
  if (message.contains("id")) {
    return MessageKind::kResponse;
  }
  return MessageKind::kNotification;
}

auto MessageClassifier::Parse(std::string_view line)
    -> std::expected<JsonRpcMessage, MalformedMessage> {
  const auto json = nlohmann::json::parse(line, nullptr, false);
  if (json.is_discarded()) {
    return Malformed("Line is not valid JSON");
  }
  if (!json.is_object()) {
    return Malformed("JSON-RPC message must be an object");
  }

  switch (Classify(json)) {
    case MessageKind::kResponse: {
      auto id = RequestIdFromJson(json["id"]);
      auto response = Response::FromJson(json);
      if (!response) {
        return Malformed(std::string(response.error().Message()), id);
      }
      if (!id && !json["id"].is_null()) {
        return Malformed("Invalid 'id' type");
      }
      return std::move(*response);
    }
    case MessageKind::kRequest: {
      auto request = Request::FromJson(json);
      if (!request) {
        return Malformed(std::string(request.error().Message()));
      }
      return std::move(*request);
    }
    case MessageKind::kNotification: {
      auto notification = Notification::FromJson(json);
      if (!notification) {
        return Malformed(std::string(notification.error().Message()));
      }
      return std::move(*notification);
    }
  }

  return Malformed("Unclassifiable message");
}

}  // namespace mcpbridge::message
