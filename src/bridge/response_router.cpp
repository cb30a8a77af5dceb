#include "mcpbridge/bridge/response_router.hpp"

#include "mcpbridge/message/classifier.hpp"
#include "mcpbridge/utils/string_utils.hpp"

namespace mcpbridge::bridge {

using message::MessageClassifier;
using message::Notification;
using message::Request;
using message::Response;

auto RouteLine(
    PendingTable &pending, std::string_view line, spdlog::logger &logger)
    -> RouteResult {
  logger.debug("Routing line: {}", utils::Preview(line));

  auto parsed = MessageClassifier::Parse(line);
  if (!parsed) {
    auto &malformed = parsed.error();
    if (malformed.id && pending.Fail(*malformed.id, malformed.error)) {
      logger.warn(
          "Malformed response for id {}: {}",
          message::RequestIdToString(*malformed.id), malformed.error.Message());
      return {.outcome = RouteOutcome::kFailedCall, .reply = std::nullopt};
    }
    logger.warn(
        "Dropping malformed line from MCP process ({}): {}",
        malformed.error.Message(), utils::Preview(line));
    return {.outcome = RouteOutcome::kDropped, .reply = std::nullopt};
  }

  if (auto *response = std::get_if<Response>(&*parsed)) {
    auto id = response->GetId();
    if (!id) {
      logger.warn(
          "Dropping response without id: {}", utils::Preview(line));
      return {.outcome = RouteOutcome::kDiscarded, .reply = std::nullopt};
    }
    if (!pending.Resolve(*id, std::move(*response))) {
      return {.outcome = RouteOutcome::kDiscarded, .reply = std::nullopt};
    }
    return {.outcome = RouteOutcome::kResolved, .reply = std::nullopt};
  }

  if (auto *notification = std::get_if<Notification>(&*parsed)) {
    logger.info(
        "MCP process notification: {}", notification->GetMethod());
    return {.outcome = RouteOutcome::kNotification, .reply = std::nullopt};
  }

  const auto &request = std::get<Request>(*parsed);
  logger.warn(
      "Rejecting request '{}' (id {}) from MCP process: callbacks are not "
      "supported",
      request.GetMethod(), message::RequestIdToString(request.GetId()));
  return {
      .outcome = RouteOutcome::kRejectedRequest,
      .reply = Response::CreateError(
          error::ErrorCode::kMethodNotFound, request.GetId())};
}

}  // namespace mcpbridge::bridge
