#pragma once

#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

#include "mcpbridge/bridge/pending_table.hpp"
#include "mcpbridge/message/response.hpp"

namespace mcpbridge::bridge {

enum class RouteOutcome {
  // A waiting call received its response.
  kResolved,
  // Well-formed response for an id nobody is waiting for.
  kDiscarded,
  // Malformed response whose id matched a waiting call; that call failed.
  kFailedCall,
  // Malformed line with no waiting call to attribute it to.
  kDropped,
  // The process sent a notification.
  kNotification,
  // The process sent a request; `reply` carries the rejection.
  kRejectedRequest,
};

struct RouteResult {
  RouteOutcome outcome;
  std::optional<message::Response> reply;
};

/**
 * @brief Handles one line read from the MCP process.
 *
 * @param pending Table of calls waiting for a response
 * @param line The line, without its newline terminator
 * @param logger Logger for dropped and discarded lines
 * @return What happened to the line, plus a reply to write back to the
 * process when it made a request of its own
 */
auto RouteLine(
    PendingTable &pending, std::string_view line, spdlog::logger &logger)
    -> RouteResult;

}  // namespace mcpbridge::bridge
