#include <asio.hpp>
#include <catch2/catch_test_macros.hpp>

#include "../common/test_utils.hpp"
#include "mcpbridge/bridge/response_router.hpp"

using mcpbridge::bridge::PendingTable;
using mcpbridge::bridge::RouteLine;
using mcpbridge::bridge::RouteOutcome;
using mcpbridge::error::ErrorKind;
using mcpbridge::testing::RunTest;
using mcpbridge::testing::TestLogger;

TEST_CASE("RouteLine resolves matching responses", "[RouteLine]") {
  RunTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    PendingTable table(executor);
    auto handle = table.Register(1);

    auto routed = RouteLine(
        table, R"({"jsonrpc":"2.0","id":1,"result":{"ok":true}})",
        *TestLogger());
    REQUIRE(routed.outcome == RouteOutcome::kResolved);
    REQUIRE_FALSE(routed.reply.has_value());

    auto outcome = co_await (*handle)->Wait();
    REQUIRE((*outcome)->GetResult()["ok"] == true);
  });
}

TEST_CASE("RouteLine discards what nobody waits for", "[RouteLine]") {
  asio::io_context io_ctx;
  PendingTable table(io_ctx.get_executor());
  auto handle = table.Register(1);
  auto logger = TestLogger();

  SECTION("Stray response id") {
    auto routed = RouteLine(
        table, R"({"jsonrpc":"2.0","id":987654,"result":1})", *logger);
    REQUIRE(routed.outcome == RouteOutcome::kDiscarded);
  }

  SECTION("Response with a null id") {
    auto routed = RouteLine(
        table,
        R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"x"}})",
        *logger);
    REQUIRE(routed.outcome == RouteOutcome::kDiscarded);
  }

  SECTION("Log output that is not JSON") {
    auto routed = RouteLine(table, "Starting MCP server...", *logger);
    REQUIRE(routed.outcome == RouteOutcome::kDropped);
  }

  SECTION("Malformed response for an unknown id") {
    auto routed = RouteLine(table, R"({"jsonrpc":"2.0","id":55})", *logger);
    REQUIRE(routed.outcome == RouteOutcome::kDropped);
  }

  REQUIRE(table.Contains(1));
  REQUIRE_FALSE((*handle)->IsFulfilled());
}

TEST_CASE("RouteLine fails a call on its malformed response", "[RouteLine]") {
  RunTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    PendingTable table(executor);
    auto handle = table.Register(4);

    auto routed =
        RouteLine(table, R"({"jsonrpc":"2.0","id":4})", *TestLogger());
    REQUIRE(routed.outcome == RouteOutcome::kFailedCall);
    REQUIRE(table.Empty());

    auto outcome = co_await (*handle)->Wait();
    REQUIRE_FALSE(outcome->has_value());
    REQUIRE(outcome->error().Kind() == ErrorKind::kMalformedMessage);
  });
}

TEST_CASE("RouteLine handles process-initiated messages", "[RouteLine]") {
  asio::io_context io_ctx;
  PendingTable table(io_ctx.get_executor());
  auto logger = TestLogger();

  SECTION("Notifications are dropped") {
    auto routed = RouteLine(
        table, R"({"jsonrpc":"2.0","method":"notifications/message"})",
        *logger);
    REQUIRE(routed.outcome == RouteOutcome::kNotification);
    REQUIRE_FALSE(routed.reply.has_value());
  }

  SECTION("Requests are rejected with method not found") {
    auto routed = RouteLine(
        table, R"({"jsonrpc":"2.0","id":"cb-1","method":"roots/list"})",
        *logger);
    REQUIRE(routed.outcome == RouteOutcome::kRejectedRequest);
    REQUIRE(routed.reply.has_value());

    auto reply = routed.reply->ToJson();
    REQUIRE(reply["id"] == "cb-1");
    REQUIRE(reply["error"]["code"] == -32601);
  }
}
