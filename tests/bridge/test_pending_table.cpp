#include <asio.hpp>
#include <catch2/catch_test_macros.hpp>

#include "../common/test_utils.hpp"
#include "mcpbridge/bridge/pending_table.hpp"

using mcpbridge::bridge::PendingTable;
using mcpbridge::error::BridgeError;
using mcpbridge::error::ErrorKind;
using mcpbridge::message::RequestId;
using mcpbridge::message::Response;
using mcpbridge::testing::RunTest;

TEST_CASE("PendingTable registers unique ids", "[PendingTable]") {
  asio::io_context io_ctx;
  PendingTable table(io_ctx.get_executor());

  auto first = table.Register(1);
  REQUIRE(first.has_value());
  REQUIRE(table.Contains(1));
  REQUIRE(table.Size() == 1);

  auto duplicate = table.Register(1);
  REQUIRE_FALSE(duplicate.has_value());
  REQUIRE(duplicate.error().Kind() == ErrorKind::kDuplicateId);

  // The original call is untouched by the duplicate.
  REQUIRE(table.Size() == 1);
  REQUIRE_FALSE((*first)->IsFulfilled());
}

TEST_CASE("PendingTable resolves the waiting caller", "[PendingTable]") {
  RunTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    PendingTable table(executor);
    auto handle = table.Register(7);
    REQUIRE(handle.has_value());

    REQUIRE(table.Resolve(
        RequestId{int64_t{7}},
        Response::CreateSuccess("done", RequestId{int64_t{7}})));
    REQUIRE(table.Empty());

    auto outcome = co_await (*handle)->Wait();
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->has_value());
    REQUIRE((*outcome)->GetResult() == "done");
  });
}

TEST_CASE("PendingTable discards unknown ids", "[PendingTable]") {
  asio::io_context io_ctx;
  PendingTable table(io_ctx.get_executor());
  auto handle = table.Register(1);

  SECTION("Integer id never registered") {
    REQUIRE_FALSE(table.Resolve(
        RequestId{int64_t{99}}, Response::CreateSuccess(1, std::nullopt)));
  }

  SECTION("String id never matches a bridge id") {
    REQUIRE_FALSE(table.Resolve(
        RequestId{"1"}, Response::CreateSuccess(1, std::nullopt)));
  }

  SECTION("Second resolve of the same id") {
    REQUIRE(table.Resolve(
        RequestId{int64_t{1}}, Response::CreateSuccess(1, std::nullopt)));
    REQUIRE_FALSE(table.Resolve(
        RequestId{int64_t{1}}, Response::CreateSuccess(2, std::nullopt)));
  }

  REQUIRE_FALSE(table.Contains(99));
}

TEST_CASE("PendingTable removes timed out calls", "[PendingTable]") {
  asio::io_context io_ctx;
  PendingTable table(io_ctx.get_executor());
  auto handle = table.Register(3);

  REQUIRE(table.Remove(3));
  REQUIRE_FALSE(table.Remove(3));
  REQUIRE_FALSE(table.Resolve(
      RequestId{int64_t{3}}, Response::CreateSuccess(1, std::nullopt)));
  REQUIRE_FALSE((*handle)->IsFulfilled());
}

TEST_CASE("PendingTable fails a single call", "[PendingTable]") {
  RunTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    PendingTable table(executor);
    auto failed = table.Register(1);
    auto other = table.Register(2);

    REQUIRE(table.Fail(
        RequestId{int64_t{1}},
        BridgeError::FromKind(ErrorKind::kMalformedMessage)));
    REQUIRE(table.Contains(2));

    auto outcome = co_await (*failed)->Wait();
    REQUIRE(outcome.has_value());
    REQUIRE_FALSE(outcome->has_value());
    REQUIRE(outcome->error().Kind() == ErrorKind::kMalformedMessage);
  });
}

TEST_CASE("PendingTable FailAll empties the table", "[PendingTable]") {
  RunTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    PendingTable table(executor);
    std::vector<std::shared_ptr<mcpbridge::bridge::CompletionHandle>> handles;
    for (int64_t id = 1; id <= 5; ++id) {
      handles.push_back(*table.Register(id));
    }

    auto failed =
        table.FailAll(BridgeError::FromKind(ErrorKind::kProcessDown));
    REQUIRE(failed == 5);
    REQUIRE(table.Empty());

    for (auto &handle : handles) {
      auto outcome = co_await handle->Wait();
      REQUIRE(outcome.has_value());
      REQUIRE(outcome->error().Kind() == ErrorKind::kProcessDown);
    }
  });
}

TEST_CASE("PendingTable sweeps abandoned entries", "[PendingTable]") {
  asio::io_context io_ctx;
  PendingTable table(io_ctx.get_executor());

  auto kept = table.Register(1);
  {
    auto abandoned = table.Register(2);
  }

  REQUIRE(table.Sweep() == 1);
  REQUIRE(table.Contains(1));
  REQUIRE_FALSE(table.Contains(2));
}

TEST_CASE("PendingTable wait times out without a response", "[PendingTable]") {
  RunTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    PendingTable table(executor);
    auto handle = table.Register(1);

    auto outcome = co_await (*handle)->Wait(std::chrono::milliseconds(20));
    REQUIRE_FALSE(outcome.has_value());
    REQUIRE(table.Remove(1));
  });
}
