#include <thread>

#include <asio.hpp>
#include <catch2/catch_test_macros.hpp>

#include "../common/test_utils.hpp"
#include "mcpbridge/bridge/completion.hpp"

using mcpbridge::bridge::Completion;
using mcpbridge::testing::RunTest;

TEST_CASE("Completion delivers the first value only", "[Completion]") {
  RunTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    Completion<int> completion(executor);

    REQUIRE(completion.Fulfill(1));
    REQUIRE_FALSE(completion.Fulfill(2));
    REQUIRE(completion.IsFulfilled());

    auto value = co_await completion.Wait();
    REQUIRE(value == 1);
  });
}

TEST_CASE("Completion wakes a suspended waiter", "[Completion]") {
  RunTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto completion = std::make_shared<Completion<std::string>>(executor);

    std::thread producer([completion]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      completion->Fulfill("from another thread");
    });

    auto value = co_await completion->Wait(std::chrono::seconds(5));
    producer.join();
    REQUIRE(value == "from another thread");
  });
}

TEST_CASE("Completion wait honours its timeout", "[Completion]") {
  RunTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    Completion<int> completion(executor);

    auto start = std::chrono::steady_clock::now();
    auto value = co_await completion.Wait(std::chrono::milliseconds(30));
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(value.has_value());
    REQUIRE(elapsed >= std::chrono::milliseconds(30));
  });
}

TEST_CASE("Completion close releases the waiter", "[Completion]") {
  RunTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    Completion<int> completion(executor);
    completion.Close();

    auto value = co_await completion.Wait();
    REQUIRE_FALSE(value.has_value());
    REQUIRE_FALSE(completion.Fulfill(3));
  });
}
