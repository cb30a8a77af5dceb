#include <cstdint>

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "mcpbridge/message/request.hpp"

using mcpbridge::error::ErrorKind;
using mcpbridge::message::Notification;
using mcpbridge::message::Request;
using mcpbridge::message::RequestId;

TEST_CASE("Request serialization", "[Request]") {
  SECTION("With params") {
    Request request("tools/list", nlohmann::json{{"cursor", "a"}}, 7);
    auto json = request.ToJson();

    REQUIRE(json["jsonrpc"] == "2.0");
    REQUIRE(json["method"] == "tools/list");
    REQUIRE(json["params"]["cursor"] == "a");
    REQUIRE(json["id"] == 7);
  }

  SECTION("Without params") {
    Request request("ping", std::nullopt, RequestId{"abc"});
    auto json = request.ToJson();

    REQUIRE_FALSE(json.contains("params"));
    REQUIRE(json["id"] == "abc");
  }
}

TEST_CASE("Request deserialization", "[Request]") {
  SECTION("Valid request") {
    nlohmann::json json = {
        {"jsonrpc", "2.0"},
        {"method", "tools/call"},
        {"params", {{"name", "x"}}},
        {"id", 3}};
    auto request = Request::FromJson(json);

    REQUIRE(request.has_value());
    REQUIRE(request->GetMethod() == "tools/call");
    REQUIRE(request->GetParams().has_value());
    REQUIRE(std::get<int64_t>(request->GetId()) == 3);
  }

  SECTION("Missing version") {
    nlohmann::json json = {{"method", "x"}, {"id", 1}};
    auto request = Request::FromJson(json);

    REQUIRE_FALSE(request.has_value());
    REQUIRE(request.error().Kind() == ErrorKind::kInvalidRequest);
  }

  SECTION("Method must be a string") {
    nlohmann::json json = {{"jsonrpc", "2.0"}, {"method", 5}, {"id", 1}};
    REQUIRE_FALSE(Request::FromJson(json).has_value());
  }

  SECTION("Params must be structured") {
    nlohmann::json json = {
        {"jsonrpc", "2.0"}, {"method", "x"}, {"params", 5}, {"id", 1}};
    REQUIRE_FALSE(Request::FromJson(json).has_value());
  }

  SECTION("Id must be a string or an integer") {
    nlohmann::json json = {
        {"jsonrpc", "2.0"}, {"method", "x"}, {"id", {{"nested", 1}}}};
    REQUIRE_FALSE(Request::FromJson(json).has_value());
  }

  SECTION("Integer ids must fit in int64") {
    nlohmann::json json = {
        {"jsonrpc", "2.0"},
        {"method", "x"},
        {"id", 18446744073709551615ULL}};
    auto request = Request::FromJson(json);
    REQUIRE_FALSE(request.has_value());
    REQUIRE(request.error().Kind() == ErrorKind::kInvalidRequest);

    json["id"] = static_cast<uint64_t>(9223372036854775807ULL);
    auto largest = Request::FromJson(json);
    REQUIRE(largest.has_value());
    REQUIRE(std::get<int64_t>(largest->GetId()) == 9223372036854775807LL);
  }

  SECTION("Missing id") {
    nlohmann::json json = {{"jsonrpc", "2.0"}, {"method", "x"}};
    REQUIRE_FALSE(Request::FromJson(json).has_value());
  }
}

TEST_CASE("Notification round trip", "[Notification]") {
  SECTION("Serialization has no id") {
    Notification notification(
        "notifications/initialized", nlohmann::json::object());
    auto json = notification.ToJson();

    REQUIRE(json["method"] == "notifications/initialized");
    REQUIRE_FALSE(json.contains("id"));
  }

  SECTION("Deserialization rejects an id") {
    nlohmann::json json = {{"jsonrpc", "2.0"}, {"method", "x"}, {"id", 1}};
    auto notification = Notification::FromJson(json);

    REQUIRE_FALSE(notification.has_value());
    REQUIRE(notification.error().Kind() == ErrorKind::kInvalidRequest);
  }

  SECTION("Deserialization of a valid notification") {
    nlohmann::json json = {{"jsonrpc", "2.0"}, {"method", "cancel"}};
    auto notification = Notification::FromJson(json);

    REQUIRE(notification.has_value());
    REQUIRE(notification->GetMethod() == "cancel");
    REQUIRE_FALSE(notification->GetParams().has_value());
  }
}
