#include <sstream>
#include <string>

#include <asio.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "mcpbridge/http/http_codec.hpp"

using mcpbridge::http::HttpCodec;
using mcpbridge::http::HttpError;
using mcpbridge::http::HttpRequest;
using mcpbridge::http::HttpResponse;

namespace {

// Helper to parse a full request the way a connection does.
auto ProcessRequest(const std::string &raw) -> HttpRequest {
  asio::streambuf buffer;
  std::ostream os(&buffer);
  os << raw;

  auto request = HttpCodec::ReadRequestHead(buffer);
  auto length = HttpCodec::ReadContentLength(request.headers);
  request.body = HttpCodec::ReadContent(buffer, length.value_or(0));
  return request;
}

auto StatusOf(const std::string &raw) -> int {
  try {
    ProcessRequest(raw);
  } catch (const HttpError &ex) {
    return ex.Status();
  }
  return 0;
}

}  // namespace

TEST_CASE("HttpCodec parses a POST request", "[HttpCodec]") {
  std::string body = R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})";
  auto request = ProcessRequest(
      "POST /mcp HTTP/1.1\r\n"
      "Host: localhost:8000\r\n"
      "Content-Type: application/json\r\n"
      "Content-Length: " +
      std::to_string(body.size()) +
      "\r\n"
      "\r\n" +
      body);

  REQUIRE(request.method == "POST");
  REQUIRE(request.target == "/mcp");
  REQUIRE(request.version == "HTTP/1.1");
  REQUIRE(request.headers.size() == 3);
  REQUIRE(request.headers["host"] == "localhost:8000");
  REQUIRE(request.headers["content-type"] == "application/json");
  REQUIRE(request.body == body);
}

TEST_CASE("HttpCodec leaves pipelined bytes in the buffer", "[HttpCodec]") {
  asio::streambuf buffer;
  std::ostream os(&buffer);
  os << "POST /mcp HTTP/1.1\r\nContent-Length: 2\r\n\r\n{}"
     << "GET /health HTTP/1.1\r\n\r\n";

  auto first = HttpCodec::ReadRequestHead(buffer);
  first.body = HttpCodec::ReadContent(buffer, 2);
  REQUIRE(first.body == "{}");

  auto second = HttpCodec::ReadRequestHead(buffer);
  REQUIRE(second.method == "GET");
  REQUIRE(second.target == "/health");
  REQUIRE(buffer.size() == 0);
}

TEST_CASE("HttpCodec lower-cases header names", "[HttpCodec]") {
  std::istringstream input(
      "X-Custom-Header:  spaced value  \r\nCONNECTION: Close\r\n\r\n");
  auto headers = HttpCodec::ReadHeaders(input);

  REQUIRE(headers.size() == 2);
  REQUIRE(headers["x-custom-header"] == "spaced value");
  REQUIRE(headers["connection"] == "Close");
}

TEST_CASE("HttpRequest path and keep-alive", "[HttpCodec]") {
  HttpRequest request;
  request.target = "/health?verbose=1";
  request.version = "HTTP/1.1";
  REQUIRE(request.Path() == "/health");
  REQUIRE(request.KeepAlive());

  request.headers["connection"] = "close";
  REQUIRE_FALSE(request.KeepAlive());

  request.version = "HTTP/1.0";
  request.headers.clear();
  REQUIRE_FALSE(request.KeepAlive());

  request.headers["connection"] = "Keep-Alive";
  REQUIRE(request.KeepAlive());
}

TEST_CASE("HttpCodec rejects malformed requests", "[HttpCodec]") {
  REQUIRE(StatusOf("GARBAGE\r\n\r\n") == 400);
  REQUIRE(StatusOf("GET /health SPDY/3\r\n\r\n") == 400);
  REQUIRE(StatusOf("GET /health HTTP/1.1\r\nno colon here\r\n\r\n") == 400);
  REQUIRE(StatusOf("GET /health HTTP/1.1\r\n: value\r\n\r\n") == 400);
}

TEST_CASE("HttpCodec refuses chunked bodies", "[HttpCodec]") {
  REQUIRE(
      StatusOf(
          "POST /mcp HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"
          "2\r\n{}\r\n0\r\n\r\n") == 411);
}

TEST_CASE("HttpCodec reports a missing Content-Length", "[HttpCodec]") {
  asio::streambuf buffer;
  std::ostream os(&buffer);
  os << "GET /health HTTP/1.1\r\n\r\n";

  auto request = HttpCodec::ReadRequestHead(buffer);
  REQUIRE_FALSE(HttpCodec::ReadContentLength(request.headers).has_value());
}

TEST_CASE("HttpCodec validates Content-Length", "[HttpCodec]") {
  REQUIRE(HttpCodec::ParseContentLength("0") == 0);
  REQUIRE(HttpCodec::ParseContentLength("1234") == 1234);

  REQUIRE_THROWS_WITH(
      HttpCodec::ParseContentLength("invalid"), "Invalid Content-Length value");
  REQUIRE_THROWS_WITH(
      HttpCodec::ParseContentLength("-5"), "Invalid Content-Length value");
  REQUIRE_THROWS_WITH(
      HttpCodec::ParseContentLength("12abc"), "Invalid Content-Length value");
  REQUIRE_THROWS_WITH(
      HttpCodec::ParseContentLength(""), "Invalid Content-Length value");
  REQUIRE_THROWS_WITH(
      HttpCodec::ParseContentLength("9999999999999999999999"),
      "Content-Length value out of range");
  REQUIRE_THROWS_WITH(
      HttpCodec::ParseContentLength(
          std::to_string(HttpCodec::kMaxBodyBytes + 1)),
      "Request body too large");
}

TEST_CASE("HttpCodec fails on a short body", "[HttpCodec]") {
  REQUIRE(
      StatusOf("POST /mcp HTTP/1.1\r\nContent-Length: 10\r\n\r\n{}") ==
      400);
}

TEST_CASE("HttpCodec writes a JSON response", "[HttpCodec]") {
  std::ostringstream output;
  HttpResponse response;
  response.body = R"({"ok":true})";

  HttpCodec::WriteResponse(output, response);

  REQUIRE(
      output.str() ==
      "HTTP/1.1 200 OK\r\n"
      "Content-Type: application/json\r\n"
      "Content-Length: 11\r\n"
      "Connection: keep-alive\r\n"
      "\r\n"
      R"({"ok":true})");
}

TEST_CASE("HttpCodec writes an empty 202", "[HttpCodec]") {
  std::ostringstream output;
  HttpResponse response;
  response.status = 202;
  response.keep_alive = false;

  HttpCodec::WriteResponse(output, response);

  REQUIRE(
      output.str() ==
      "HTTP/1.1 202 Accepted\r\n"
      "Content-Length: 0\r\n"
      "Connection: close\r\n"
      "\r\n");
}

TEST_CASE("HttpCodec writes extra headers", "[HttpCodec]") {
  std::ostringstream output;
  HttpResponse response;
  response.status = 405;
  response.body = R"({"error":"Method Not Allowed"})";
  response.extra_headers["Allow"] = "POST";

  HttpCodec::WriteResponse(output, response);

  REQUIRE_THAT(
      output.str(),
      Catch::Matchers::StartsWith("HTTP/1.1 405 Method Not Allowed\r\n") &&
          Catch::Matchers::ContainsSubstring("Allow: POST\r\n"));
}

TEST_CASE("HttpCodec reason phrases", "[HttpCodec]") {
  REQUIRE(HttpCodec::ReasonPhrase(503) == "Service Unavailable");
  REQUIRE(HttpCodec::ReasonPhrase(504) == "Gateway Timeout");
  REQUIRE(HttpCodec::ReasonPhrase(599) == "Unknown");
}
