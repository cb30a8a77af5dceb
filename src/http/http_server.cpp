#include "mcpbridge/http/http_server.hpp"

#include <algorithm>

#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "mcpbridge/message/response.hpp"

namespace mcpbridge::http {

using error::BridgeError;
using error::ErrorKind;

namespace {

auto JsonResponse(int status, const nlohmann::json &body) -> HttpResponse {
  return HttpResponse{
      .status = status,
      .content_type = "application/json",
      .body = body.dump(
          -1, ' ', false, nlohmann::json::error_handler_t::replace),
      .extra_headers = {},
      .keep_alive = true};
}

auto ErrorResponse(int status, std::string_view message) -> HttpResponse {
  return JsonResponse(status, {{"error", std::string(message)}});
}

auto MethodNotAllowed(std::string allowed) -> HttpResponse {
  auto response = ErrorResponse(405, "Method Not Allowed");
  response.extra_headers["Allow"] = std::move(allowed);
  return response;
}

}  // namespace

auto StatusForFailure(std::optional<ErrorKind> failure) -> int {
  if (!failure) {
    return 200;
  }
  switch (*failure) {
    case ErrorKind::kRpcError:
      return 200;
    case ErrorKind::kInvalidRequest:
      return 400;
    case ErrorKind::kProcessDown:
      return 503;
    case ErrorKind::kTimeout:
      return 504;
    case ErrorKind::kWriteError:
    case ErrorKind::kMalformedMessage:
      return 502;
    case ErrorKind::kDuplicateId:
    case ErrorKind::kConfigError:
      return 500;
  }
  return 500;
}

HttpServer::HttpServer(
    asio::any_io_executor executor, std::string address, uint16_t port,
    bridge::RpcBridge &bridge, std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      executor_(std::move(executor)),
      strand_(asio::make_strand(executor_)),
      acceptor_(strand_),
      address_(std::move(address)),
      port_(port),
      bridge_(bridge) {
}

HttpServer::~HttpServer() {
  if (acceptor_.is_open()) {
    Logger()->debug("HttpServer destructor closing acceptor");
    asio::error_code ec;
    acceptor_.close(ec);
    if (ec) {
      Logger()->warn("HttpServer error closing acceptor: {}", ec.message());
    }
  }
}

auto HttpServer::Start()
    -> asio::awaitable<std::expected<void, BridgeError>> {
  Logger()->debug("HttpServer binding to {}:{}", address_, port_);

  asio::error_code ec;
  asio::ip::tcp::resolver resolver(executor_);
  auto results = co_await resolver.async_resolve(
      address_, std::to_string(port_),
      asio::redirect_error(asio::use_awaitable, ec));
  if (ec || results.empty()) {
    co_return BridgeError::UnexpectedFromKind(
        ErrorKind::kConfigError,
        "Cannot resolve " + address_ + ": " + ec.message());
  }
  asio::ip::tcp::endpoint endpoint = *results.begin();

  auto fail = [&](std::string_view step) {
    Logger()->error(
        "HttpServer error {} {}:{}: {}", step, address_, port_, ec.message());
    return BridgeError::UnexpectedFromKind(
        ErrorKind::kConfigError,
        fmt::format(
            "Failed to listen on {}:{}: {}", address_, port_, ec.message()));
  };

  acceptor_.open(endpoint.protocol(), ec);
  if (ec) {
    co_return fail("opening acceptor for");
  }

  acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
  if (ec) {
    co_return fail("setting reuse_address for");
  }

  acceptor_.bind(endpoint, ec);
  if (ec) {
    co_return fail("binding");
  }

  acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if (ec) {
    co_return fail("listening on");
  }

  local_port_ = acceptor_.local_endpoint(ec).port();
  Logger()->info("HTTP server listening on {}:{}", address_, LocalPort());
  co_return error::Ok();
}

auto HttpServer::Run() -> asio::awaitable<void> {
  while (!is_stopped_ && acceptor_.is_open()) {
    asio::ip::tcp::socket socket(asio::make_strand(executor_));
    asio::error_code ec;
    co_await acceptor_.async_accept(
        socket, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
      if (ec == asio::error::operation_aborted || is_stopped_) {
        break;
      }
      Logger()->warn("HttpServer error accepting connection: {}", ec.message());
      continue;
    }

    auto socket_executor = socket.get_executor();
    asio::co_spawn(
        socket_executor, Session(std::move(socket)),
        [logger = logger_](const std::exception_ptr &eptr) {
          if (!eptr) {
            return;
          }
          try {
            std::rethrow_exception(eptr);
          } catch (const std::exception &ex) {
            logger->error("HTTP connection failed: {}", ex.what());
          }
        });
  }
  Logger()->info("HTTP server stopped");
}

void HttpServer::Stop() {
  if (is_stopped_.exchange(true)) {
    return;
  }
  Logger()->debug("HttpServer stopping");
  asio::post(strand_, [this]() {
    asio::error_code ec;
    acceptor_.cancel(ec);
    acceptor_.close(ec);
    if (ec) {
      Logger()->warn("HttpServer error closing acceptor: {}", ec.message());
    }
  });
}

auto HttpServer::Session(asio::ip::tcp::socket socket)
    -> asio::awaitable<void> {
  // Holds the request head and whatever arrived after it; bodies are read
  // into the request directly.
  asio::streambuf buffer(HttpCodec::kMaxHeaderBytes);

  while (!is_stopped_) {
    auto [ec, head_bytes] = co_await asio::async_read_until(
        socket, buffer, HttpCodec::kHeaderDelimiter,
        asio::as_tuple(asio::use_awaitable));
    if (ec && ec != asio::error::not_found) {
      if (ec != asio::error::eof && ec != asio::error::operation_aborted &&
          ec != asio::error::connection_reset) {
        Logger()->warn("HttpServer error reading request: {}", ec.message());
      }
      break;
    }

    HttpRequest request;
    std::optional<HttpResponse> rejected;
    try {
      // not_found means the buffer filled up before the head ended.
      if (ec) {
        throw HttpError(431, "Request head too large");
      }
      request = HttpCodec::ReadRequestHead(buffer);
      auto length = HttpCodec::ReadContentLength(request.headers);
      if (!length && request.method == "POST") {
        throw HttpError(411, "Content-Length required");
      }

      std::size_t body_length = length.value_or(0);
      std::size_t buffered = std::min(buffer.size(), body_length);
      request.body = HttpCodec::ReadContent(buffer, buffered);
      if (buffered < body_length) {
        request.body.resize(body_length);
        asio::error_code read_ec;
        co_await asio::async_read(
            socket,
            asio::buffer(
                request.body.data() + buffered, body_length - buffered),
            asio::redirect_error(asio::use_awaitable, read_ec));
        if (read_ec) {
          Logger()->debug(
              "HttpServer connection closed mid-body: {}", read_ec.message());
          break;
        }
      }
    } catch (const HttpError &ex) {
      Logger()->warn("HttpServer rejecting request: {}", ex.what());
      rejected = ErrorResponse(ex.Status(), ex.what());
      rejected->keep_alive = false;
    }

    HttpResponse response;
    if (rejected) {
      response = std::move(*rejected);
    } else {
      response = co_await Handle(request);
      response.keep_alive = request.KeepAlive() && !is_stopped_;
    }
    Logger()->debug(
        "HTTP {} {} -> {}", request.method, request.target, response.status);

    asio::streambuf out;
    std::ostream output(&out);
    HttpCodec::WriteResponse(output, response);

    asio::error_code write_ec;
    co_await asio::async_write(
        socket, out, asio::redirect_error(asio::use_awaitable, write_ec));
    if (write_ec) {
      Logger()->warn(
          "HttpServer error writing response: {}", write_ec.message());
      break;
    }
    if (!response.keep_alive) {
      break;
    }
  }

  asio::error_code ec;
  socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  socket.close(ec);
}

auto HttpServer::Handle(const HttpRequest &request)
    -> asio::awaitable<HttpResponse> {
  auto path = request.Path();

  if (path == "/mcp") {
    if (request.method != "POST") {
      co_return MethodNotAllowed("POST");
    }
    co_return co_await HandleRpc(request);
  }

  if (path == "/health") {
    if (request.method != "GET") {
      co_return MethodNotAllowed("GET");
    }
    co_return HandleHealth();
  }

  co_return ErrorResponse(404, "Not Found");
}

auto HttpServer::HandleRpc(const HttpRequest &request)
    -> asio::awaitable<HttpResponse> {
  nlohmann::json body;
  try {
    body = nlohmann::json::parse(request.body);
  } catch (const nlohmann::json::parse_error &ex) {
    Logger()->warn("Rejecting unparsable request body: {}", ex.what());
    co_return JsonResponse(
        400,
        message::Response::CreateError(error::ErrorCode::kParseError).ToJson());
  }

  auto reply = co_await bridge_.HandleRpc(body);
  if (!reply.body) {
    co_return HttpResponse{
        .status = 202,
        .content_type = "application/json",
        .body = "",
        .extra_headers = {},
        .keep_alive = true};
  }
  co_return JsonResponse(StatusForFailure(reply.failure), *reply.body);
}

auto HttpServer::HandleHealth() -> HttpResponse {
  auto health = bridge_.HealthCheck();
  int status = health.value("alive", false) ? 200 : 503;
  return JsonResponse(status, health);
}

}  // namespace mcpbridge::http
