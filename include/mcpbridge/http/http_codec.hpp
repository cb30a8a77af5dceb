#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

#include <asio.hpp>

namespace mcpbridge::http {

/// @brief Header names are stored lower-cased.
using HeaderMap = std::unordered_map<std::string, std::string>;

struct HttpRequest {
  std::string method;
  std::string target;
  std::string version;
  HeaderMap headers;
  std::string body;

  /// The target without its query string.
  [[nodiscard]] auto Path() const -> std::string_view;

  /// HTTP/1.1 keeps the connection open unless told otherwise.
  [[nodiscard]] auto KeepAlive() const -> bool;
};

struct HttpResponse {
  int status{200};
  std::string content_type{"application/json"};
  std::string body;
  HeaderMap extra_headers;
  bool keep_alive{true};
};

/// A malformed request, carrying the status to answer with.
class HttpError : public std::runtime_error {
 public:
  HttpError(int status, const std::string &message)
      : std::runtime_error(message), status_(status) {
  }

  [[nodiscard]] auto Status() const -> int {
    return status_;
  }

 private:
  int status_;
};

/**
 * @brief HTTP/1.1 request parsing and response framing.
 *
 * The parsing helpers throw HttpError on malformed input.
 */
class HttpCodec {
 public:
  /// @brief Separates the request head from the body.
  static constexpr const char *kHeaderDelimiter = "\r\n\r\n";

  static constexpr std::size_t kMaxHeaderBytes = 64 * 1024;

  static constexpr std::size_t kMaxBodyBytes = 16 * 1024 * 1024;

  /**
   * @brief Reads the request line and headers from a buffer.
   *
   * Consumes the head up to and including the blank line; body bytes already
   * in the buffer are left in place.
   *
   * @param buffer Buffer holding at least one complete request head
   * @return The request, with an empty body
   * @throws HttpError If the request line or a header line is malformed
   */
  static auto ReadRequestHead(asio::streambuf &buffer) -> HttpRequest;

  /**
   * @brief Reads header lines up to the blank line.
   * @param input The stream positioned after the request line.
   * @return A map of lower-cased header names to values.
   */
  static auto ReadHeaders(std::istream &input) -> HeaderMap;

  /**
   * @brief Reads the body length from headers.
   * @return The declared length, or std::nullopt when the header is absent.
   * @throws HttpError For an invalid or oversized length, or a chunked body.
   */
  static auto ReadContentLength(const HeaderMap &headers)
      -> std::optional<std::size_t>;

  /**
   * @brief Reads the body from a buffer.
   * @param buffer The buffer to read from.
   * @param content_length The length of content to read.
   * @return The content as a string.
   */
  static auto ReadContent(asio::streambuf &buffer, std::size_t content_length)
      -> std::string;

  /**
   * @brief Parses a Content-Length header value.
   * @throws HttpError If the value is not a non-negative integer or exceeds
   * kMaxBodyBytes.
   */
  static auto ParseContentLength(const std::string &header_value)
      -> std::size_t;

  /// Writes the status line, headers and body.
  static void WriteResponse(std::ostream &output, const HttpResponse &response);

  static auto ReasonPhrase(int status) -> std::string_view;
};

}  // namespace mcpbridge::http
