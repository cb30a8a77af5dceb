#include "mcpbridge/http/http_codec.hpp"

#include <charconv>
#include <istream>

#include "mcpbridge/utils/string_utils.hpp"

namespace mcpbridge::http {

auto HttpRequest::Path() const -> std::string_view {
  std::string_view path(target);
  auto query = path.find('?');
  if (query != std::string_view::npos) {
    path = path.substr(0, query);
  }
  return path;
}

auto HttpRequest::KeepAlive() const -> bool {
  std::string connection;
  if (auto it = headers.find("connection"); it != headers.end()) {
    connection = utils::ToLower(it->second);
  }
  if (version == "HTTP/1.0") {
    return connection == "keep-alive";
  }
  return connection != "close";
}

auto HttpCodec::ReadRequestHead(asio::streambuf &buffer) -> HttpRequest {
  std::istream input(&buffer);
  std::string line;

  if (!std::getline(input, line)) {
    throw HttpError(400, "Missing request line");
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  auto first_space = line.find(' ');
  auto last_space = line.rfind(' ');
  if (first_space == std::string::npos || first_space == last_space) {
    throw HttpError(400, "Malformed request line");
  }

  HttpRequest request;
  request.method = line.substr(0, first_space);
  request.target = line.substr(first_space + 1, last_space - first_space - 1);
  request.version = line.substr(last_space + 1);

  if (request.method.empty() || request.target.empty() ||
      !request.version.starts_with("HTTP/1.")) {
    throw HttpError(400, "Malformed request line");
  }

  request.headers = ReadHeaders(input);
  return request;
}

auto HttpCodec::ReadHeaders(std::istream &input) -> HeaderMap {
  HeaderMap headers;
  std::string line;

  while (std::getline(input, line) && !line.empty() && line != "\r") {
    auto colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      throw HttpError(400, "Malformed header line");
    }
    std::string header_key =
        utils::ToLower(utils::Trim(line.substr(0, colon_pos)));
    std::string header_value = utils::Trim(line.substr(colon_pos + 1));
    if (header_key.empty()) {
      throw HttpError(400, "Empty header name");
    }
    headers[header_key] = header_value;
  }

  return headers;
}

auto HttpCodec::ReadContentLength(const HeaderMap &headers)
    -> std::optional<std::size_t> {
  if (headers.contains("transfer-encoding")) {
    throw HttpError(411, "Chunked request bodies are not supported");
  }
  auto it = headers.find("content-length");
  if (it == headers.end()) {
    return std::nullopt;
  }
  return ParseContentLength(it->second);
}

auto HttpCodec::ReadContent(asio::streambuf &buffer, std::size_t content_length)
    -> std::string {
  std::istream input(&buffer);
  std::string content(content_length, '\0');
  input.read(content.data(), static_cast<std::streamsize>(content_length));
  if (input.gcount() != static_cast<std::streamsize>(content_length)) {
    throw HttpError(400, "Failed to read the expected content length");
  }
  return content;
}

auto HttpCodec::ParseContentLength(const std::string &header_value)
    -> std::size_t {
  std::size_t length = 0;
  const char *begin = header_value.data();
  const char *end = begin + header_value.size();
  auto [ptr, ec] = std::from_chars(begin, end, length);
  if (ec == std::errc::result_out_of_range) {
    throw HttpError(413, "Content-Length value out of range");
  }
  if (ec != std::errc() || ptr != end || header_value.empty()) {
    throw HttpError(400, "Invalid Content-Length value");
  }
  if (length > kMaxBodyBytes) {
    throw HttpError(413, "Request body too large");
  }
  return length;
}

void HttpCodec::WriteResponse(
    std::ostream &output, const HttpResponse &response) {
  output << "HTTP/1.1 " << response.status << " "
         << ReasonPhrase(response.status) << "\r\n";
  if (!response.body.empty()) {
    output << "Content-Type: " << response.content_type << "\r\n";
  }
  output << "Content-Length: " << response.body.size() << "\r\n";
  for (const auto &[name, value] : response.extra_headers) {
    output << name << ": " << value << "\r\n";
  }
  output << "Connection: " << (response.keep_alive ? "keep-alive" : "close")
         << "\r\n"
         << "\r\n"
         << response.body;
}

auto HttpCodec::ReasonPhrase(int status) -> std::string_view {
  switch (status) {
    case 200:
      return "OK";
    case 202:
      return "Accepted";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 411:
      return "Length Required";
    case 413:
      return "Payload Too Large";
    case 431:
      return "Request Header Fields Too Large";
    case 500:
      return "Internal Server Error";
    case 502:
      return "Bad Gateway";
    case 503:
      return "Service Unavailable";
    case 504:
      return "Gateway Timeout";
    default:
      return "Unknown";
  }
}

}  // namespace mcpbridge::http
