#pragma once

/// @file http_client.hpp
/// @brief Deadline-bounded HTTP/1.1 and TCP client on Boost.Beast.
///
/// Used by the HTTP health endpoints and the HTTP fleet API adapter. The
/// caller's timeout covers name resolution, connect, write and read together:
/// when it expires the call returns Timeout and the outstanding operations
/// are cancelled on the client's I/O thread.

#include "afc/foundation/control_result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace afc::control {

struct HttpUrl {
    std::string host;
    uint16_t port = 80;
    std::string path = "/";
};

/// Parse "http://host[:port][/path]". https is not supported.
[[nodiscard]] foundation::ControlResult<HttpUrl> parseHttpUrl(std::string_view url);

struct HttpRequest {
    std::string method = "GET";
    std::string host;
    uint16_t port = 80;
    std::string path = "/";
    std::string body;
    std::string contentType = "application/json";
};

struct HttpResponse {
    int status = 0;
    std::string body;
};

/// Responses with a larger body (chunked or not) fail with InvalidMessage.
inline constexpr std::size_t kMaxResponseBodyBytes = 1024 * 1024;

/// Perform one request with Connection: close. Chunked responses are
/// decoded.
/// @return The response, or ConnectionFailed / Timeout / InvalidMessage.
[[nodiscard]] foundation::ControlResult<HttpResponse> httpExchange(
    const HttpRequest& request, std::chrono::milliseconds timeout);

/// Open and immediately close a TCP connection.
/// @return Success, ConnectionFailed or Timeout.
[[nodiscard]] foundation::ControlResult<void> tcpConnect(
    const std::string& host, uint16_t port, std::chrono::milliseconds timeout);

} // namespace afc::control
