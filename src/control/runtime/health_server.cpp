/// @file health_server.cpp
/// @brief Poll-based HTTP responder for health, metrics and operator routes;
///        request heads are parsed with Boost.Beast.

#include "afc/control/health_server.hpp"

#include "afc/foundation/control_error.hpp"
#include "afc/foundation/control_logger.hpp"
#include "afc/foundation/control_metrics.hpp"
#include "afc/foundation/json_log_formatter.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <exception>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <cerrno>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace afc::control {

using foundation::ControlError;
using foundation::ControlResult;
using foundation::ErrorCode;
using foundation::HealthStatus;
using foundation::LogCategory;

namespace {

namespace beast = boost::beast;
namespace http = beast::http;

std::string healthToJson(const foundation::HealthCheckResult& result,
                         std::chrono::seconds uptime) {
    nlohmann::ordered_json doc;
    doc["status"] = std::string(foundation::healthStatusName(result.status));
    doc["service"] = result.serviceName;
    doc["uptime_seconds"] = uptime.count();
    if (!result.components.empty()) {
        nlohmann::ordered_json components = nlohmann::ordered_json::object();
        for (const auto& [name, status] : result.components) {
            components[name] = std::string(foundation::healthStatusName(status));
        }
        doc["components"] = std::move(components);
    }
    return foundation::toJsonText(doc);
}

std::string_view reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 202: return "Accepted";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 503: return "Service Unavailable";
        default:  return "Error";
    }
}

std::string httpResponse(int status, std::string_view contentType, std::string_view body) {
    std::string out = "HTTP/1.1 " + std::to_string(status) + " ";
    out += reasonPhrase(status);
    out += "\r\nContent-Type: ";
    out += contentType;
    out += "\r\nContent-Length: " + std::to_string(body.size());
    if (status == 401) {
        out += "\r\nWWW-Authenticate: Bearer";
    }
    out += "\r\nConnection: close\r\n\r\n";
    out += body;
    return out;
}

constexpr std::size_t kMaxRequestHeadBytes = 8 * 1024;
constexpr int kClientReadTimeoutMs = 2000;

std::string_view toView(beast::string_view s) {
    return std::string_view(s.data(), s.size());
}

/// Read from @p fd until the request head is complete. Returns false when the
/// peer closes, stalls or sends something that is not an HTTP request head.
bool readRequestHead(int fd, http::request_parser<http::empty_body>& parser) {
    parser.header_limit(kMaxRequestHeadBytes);
    std::array<char, 4096> buf{};
    std::string pending;
    while (!parser.is_header_done()) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        if (::poll(&pfd, 1, kClientReadTimeoutMs) <= 0) {
            return false;
        }
        auto n = ::read(fd, buf.data(), buf.size());
        if (n <= 0) {
            return false;
        }
        pending.append(buf.data(), static_cast<std::size_t>(n));

        beast::error_code ec;
        auto used = parser.put(boost::asio::const_buffer(pending.data(), pending.size()), ec);
        pending.erase(0, used);
        if (ec == http::error::need_more) {
            continue;
        }
        if (ec) {
            return false;
        }
    }
    return true;
}

void writeAll(int fd, const std::string& data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        auto n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return;
        }
        sent += static_cast<std::size_t>(n);
    }
}

} // namespace

std::optional<std::string> queryParam(std::string_view query, std::string_view key) {
    while (!query.empty()) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        auto eq = pair.find('=');
        if (pair.substr(0, eq) == key) {
            std::string value;
            if (eq != std::string_view::npos) {
                auto raw = pair.substr(eq + 1);
                for (std::size_t i = 0; i < raw.size(); ++i) {
                    if (raw[i] == '+') {
                        value += ' ';
                    } else if (raw.substr(i, 3) == "%20") {
                        value += ' ';
                        i += 2;
                    } else {
                        value += raw[i];
                    }
                }
            }
            return value;
        }
        if (amp == std::string_view::npos) {
            break;
        }
        query.remove_prefix(amp + 1);
    }
    return std::nullopt;
}

// -- Impl -------------------------------------------------------------------

struct HealthServer::Impl {
    HealthServerConfig config;
    foundation::ControlMetrics& metrics;
    RequestHandler handler;
    std::atomic<bool> running{false};
    std::atomic<bool> ready{false};
    std::atomic<uint16_t> boundPort{0};
    std::thread serverThread;
    int listenFd{-1};
    std::chrono::steady_clock::time_point startTime{};

    Impl(HealthServerConfig cfg, foundation::ControlMetrics& m)
        : config(std::move(cfg)), metrics(m) {}

    void run() {
        while (running.load(std::memory_order_relaxed)) {
            pollfd pfd{};
            pfd.fd = listenFd;
            pfd.events = POLLIN;

            // 500 ms so stop() is noticed promptly.
            if (::poll(&pfd, 1, 500) <= 0 || (pfd.revents & POLLIN) == 0) {
                continue;
            }
            int clientFd = ::accept(listenFd, nullptr, nullptr);
            if (clientFd < 0) {
                continue;
            }
            handleClient(clientFd);
            ::close(clientFd);
        }
    }

    std::string healthBody() const {
        auto health = metrics.healthCheck();
        health.serviceName = config.serviceName;
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - startTime);
        return healthToJson(health, uptime);
    }

    void handleClient(int clientFd) {
        http::request_parser<http::empty_body> parser;
        if (!readRequestHead(clientFd, parser)) {
            writeAll(clientFd, httpResponse(400, "text/plain", "Bad Request"));
            return;
        }
        const auto& head = parser.get();
        auto target = toView(head.target());
        auto q = target.find('?');
        IncomingRequest request;
        request.method = toView(head.method_string());
        request.path = target.substr(0, q);
        if (q != std::string_view::npos) {
            request.query = target.substr(q + 1);
        }
        request.authorization = toView(head[http::field::authorization]);

        std::string response;
        if (request.path == "/healthz") {
            response = httpResponse(200, "application/json", healthBody());
        } else if (request.path == "/readyz") {
            if (ready.load(std::memory_order_relaxed)) {
                response = httpResponse(200, "application/json", healthBody());
            } else {
                nlohmann::ordered_json body;
                body["status"] = "not_ready";
                body["service"] = config.serviceName;
                response = httpResponse(503, "application/json", foundation::toJsonText(body));
            }
        } else if (request.path == "/metrics") {
            response = httpResponse(200, "text/plain; version=0.0.4; charset=utf-8",
                                    metrics.scrape());
        } else {
            std::optional<HttpReply> reply;
            if (handler) {
                try {
                    reply = handler(request);
                } catch (const std::exception& e) {
                    AFC_LOG_ERROR(LogCategory::Core,
                                  "request handler failed for " + std::string(request.path) +
                                      ": " + e.what());
                    reply = HttpReply{500, "text/plain", "internal error"};
                }
            }
            response = reply ? httpResponse(reply->status, reply->contentType, reply->body)
                             : httpResponse(404, "text/plain", "Not Found");
        }
        writeAll(clientFd, response);
    }
};

// -- Public API -------------------------------------------------------------

HealthServer::HealthServer(HealthServerConfig config, foundation::ControlMetrics& metrics)
    : impl_(std::make_unique<Impl>(std::move(config), metrics)) {}

HealthServer::~HealthServer() {
    stop();
}

void HealthServer::setRequestHandler(RequestHandler handler) {
    impl_->handler = std::move(handler);
}

ControlResult<void> HealthServer::start() {
    if (impl_->running.load()) {
        return ControlResult<void>::ok();
    }

    impl_->listenFd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (impl_->listenFd < 0) {
        return ControlResult<void>::err(
            ControlError(ErrorCode::NetworkError, "failed to create health server socket"));
    }

    int optval = 1;
    ::setsockopt(impl_->listenFd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(impl_->config.port);
    if (::inet_pton(AF_INET, impl_->config.bindAddress.c_str(), &addr.sin_addr) != 1) {
        ::close(impl_->listenFd);
        impl_->listenFd = -1;
        return ControlResult<void>::err(ControlError(
            ErrorCode::ListenFailed,
            "invalid health server bind address '" + impl_->config.bindAddress + "'"));
    }

    if (::bind(impl_->listenFd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(impl_->listenFd);
        impl_->listenFd = -1;
        return ControlResult<void>::err(ControlError(
            ErrorCode::ListenFailed,
            "failed to bind health server on " + impl_->config.bindAddress + ":" +
                std::to_string(impl_->config.port)));
    }
    if (::listen(impl_->listenFd, 8) < 0) {
        ::close(impl_->listenFd);
        impl_->listenFd = -1;
        return ControlResult<void>::err(
            ControlError(ErrorCode::ListenFailed, "failed to listen on health server socket"));
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(impl_->listenFd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        impl_->boundPort.store(ntohs(bound.sin_port));
    } else {
        impl_->boundPort.store(impl_->config.port);
    }

    impl_->startTime = std::chrono::steady_clock::now();
    impl_->running.store(true, std::memory_order_relaxed);
    impl_->serverThread = std::thread([this] { impl_->run(); });

    AFC_LOG_INFO(LogCategory::Core,
                 "health server listening on " + impl_->config.bindAddress + ":" +
                     std::to_string(port()));
    return ControlResult<void>::ok();
}

void HealthServer::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }
    if (impl_->serverThread.joinable()) {
        impl_->serverThread.join();
    }
    if (impl_->listenFd >= 0) {
        ::close(impl_->listenFd);
        impl_->listenFd = -1;
    }
}

void HealthServer::setReady(bool ready) {
    impl_->ready.store(ready, std::memory_order_relaxed);
    impl_->metrics.setGauge("afc_health_ready", ready ? 1.0 : 0.0);
}

bool HealthServer::isRunning() const {
    return impl_->running.load(std::memory_order_relaxed);
}

uint16_t HealthServer::port() const {
    auto bound = impl_->boundPort.load();
    return bound != 0 ? bound : impl_->config.port;
}

} // namespace afc::control
