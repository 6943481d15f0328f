/// @file http_client.cpp
/// @brief HTTP and TCP client on Boost.Beast, run on one shared I/O thread.

#include "afc/control/http_client.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <charconv>
#include <future>
#include <memory>
#include <thread>

namespace afc::control {

using foundation::ControlError;
using foundation::ControlResult;
using foundation::ErrorCode;

namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

/// Process-wide io_context driven by one thread. Callers block on a future
/// with their own deadline, so a stalled resolver or peer never holds a
/// caller past its timeout.
class IoThread {
public:
    IoThread() : guard_(asio::make_work_guard(ioc_)), thread_([this] { ioc_.run(); }) {}

    ~IoThread() {
        guard_.reset();
        ioc_.stop();
        thread_.join();
    }

    IoThread(const IoThread&) = delete;
    IoThread& operator=(const IoThread&) = delete;

    asio::io_context& context() { return ioc_; }

private:
    asio::io_context ioc_;
    asio::executor_work_guard<asio::io_context::executor_type> guard_;
    std::thread thread_;
};

IoThread& ioThread() {
    static IoThread instance;
    return instance;
}

std::string endpointName(const std::string& host, uint16_t port) {
    return host + ":" + std::to_string(port);
}

ControlError connectError(const std::string& what, const beast::error_code& ec) {
    return ControlError(ErrorCode::ConnectionFailed, what + ": " + ec.message());
}

/// Everything one request needs, kept alive by the pending handlers.
struct Exchange {
    explicit Exchange(asio::io_context& ioc) : resolver(ioc), stream(ioc) {}

    tcp::resolver resolver;
    beast::tcp_stream stream;
    http::request<http::string_body> request;
    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    std::string peer;
    std::promise<ControlResult<HttpResponse>> result;

    void fail(ControlError error) {
        result.set_value(ControlResult<HttpResponse>::err(std::move(error)));
    }
};

struct Connect {
    explicit Connect(asio::io_context& ioc) : resolver(ioc), stream(ioc) {}

    tcp::resolver resolver;
    beast::tcp_stream stream;
    std::string peer;
    std::promise<ControlResult<void>> result;
};

void onRead(const std::shared_ptr<Exchange>& ex, const beast::error_code& ec) {
    if (ec == http::error::body_limit) {
        ex->fail(ControlError(ErrorCode::InvalidMessage,
                              "response from " + ex->peer + " exceeds " +
                                  std::to_string(kMaxResponseBodyBytes) + " bytes"));
        return;
    }
    if (ec && ec.category() == http::make_error_code(http::error::need_more).category()) {
        ex->fail(ControlError(ErrorCode::InvalidMessage,
                              "malformed response from " + ex->peer + ": " + ec.message()));
        return;
    }
    if (ec) {
        ex->fail(connectError("receive from " + ex->peer + " failed", ec));
        return;
    }
    auto& message = ex->parser.get();
    HttpResponse response;
    response.status = static_cast<int>(message.result_int());
    response.body = std::move(message.body());
    ex->result.set_value(ControlResult<HttpResponse>::ok(std::move(response)));
}

void onConnected(const std::shared_ptr<Exchange>& ex) {
    http::async_write(ex->stream, ex->request, [ex](beast::error_code ec, std::size_t) {
        if (ec) {
            ex->fail(connectError("send to " + ex->peer + " failed", ec));
            return;
        }
        http::async_read(ex->stream, ex->buffer, ex->parser,
                         [ex](beast::error_code readEc, std::size_t) { onRead(ex, readEc); });
    });
}

/// Wait for @p future until @p timeout; on expiry run @p cancel on the I/O
/// thread and report Timeout.
template <typename T, typename Cancel>
ControlResult<T> awaitWithin(std::future<ControlResult<T>>& future,
                             std::chrono::milliseconds timeout, const std::string& peer,
                             Cancel cancel) {
    if (future.wait_for(timeout) == std::future_status::ready) {
        return future.get();
    }
    asio::post(ioThread().context(), std::move(cancel));
    return ControlResult<T>::err(ControlError(
        ErrorCode::Timeout,
        peer + " timed out after " + std::to_string(timeout.count()) + "ms"));
}

} // namespace

ControlResult<HttpUrl> parseHttpUrl(std::string_view url) {
    constexpr std::string_view scheme = "http://";
    if (url.substr(0, scheme.size()) != scheme) {
        return ControlResult<HttpUrl>::err(ControlError(
            ErrorCode::InvalidArgument, "unsupported URL: " + std::string(url)));
    }
    url.remove_prefix(scheme.size());

    HttpUrl out;
    auto slash = url.find('/');
    auto authority = url.substr(0, slash);
    if (slash != std::string_view::npos) {
        out.path = std::string(url.substr(slash));
    }

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        unsigned port = 0;
        auto portStr = authority.substr(colon + 1);
        auto [ptr, ec] = std::from_chars(portStr.data(), portStr.data() + portStr.size(), port);
        if (ec != std::errc{} || ptr != portStr.data() + portStr.size() || port == 0 ||
            port > 65535) {
            return ControlResult<HttpUrl>::err(ControlError(
                ErrorCode::InvalidArgument, "invalid port in URL: " + std::string(authority)));
        }
        out.port = static_cast<uint16_t>(port);
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) {
        return ControlResult<HttpUrl>::err(
            ControlError(ErrorCode::InvalidArgument, "URL without host"));
    }
    out.host = std::string(authority);
    return ControlResult<HttpUrl>::ok(std::move(out));
}

ControlResult<HttpResponse> httpExchange(const HttpRequest& request,
                                         std::chrono::milliseconds timeout) {
    auto& ioc = ioThread().context();
    auto ex = std::make_shared<Exchange>(ioc);
    ex->peer = endpointName(request.host, request.port);

    auto& req = ex->request;
    req.version(11);
    req.method_string(request.method);
    req.target(request.path);
    req.set(http::field::host, ex->peer);
    req.set(http::field::user_agent, "afc-controller");
    req.set(http::field::connection, "close");
    if (!request.body.empty()) {
        req.set(http::field::content_type, request.contentType);
        req.body() = request.body;
    }
    req.prepare_payload();
    ex->parser.body_limit(kMaxResponseBodyBytes);

    auto future = ex->result.get_future();
    asio::post(ioc, [ex, host = request.host, port = std::to_string(request.port)] {
        ex->resolver.async_resolve(
            host, port, [ex](beast::error_code ec, tcp::resolver::results_type results) {
                if (ec) {
                    ex->fail(connectError("cannot resolve " + ex->peer, ec));
                    return;
                }
                ex->stream.async_connect(
                    results, [ex](beast::error_code connectEc, const tcp::endpoint&) {
                        if (connectEc) {
                            ex->fail(connectError("connect to " + ex->peer + " failed",
                                                  connectEc));
                            return;
                        }
                        onConnected(ex);
                    });
            });
    });

    return awaitWithin(future, timeout, ex->peer, [ex] {
        ex->resolver.cancel();
        ex->stream.cancel();
    });
}

ControlResult<void> tcpConnect(const std::string& host, uint16_t port,
                               std::chrono::milliseconds timeout) {
    auto& ioc = ioThread().context();
    auto conn = std::make_shared<Connect>(ioc);
    conn->peer = endpointName(host, port);

    auto future = conn->result.get_future();
    asio::post(ioc, [conn, host, service = std::to_string(port)] {
        conn->resolver.async_resolve(
            host, service, [conn](beast::error_code ec, tcp::resolver::results_type results) {
                if (ec) {
                    conn->result.set_value(ControlResult<void>::err(
                        connectError("cannot resolve " + conn->peer, ec)));
                    return;
                }
                conn->stream.async_connect(
                    results, [conn](beast::error_code connectEc, const tcp::endpoint&) {
                        if (connectEc) {
                            conn->result.set_value(ControlResult<void>::err(connectError(
                                "connect to " + conn->peer + " failed", connectEc)));
                            return;
                        }
                        conn->stream.close();
                        conn->result.set_value(ControlResult<void>::ok());
                    });
            });
    });

    return awaitWithin(future, timeout, conn->peer, [conn] {
        conn->resolver.cancel();
        conn->stream.cancel();
    });
}

} // namespace afc::control
