#include <gtest/gtest.h>

#include <boost/asio.hpp>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include "afc/control/http_client.hpp"

using namespace afc::control;
using afc::foundation::ErrorCode;
using namespace std::chrono_literals;

namespace {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/// Loopback peer that accepts one connection, records the request head and
/// answers with a canned byte string (or stays silent until destroyed).
class ScriptedPeer {
public:
    explicit ScriptedPeer(std::string reply, bool respond = true)
        : acceptor_(ioc_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)),
          respond_(respond),
          thread_([this, reply = std::move(reply)] { serve(reply); }) {}

    ~ScriptedPeer() {
        {
            std::lock_guard lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
        thread_.join();
    }

    ScriptedPeer(const ScriptedPeer&) = delete;
    ScriptedPeer& operator=(const ScriptedPeer&) = delete;

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

    std::string head() {
        std::lock_guard lock(mutex_);
        return head_;
    }

private:
    void serve(const std::string& reply) {
        tcp::socket socket(ioc_);
        boost::system::error_code ec;
        acceptor_.accept(socket, ec);
        if (ec) {
            return;
        }
        asio::streambuf in;
        asio::read_until(socket, in, "\r\n\r\n", ec);
        {
            std::lock_guard lock(mutex_);
            head_.assign(asio::buffers_begin(in.data()), asio::buffers_end(in.data()));
        }
        if (respond_) {
            asio::write(socket, asio::buffer(reply), ec);
        } else {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return released_; });
        }
        socket.shutdown(tcp::socket::shutdown_both, ec);
    }

    asio::io_context ioc_;
    tcp::acceptor acceptor_;
    bool respond_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool released_ = false;
    std::string head_;
    std::thread thread_;
};

HttpRequest requestTo(uint16_t port, std::string path = "/") {
    HttpRequest request;
    request.host = "127.0.0.1";
    request.port = port;
    request.path = std::move(path);
    return request;
}

} // namespace

TEST(HttpClientTest, ReadsContentLengthResponse) {
    ScriptedPeer peer("HTTP/1.1 201 Created\r\nContent-Length: 11\r\n\r\n{\"ok\":true}");
    auto r = httpExchange(requestTo(peer.port(), "/v1/regions"), 2s);
    ASSERT_TRUE(r.hasValue()) << r.error().message();
    EXPECT_EQ(r.value().status, 201);
    EXPECT_EQ(r.value().body, "{\"ok\":true}");
    EXPECT_NE(peer.head().find("GET /v1/regions HTTP/1.1"), std::string::npos) << peer.head();
}

TEST(HttpClientTest, DecodesChunkedBody) {
    ScriptedPeer peer(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
        "7\r\n{\"lag\":\r\n3\r\n 42\r\n1\r\n}\r\n0\r\n\r\n");
    auto r = httpExchange(requestTo(peer.port()), 2s);
    ASSERT_TRUE(r.hasValue()) << r.error().message();
    EXPECT_EQ(r.value().status, 200);
    EXPECT_EQ(r.value().body, "{\"lag\": 42}");
}

TEST(HttpClientTest, BodyUntilCloseWithoutLength) {
    ScriptedPeer peer("HTTP/1.1 503 Service Unavailable\r\nConnection: close\r\n\r\ndown");
    auto r = httpExchange(requestTo(peer.port()), 2s);
    ASSERT_TRUE(r.hasValue()) << r.error().message();
    EXPECT_EQ(r.value().status, 503);
    EXPECT_EQ(r.value().body, "down");
}

TEST(HttpClientTest, PostCarriesBodyAndContentType) {
    ScriptedPeer peer("HTTP/1.1 204 No Content\r\n\r\n");
    auto request = requestTo(peer.port(), "/v1/route");
    request.method = "POST";
    request.body = "{\"region\":\"us-west\"}";
    auto r = httpExchange(request, 2s);
    ASSERT_TRUE(r.hasValue()) << r.error().message();
    EXPECT_EQ(r.value().status, 204);

    auto head = peer.head();
    EXPECT_NE(head.find("POST /v1/route HTTP/1.1"), std::string::npos) << head;
    EXPECT_NE(head.find("Content-Type: application/json"), std::string::npos) << head;
    EXPECT_NE(head.find("Content-Length: 20"), std::string::npos) << head;
}

TEST(HttpClientTest, OversizedBodyIsRejected) {
    ScriptedPeer peer("HTTP/1.1 200 OK\r\nContent-Length: " +
                      std::to_string(kMaxResponseBodyBytes + 1) + "\r\n\r\nxxxx");
    auto r = httpExchange(requestTo(peer.port()), 2s);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::InvalidMessage);
}

TEST(HttpClientTest, GarbageIsInvalidMessage) {
    ScriptedPeer peer("SSH-2.0-OpenSSH_9.6\r\n\r\n");
    auto r = httpExchange(requestTo(peer.port()), 2s);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::InvalidMessage);
}

TEST(HttpClientTest, SilentPeerTimesOutOnDeadline) {
    ScriptedPeer peer("", false);
    auto started = std::chrono::steady_clock::now();
    auto r = httpExchange(requestTo(peer.port()), 200ms);
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::Timeout);
    EXPECT_LT(elapsed, 1500ms);
}

TEST(HttpClientTest, NameResolutionIsInsideTheDeadline) {
    auto request = requestTo(80);
    request.host = "afc-unresolvable-host.invalid";
    auto started = std::chrono::steady_clock::now();
    auto r = httpExchange(request, 300ms);
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(r.hasError());
    EXPECT_TRUE(r.error().code() == ErrorCode::Timeout ||
                r.error().code() == ErrorCode::ConnectionFailed);
    EXPECT_LT(elapsed, 1500ms);
}

TEST(HttpClientTest, TcpConnectReportsRefusal) {
    uint16_t closedPort = 0;
    {
        asio::io_context ioc;
        tcp::acceptor listener(ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        closedPort = listener.local_endpoint().port();
    }
    auto r = tcpConnect("127.0.0.1", closedPort, 1s);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::ConnectionFailed);
}
