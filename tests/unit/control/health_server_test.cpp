#include <gtest/gtest.h>

#include <boost/asio.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

#include "afc/control/health_server.hpp"
#include "afc/control/http_client.hpp"
#include "afc/foundation/control_metrics.hpp"

using namespace afc::control;
using afc::foundation::ControlMetrics;
using afc::foundation::ErrorCode;
using namespace std::chrono_literals;

namespace {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

class HealthServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_.setRequestHandler([](const IncomingRequest& request) -> std::optional<HttpReply> {
            if (request.path == "/v1/status") {
                auto service = queryParam(request.query, "service").value_or("all");
                return HttpReply{200, "application/json",
                                 std::string("{\"method\":\"") + std::string(request.method) +
                                     "\",\"service\":\"" + service + "\"}"};
            }
            if (request.path == "/v1/whoami") {
                return HttpReply{200, "text/plain", std::string(request.authorization)};
            }
            if (request.path == "/v1/broken") {
                throw std::runtime_error("handler bug");
            }
            return std::nullopt;
        });
        ASSERT_TRUE(server_.start());
    }

    HttpResponse get(const std::string& path, const std::string& method = "GET") {
        HttpRequest request;
        request.method = method;
        request.host = "127.0.0.1";
        request.port = server_.port();
        request.path = path;
        auto r = httpExchange(request, 2s);
        EXPECT_TRUE(r.hasValue()) << r.error().message();
        return r ? r.value() : HttpResponse{};
    }

    /// Send @p first (then @p second after a pause) on a raw connection and
    /// return everything the server answers.
    std::string rawExchange(const std::string& first, const std::string& second = {}) {
        asio::io_context ioc;
        tcp::socket socket(ioc);
        boost::system::error_code ec;
        socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), server_.port()), ec);
        EXPECT_FALSE(ec) << ec.message();
        asio::write(socket, asio::buffer(first), ec);
        if (!second.empty()) {
            std::this_thread::sleep_for(50ms);
            asio::write(socket, asio::buffer(second), ec);
        }
        std::string reply;
        asio::read(socket, asio::dynamic_buffer(reply), ec);
        return reply;
    }

    ControlMetrics metrics_;
    HealthServer server_{HealthServerConfig{0, "afc-test"}, metrics_};
};

}  // namespace

TEST_F(HealthServerTest, BindsEphemeralPort) {
    EXPECT_TRUE(server_.isRunning());
    EXPECT_NE(server_.port(), 0);
    EXPECT_TRUE(server_.start());
}

TEST_F(HealthServerTest, HealthzReportsServiceAndUptime) {
    auto r = get("/healthz");
    EXPECT_EQ(r.status, 200);
    EXPECT_NE(r.body.find("\"status\":\"healthy\""), std::string::npos) << r.body;
    EXPECT_NE(r.body.find("\"service\":\"afc-test\""), std::string::npos);
    EXPECT_NE(r.body.find("\"uptime_seconds\":"), std::string::npos);
}

TEST_F(HealthServerTest, ReadyzFollowsReadiness) {
    auto before = get("/readyz");
    EXPECT_EQ(before.status, 503);
    EXPECT_NE(before.body.find("not_ready"), std::string::npos);

    server_.setReady(true);
    EXPECT_EQ(get("/readyz").status, 200);
    EXPECT_DOUBLE_EQ(metrics_.gaugeValue("afc_health_ready"), 1.0);

    server_.setReady(false);
    EXPECT_EQ(get("/readyz").status, 503);
}

TEST_F(HealthServerTest, MetricsExposesRegistry) {
    metrics_.incrementCounter("afc_escalations_total{service=\"checkout\"}", 3);
    auto r = get("/metrics");
    EXPECT_EQ(r.status, 200);
    EXPECT_NE(r.body.find("afc_escalations_total{service=\"checkout\"} 3"), std::string::npos)
        << r.body;
}

TEST_F(HealthServerTest, ExtraRoutesGoToHandler) {
    auto r = get("/v1/status?service=checkout");
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body, "{\"method\":\"GET\",\"service\":\"checkout\"}");

    auto posted = get("/v1/status", "POST");
    EXPECT_EQ(posted.body, "{\"method\":\"POST\",\"service\":\"all\"}");

    EXPECT_EQ(get("/v1/unknown").status, 404);
    EXPECT_EQ(get("/v1/broken").status, 500);
}

TEST_F(HealthServerTest, AuthorizationHeaderReachesHandler) {
    auto anonymous = get("/v1/whoami");
    EXPECT_EQ(anonymous.status, 200);
    EXPECT_EQ(anonymous.body, "");

    auto reply = rawExchange("GET /v1/whoami HTTP/1.1\r\nHost: x\r\n"
                             "authorization: Bearer s3cret\r\n\r\n");
    EXPECT_NE(reply.find("HTTP/1.1 200"), std::string::npos) << reply;
    EXPECT_NE(reply.find("\r\n\r\nBearer s3cret"), std::string::npos) << reply;
}

TEST_F(HealthServerTest, MalformedHeadIsBadRequest) {
    auto garbage = rawExchange("\x16\x03\x01 not http at all\r\n\r\n");
    EXPECT_NE(garbage.find("HTTP/1.1 400"), std::string::npos) << garbage;
}

TEST_F(HealthServerTest, HeadSplitAcrossWritesIsAssembled) {
    auto reply = rawExchange("GET /v1/sta", "tus?service=search HTTP/1.1\r\nHost: x\r\n\r\n");
    EXPECT_NE(reply.find("\"service\":\"search\""), std::string::npos) << reply;
}

TEST(HealthServerBindTest, InvalidBindAddressFailsStart) {
    ControlMetrics metrics;
    HealthServerConfig config;
    config.port = 0;
    config.bindAddress = "not-an-address";
    HealthServer server(config, metrics);
    auto r = server.start();
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::ListenFailed);
}

TEST_F(HealthServerTest, SecondServerOnSamePortFails) {
    HealthServer clash(HealthServerConfig{server_.port(), "clash"}, metrics_);
    auto r = clash.start();
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::ListenFailed);
    EXPECT_FALSE(clash.isRunning());
}

TEST_F(HealthServerTest, StopIsIdempotent) {
    server_.stop();
    server_.stop();
    EXPECT_FALSE(server_.isRunning());
}

TEST(QueryParamTest, ExtractsAndDecodesValues) {
    EXPECT_EQ(queryParam("service=checkout&operator=alice", "operator").value(), "alice");
    EXPECT_EQ(queryParam("note=fail+over%20now", "note").value(), "fail over now");
    EXPECT_EQ(queryParam("dry_run&service=checkout", "dry_run").value(), "");
    EXPECT_FALSE(queryParam("service=checkout", "region").has_value());
    EXPECT_FALSE(queryParam("", "service").has_value());
}
