#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

#include "afc/control/health_probe.hpp"
#include "afc/control/health_server.hpp"
#include "afc/control/http_client.hpp"
#include "afc/foundation/control_metrics.hpp"
#include "support/control_fakes.hpp"

using namespace afc::control;
using afc::foundation::ControlMetrics;
using afc::foundation::ErrorCode;
using afc::test::FakeEndpoint;

namespace {

class SlowEndpoint : public HealthEndpoint {
public:
    explicit SlowEndpoint(Millis delay) : delay_(delay) {}

    HealthCheckOutcome check(Millis) override {
        std::this_thread::sleep_for(delay_);
        return HealthCheckOutcome{true, false, {}};
    }

private:
    Millis delay_;
};

class TimingOutEndpoint : public HealthEndpoint {
public:
    HealthCheckOutcome check(Millis) override {
        return HealthCheckOutcome{false, true, "connect timed out"};
    }
};

class ThrowingEndpoint : public HealthEndpoint {
public:
    HealthCheckOutcome check(Millis) override { throw std::runtime_error("resolver exploded"); }
};

HealthProbe probeFor(std::shared_ptr<HealthEndpoint> endpoint, Millis timeout = Millis{500}) {
    return HealthProbe(ServiceId("checkout"), RegionId("us-east"), std::move(endpoint), timeout);
}

}  // namespace

// --- HealthProbe ---

TEST(HealthProbeTest, HealthyEndpointYieldsSuccess) {
    auto endpoint = std::make_shared<FakeEndpoint>(true);
    auto probe = probeFor(endpoint);

    auto before = Clock::now();
    auto sample = probe.probe();

    EXPECT_EQ(sample.service, ServiceId("checkout"));
    EXPECT_EQ(sample.region, RegionId("us-east"));
    EXPECT_EQ(sample.outcome, ProbeOutcome::Success);
    EXPECT_TRUE(sample.succeeded());
    EXPECT_GE(sample.timestamp, before);
    EXPECT_EQ(endpoint->checks(), 1);
}

TEST(HealthProbeTest, UnhealthyEndpointYieldsFailureWithDetail) {
    auto probe = probeFor(std::make_shared<FakeEndpoint>(false));
    auto sample = probe.probe();
    EXPECT_EQ(sample.outcome, ProbeOutcome::Failure);
    EXPECT_EQ(sample.detail, "down");
}

TEST(HealthProbeTest, ReportedTimeoutYieldsTimeout) {
    auto probe = probeFor(std::make_shared<TimingOutEndpoint>());
    auto sample = probe.probe();
    EXPECT_EQ(sample.outcome, ProbeOutcome::Timeout);
    EXPECT_EQ(sample.detail, "connect timed out");
}

TEST(HealthProbeTest, SlowSuccessPastTimeoutIsTimeout) {
    auto probe = probeFor(std::make_shared<SlowEndpoint>(Millis{30}), Millis{5});
    auto sample = probe.probe();
    EXPECT_EQ(sample.outcome, ProbeOutcome::Timeout);
    EXPECT_GE(sample.latency, Millis{30});
    EXPECT_NE(sample.detail.find("exceeded 5ms"), std::string::npos);
}

TEST(HealthProbeTest, ThrowingEndpointStillYieldsOneSample) {
    auto probe = probeFor(std::make_shared<ThrowingEndpoint>());
    auto sample = probe.probe();
    EXPECT_EQ(sample.outcome, ProbeOutcome::Failure);
    EXPECT_NE(sample.detail.find("resolver exploded"), std::string::npos);
}

// --- Endpoint factory ---

TEST(HealthEndpointTest, FactoryPicksKind) {
    HealthEndpointSpec tcp;
    tcp.kind = HealthEndpointSpec::Kind::Tcp;
    EXPECT_NE(dynamic_cast<TcpHealthEndpoint*>(makeHealthEndpoint(tcp).get()), nullptr);

    HealthEndpointSpec http;
    EXPECT_NE(dynamic_cast<HttpHealthEndpoint*>(makeHealthEndpoint(http).get()), nullptr);
}

TEST(HealthEndpointTest, TcpRefusedConnectionIsUnhealthy) {
    // Bind and release an ephemeral port so nothing is listening on it.
    ControlMetrics metrics;
    HealthServer server({0, "probe_target"}, metrics);
    ASSERT_TRUE(server.start().hasValue());
    auto port = server.port();
    server.stop();

    HealthEndpointSpec spec;
    spec.kind = HealthEndpointSpec::Kind::Tcp;
    spec.host = "127.0.0.1";
    spec.port = port;
    auto outcome = TcpHealthEndpoint(spec).check(Millis{500});
    EXPECT_FALSE(outcome.healthy);
    EXPECT_FALSE(outcome.detail.empty());
}

TEST(HealthEndpointTest, HttpChecksStatusAndBody) {
    ControlMetrics metrics;
    HealthServer server({0, "probe_target"}, metrics);
    ASSERT_TRUE(server.start().hasValue());

    HealthEndpointSpec spec;
    spec.host = "127.0.0.1";
    spec.port = server.port();
    spec.path = "/healthz";

    EXPECT_TRUE(HttpHealthEndpoint(spec).check(Millis{2000}).healthy);

    spec.expectedBody = "\"status\":\"healthy\"";
    EXPECT_TRUE(HttpHealthEndpoint(spec).check(Millis{2000}).healthy);

    spec.expectedBody = "never-present";
    auto body = HttpHealthEndpoint(spec).check(Millis{2000});
    EXPECT_FALSE(body.healthy);
    EXPECT_EQ(body.detail, "unexpected body");

    spec.expectedBody.clear();
    spec.path = "/readyz";  // not ready yet -> 503
    auto status = HttpHealthEndpoint(spec).check(Millis{2000});
    EXPECT_FALSE(status.healthy);
    EXPECT_EQ(status.detail, "status 503");

    server.stop();
}

// --- URL parsing ---

TEST(HttpUrlTest, ParsesHostPortAndPath) {
    auto url = parseHttpUrl("http://ctl.us-east.internal:8080/v1");
    ASSERT_TRUE(url.hasValue());
    EXPECT_EQ(url.value().host, "ctl.us-east.internal");
    EXPECT_EQ(url.value().port, 8080);
    EXPECT_EQ(url.value().path, "/v1");
}

TEST(HttpUrlTest, DefaultsPortAndPath) {
    auto url = parseHttpUrl("http://ctl.internal");
    ASSERT_TRUE(url.hasValue());
    EXPECT_EQ(url.value().port, 80);
    EXPECT_EQ(url.value().path, "/");
}

TEST(HttpUrlTest, RejectsUnsupportedOrMalformed) {
    EXPECT_EQ(parseHttpUrl("https://ctl.internal").error().code(), ErrorCode::InvalidArgument);
    EXPECT_TRUE(parseHttpUrl("http://:8080/").hasError());
    EXPECT_TRUE(parseHttpUrl("http://ctl:0/").hasError());
    EXPECT_TRUE(parseHttpUrl("http://ctl:99999/").hasError());
    EXPECT_TRUE(parseHttpUrl("http://ctl:80x/").hasError());
}
