#include <gtest/gtest.h>

#include "afc/control/availability_controller.hpp"
#include "afc/foundation/control_metrics.hpp"
#include "support/control_fakes.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>

using namespace afc::control;
using afc::foundation::ControlMetrics;
using afc::foundation::ErrorCode;
using afc::test::checkoutSpec;
using afc::test::FakeEndpoint;
using afc::test::FakeFleet;
using afc::test::RecordingSink;
using afc::test::sampleAt;
using Op = FakeFleet::Op;
using namespace std::chrono_literals;

namespace {

const TimePoint kStart = TimePoint{} + std::chrono::hours(1000);
const ServiceId kCheckout("checkout");
const RegionId kEast("us-east");
const RegionId kWest("us-west");

FleetConfig checkoutFleet() {
    FleetConfig fleet;
    fleet.services.push_back(checkoutSpec());
    fleet.controller.authorizedOperators = {"alice"};
    // mallory holds a token but is not authorized to signal.
    fleet.controller.operatorTokens = {{"alice", "alice-token"}, {"mallory", "mallory-token"}};
    return fleet;
}

IncomingRequest httpCall(std::string_view method, std::string_view path,
                         std::string_view query = {}, std::string_view authorization = {}) {
    return IncomingRequest{method, path, query, authorization};
}

constexpr std::string_view kAlice = "Bearer alice-token";

} // namespace

// =============================================================================
// Fixture: whole controller fed synthetic probe samples on the test thread
// =============================================================================

class FailoverScenarioTest : public ::testing::Test {
protected:
    virtual FleetConfig fleetConfig() const { return checkoutFleet(); }

    void SetUp() override {
        ControllerOptions options;
        options.journalEnabled = false;
        options.probingEnabled = false;
        options.endpoints = [this](const ServiceSpec&, const RegionSpec& region) {
            auto endpoint = std::make_shared<FakeEndpoint>(true);
            endpoints_[region.id.value()] = endpoint;
            return endpoint;
        };
        controller_ = std::make_unique<AvailabilityController>(
            fleetConfig(), FakeFleet::apis(fleet_), metrics_, std::move(options));
        controller_->notifier().addSink(sink_);
    }

    /// One probe round: us-east answers @p eastOk, the others succeed.
    void round(std::chrono::seconds offset, bool eastOk) {
        for (const char* region : {"us-east", "us-west", "eu-central"}) {
            bool ok = std::string(region) == "us-east" ? eastOk : true;
            auto sample = sampleAt(controller_->fleet().services[0], region, kStart + offset, ok);
            ASSERT_TRUE(controller_->process(kCheckout, sample));
        }
    }

    /// us-east fails every 10 s from t=10 s through t=160 s.
    void failEastUntilUnreachable() {
        endpoints_["us-east"]->setHealthy(false);
        for (int t = 10; t <= 160; t += 10) {
            round(std::chrono::seconds(t), false);
        }
    }

    void tick(std::chrono::seconds offset) {
        ASSERT_TRUE(controller_->process(kCheckout, DecisionTick{kStart + offset}));
    }

    CoordinatorSnapshot snapshot() { return controller_->snapshot(kCheckout).value(); }

    ControlMetrics metrics_;
    std::shared_ptr<FakeFleet> fleet_ = std::make_shared<FakeFleet>();
    std::shared_ptr<RecordingSink> sink_ = std::make_shared<RecordingSink>();
    std::map<std::string, std::shared_ptr<FakeEndpoint>> endpoints_;
    std::unique_ptr<AvailabilityController> controller_;
};

// =============================================================================
// Automatic failover
// =============================================================================

TEST_F(FailoverScenarioTest, UnreachablePrimaryFailsOverToStandby) {
    round(0s, true);
    EXPECT_EQ(snapshot().state, CoordinatorState::Stable);

    failEastUntilUnreachable();

    auto snap = snapshot();
    EXPECT_EQ(snap.state, CoordinatorState::Stable);
    EXPECT_EQ(snap.primary, kWest);
    ASSERT_TRUE(snap.lastEvent.has_value());
    EXPECT_EQ(snap.lastEvent->phase(), FailoverPhase::Completed);
    EXPECT_EQ(snap.lastEvent->fromRegion(), kEast);
    EXPECT_EQ(snap.lastEvent->step(StepKind::QuiesceWrites).status, StepStatus::Skipped);
    EXPECT_EQ(fleet_->calls(Op::Promote, "us-west"), 1);
    EXPECT_EQ(fleet_->routedTo(), "us-west");

    EXPECT_EQ(controller_->store().get(kCheckout, kEast).value().state, RegionState::Unreachable);
    EXPECT_EQ(controller_->detector().state(kCheckout, kEast).value(), DetectorState::Unreachable);

    // Suspected, Degraded and Unreachable for us-east.
    EXPECT_EQ(sink_->count(ControlEventKind::RegionTransition), 3);
    EXPECT_EQ(sink_->count(ControlEventKind::FailoverStarted), 1);
    EXPECT_EQ(sink_->count(ControlEventKind::FailoverCompleted), 1);
    EXPECT_EQ(sink_->count(ControlEventKind::Escalation), 0);

    auto status = controller_->statusJson();
    EXPECT_NE(status.find("\"primary\":\"us-west\""), std::string::npos) << status;
    EXPECT_NE(status.find("\"phase\":\"completed\""), std::string::npos) << status;
}

TEST_F(FailoverScenarioTest, DegradedPrimaryDoesNotFailOver) {
    endpoints_["us-east"]->setHealthy(false);
    for (int t = 10; t <= 40; t += 10) {
        round(std::chrono::seconds(t), false);
    }
    EXPECT_EQ(controller_->detector().state(kCheckout, kEast).value(), DetectorState::Degraded);
    EXPECT_EQ(snapshot().state, CoordinatorState::Stable);
    EXPECT_EQ(fleet_->calls(Op::Promote), 0);
}

// =============================================================================
// Sustained error-budget burn on a reachable primary
// =============================================================================

class HardBurnScenarioTest : public FailoverScenarioTest {
protected:
    /// The short window outlasts the RTO so the detector keeps us-east
    /// Degraded while the coordinator measures the burn.
    FleetConfig fleetConfig() const override {
        auto fleet = checkoutFleet();
        auto& spec = fleet.services[0];
        spec.rto = 300s;
        spec.windows.shortWindow = 10min;
        spec.probe.verificationProbes = 5;
        return fleet;
    }

    [[nodiscard]] bool enteredEvaluatingOnBurn() const {
        for (const auto& event : sink_->events()) {
            if (event.kind != ControlEventKind::CoordinatorTransition) {
                continue;
            }
            for (const auto& [key, value] : event.fields) {
                if (key == "to" && value == "evaluating" &&
                    event.message.find("burn rate above") != std::string::npos) {
                    return true;
                }
            }
        }
        return false;
    }
};

TEST_F(HardBurnScenarioTest, SustainedBurnFailsOverAfterRto) {
    round(0s, true);
    // Three failures inside the degrade interval.
    for (int t = 10; t <= 30; t += 10) {
        round(std::chrono::seconds(t), false);
    }
    EXPECT_EQ(controller_->detector().state(kCheckout, kEast).value(), DetectorState::Degraded);

    // Every other probe fails: no streak long enough for Unreachable, no run of
    // successes long enough for recovery, burn far above 10x throughout.
    for (int t = 40; t <= 300; t += 10) {
        round(std::chrono::seconds(t), (t / 10) % 2 == 0);
    }
    tick(300s);
    EXPECT_EQ(controller_->detector().state(kCheckout, kEast).value(), DetectorState::Degraded);
    EXPECT_EQ(snapshot().state, CoordinatorState::Stable);
    EXPECT_EQ(snapshot().primary, kEast);
    EXPECT_EQ(fleet_->calls(Op::Promote), 0);
    EXPECT_EQ(endpoints_["us-west"]->checks(), 0);

    // Burning since t=10 s; the RTO elapses at t=310 s.
    tick(310s);

    EXPECT_TRUE(enteredEvaluatingOnBurn());
    auto snap = snapshot();
    EXPECT_EQ(snap.state, CoordinatorState::Stable);
    EXPECT_EQ(snap.primary, kWest);
    ASSERT_TRUE(snap.lastEvent.has_value());
    EXPECT_EQ(snap.lastEvent->phase(), FailoverPhase::Completed);
    EXPECT_NE(snap.lastEvent->reason().find("burning error budget"), std::string::npos);
    // The primary still answers, so writes are quiesced rather than skipped.
    EXPECT_EQ(snap.lastEvent->step(StepKind::QuiesceWrites).status, StepStatus::Succeeded);
    EXPECT_EQ(fleet_->calls(Op::Quiesce, "us-east"), 1);
    EXPECT_EQ(fleet_->calls(Op::Promote, "us-west"), 1);
    EXPECT_EQ(endpoints_["us-west"]->checks(), 5);
    EXPECT_EQ(fleet_->routedTo(), "us-west");
}

// =============================================================================
// Replication lag beyond RPO
// =============================================================================

TEST_F(FailoverScenarioTest, LaggingStandbysHoldEvaluationUntilLagDrops) {
    fleet_->setLag("us-west", 8min);
    fleet_->setLag("eu-central", 8min);

    failEastUntilUnreachable();
    EXPECT_EQ(snapshot().state, CoordinatorState::Evaluating);
    EXPECT_EQ(snapshot().primary, kEast);
    EXPECT_EQ(fleet_->calls(Op::Promote), 0);
    EXPECT_EQ(sink_->count(ControlEventKind::Escalation), 1);

    // Escalations repeat at most once per escalation interval.
    tick(200s);
    EXPECT_EQ(sink_->count(ControlEventKind::Escalation), 1);
    tick(230s);
    EXPECT_EQ(sink_->count(ControlEventKind::Escalation), 2);
    EXPECT_EQ(snapshot().state, CoordinatorState::Evaluating);

    fleet_->setLag("us-west", 30s);
    tick(240s);
    EXPECT_EQ(snapshot().state, CoordinatorState::Stable);
    EXPECT_EQ(snapshot().primary, kWest);
}

TEST_F(FailoverScenarioTest, OperatorForcesFailoverPastRpo) {
    fleet_->setLag("us-west", 8min);
    fleet_->setLag("eu-central", 8min);
    failEastUntilUnreachable();
    ASSERT_EQ(snapshot().state, CoordinatorState::Evaluating);

    ManualSignal force;
    force.kind = ManualSignalKind::ForceFailover;
    force.service = kCheckout;
    force.operatorId = "alice";
    force.target = RegionId("eu-central");
    ASSERT_TRUE(controller_->process(kCheckout, force));

    auto snap = snapshot();
    EXPECT_EQ(snap.state, CoordinatorState::Stable);
    EXPECT_EQ(snap.primary, RegionId("eu-central"));
    ASSERT_TRUE(snap.lastEvent.has_value());
    EXPECT_TRUE(snap.lastEvent->manual());
}

TEST_F(FailoverScenarioTest, OperatorAbortStopsEvaluation) {
    fleet_->setLag("us-west", 8min);
    fleet_->setLag("eu-central", 8min);
    failEastUntilUnreachable();

    auto handler = controller_->requestHandler();
    auto denied = handler(
        httpCall("POST", "/services/checkout/abort", {}, "Bearer mallory-token"));
    ASSERT_TRUE(denied.has_value());
    EXPECT_EQ(denied->status, 403);

    // Naming an authorized operator in the query grants nothing.
    auto spoofed = handler(httpCall("POST", "/services/checkout/abort", "operator=alice"));
    ASSERT_TRUE(spoofed.has_value());
    EXPECT_EQ(spoofed->status, 401);
    EXPECT_EQ(snapshot().state, CoordinatorState::Evaluating);

    ManualSignal abort;
    abort.kind = ManualSignalKind::Abort;
    abort.service = kCheckout;
    abort.operatorId = "alice";
    ASSERT_TRUE(controller_->process(kCheckout, abort));
    EXPECT_EQ(snapshot().state, CoordinatorState::Aborted);

    fleet_->setLag("us-west", 0s);
    tick(300s);
    EXPECT_EQ(snapshot().state, CoordinatorState::Aborted);
    EXPECT_EQ(fleet_->calls(Op::Promote), 0);
}

// =============================================================================
// Failed verification
// =============================================================================

TEST_F(FailoverScenarioTest, UnhealthyTargetIsRolledBack) {
    endpoints_["us-west"]->setHealthy(false);
    // us-west still looks healthy to the detector: only verification sees it.
    failEastUntilUnreachable();

    auto snap = snapshot();
    ASSERT_TRUE(snap.lastEvent.has_value());
    EXPECT_EQ(snap.lastEvent->phase(), FailoverPhase::RolledBack);
    EXPECT_EQ(snap.lastEvent->toRegion(), kWest);
    EXPECT_EQ(fleet_->calls(Op::Demote, "us-west"), 1);
    EXPECT_EQ(sink_->count(ControlEventKind::FailoverRolledBack), 1);
}

// =============================================================================
// Operator routes
// =============================================================================

TEST_F(FailoverScenarioTest, OperatorRoutes) {
    auto handler = controller_->requestHandler();

    auto status = handler(httpCall("GET", "/status"));
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->status, 200);
    EXPECT_NE(status->body.find("\"service\":\"checkout\""), std::string::npos);
    EXPECT_NE(status->body.find("\"state\":\"stable\""), std::string::npos);

    EXPECT_EQ(handler(httpCall("POST", "/status"))->status, 405);
    EXPECT_EQ(handler(httpCall("GET", "/services/checkout/abort", {}, kAlice))->status, 405);
    EXPECT_FALSE(handler(httpCall("GET", "/unknown")).has_value());
    EXPECT_FALSE(handler(httpCall("POST", "/services/checkout/reboot")).has_value());
    EXPECT_EQ(handler(httpCall("POST", "/services/search/abort", {}, kAlice))->status, 404);

    auto queued = handler(httpCall("POST", "/services/checkout/force-failover",
                                   "target=us-west&note=drill", kAlice));
    ASSERT_TRUE(queued.has_value());
    EXPECT_EQ(queued->status, 202);
}

TEST_F(FailoverScenarioTest, OperatorRoutesRequireBearerToken) {
    auto handler = controller_->requestHandler();
    const std::string_view path = "/services/checkout/clear-abort";

    EXPECT_EQ(handler(httpCall("POST", path))->status, 401);
    EXPECT_EQ(handler(httpCall("POST", path, {}, "Bearer wrong-token"))->status, 401);
    EXPECT_EQ(handler(httpCall("POST", path, {}, "Basic YWxpY2U6YWxpY2UtdG9rZW4="))->status,
              401);
    EXPECT_EQ(handler(httpCall("POST", path, {}, "Bearer "))->status, 401);
    EXPECT_EQ(handler(httpCall("POST", path, "operator=alice"))->status, 401);

    // The scheme is case-insensitive.
    auto accepted = handler(httpCall("POST", path, {}, "bearer alice-token"));
    ASSERT_TRUE(accepted.has_value());
    EXPECT_EQ(accepted->status, 202);

    EXPECT_EQ(handler(httpCall("GET", "/status"))->status, 200);
}

TEST(OperatorRoutesDisabledTest, NoTokensMeansNoSignalsOverHttp) {
    FleetConfig fleet;
    fleet.services.push_back(checkoutSpec());
    fleet.controller.authorizedOperators = {"alice"};

    ControlMetrics metrics;
    ControllerOptions options;
    options.journalEnabled = false;
    options.probingEnabled = false;
    options.endpoints = [](const ServiceSpec&, const RegionSpec&) {
        return std::make_shared<FakeEndpoint>(true);
    };
    AvailabilityController controller(fleet, FakeFleet::apis(std::make_shared<FakeFleet>()),
                                      metrics, std::move(options));
    auto handler = controller.requestHandler();
    auto reply = handler(httpCall("POST", "/services/checkout/abort", {}, kAlice));
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->status, 401);
}

TEST_F(FailoverScenarioTest, UnknownServiceInputsAreRejected) {
    auto stray = sampleAt(checkoutSpec(), "us-east", kStart, true);
    stray.service = ServiceId("search");
    EXPECT_EQ(controller_->submitSample(stray).error().code(), ErrorCode::ServiceNotFound);
    EXPECT_EQ(controller_->process(ServiceId("search"), DecisionTick{kStart}).error().code(),
              ErrorCode::ServiceNotFound);
    EXPECT_EQ(controller_->snapshot(ServiceId("search")).error().code(),
              ErrorCode::ServiceNotFound);
}
