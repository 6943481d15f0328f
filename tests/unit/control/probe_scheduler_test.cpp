#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "afc/control/probe_scheduler.hpp"
#include "afc/foundation/control_metrics.hpp"
#include "support/control_fakes.hpp"

using namespace afc::control;
using afc::foundation::ControlMetrics;
using afc::foundation::ErrorCode;
using afc::foundation::seriesKey;
using afc::test::FakeEndpoint;
using namespace std::chrono_literals;

namespace {

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds limit = 2s) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(1ms);
    }
    return pred();
}

/// Endpoint that blocks until released, to hold a probe in flight.
class HeldEndpoint : public HealthEndpoint {
public:
    HealthCheckOutcome check(Millis) override {
        std::unique_lock lock(mutex_);
        ++entered_;
        cv_.notify_all();
        cv_.wait(lock, [this] { return released_; });
        return HealthCheckOutcome{true, false, {}};
    }

    void release() {
        {
            std::lock_guard lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

    bool waitEntered() {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, 2s, [this] { return entered_ > 0; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    int entered_ = 0;
    bool released_ = false;
};

struct Collected {
    std::mutex mutex;
    std::vector<ProbeSample> samples;

    SampleSink sink() {
        return [this](ProbeSample s) {
            std::lock_guard lock(mutex);
            samples.push_back(std::move(s));
        };
    }

    std::size_t size() {
        std::lock_guard lock(mutex);
        return samples.size();
    }
};

std::shared_ptr<HealthProbe> probeOf(const std::string& region,
                                     std::shared_ptr<HealthEndpoint> endpoint) {
    return std::make_shared<HealthProbe>(ServiceId("checkout"), RegionId(region),
                                         std::move(endpoint), Millis{1000});
}

}  // namespace

TEST(ProbeSchedulerTest, RejectsMissingProbeOrSink) {
    ControlMetrics metrics;
    ProbeScheduler scheduler(1, metrics);
    auto noProbe = scheduler.add(nullptr, 10s, [](ProbeSample) {});
    ASSERT_TRUE(noProbe.hasError());
    EXPECT_EQ(noProbe.error().code(), ErrorCode::InvalidArgument);
    EXPECT_TRUE(scheduler.add(probeOf("us-east", std::make_shared<FakeEndpoint>()), 10s, {})
                    .hasError());
    EXPECT_EQ(scheduler.probeCount(), 0u);
}

TEST(ProbeSchedulerTest, TickDispatchesEveryPairOnce) {
    ControlMetrics metrics;
    ProbeScheduler scheduler(2, metrics);
    Collected collected;

    auto east = std::make_shared<FakeEndpoint>(true);
    auto west = std::make_shared<FakeEndpoint>(false);
    ASSERT_TRUE(scheduler.add(probeOf("us-east", east), 10s, collected.sink()));
    ASSERT_TRUE(scheduler.add(probeOf("us-west", west), 10s, collected.sink()));
    EXPECT_EQ(scheduler.probeCount(), 2u);

    EXPECT_EQ(scheduler.tick(1ms), 2u);
    ASSERT_TRUE(eventually([&] { return collected.size() == 2; }));

    // Nothing is due until the interval has elapsed again.
    EXPECT_EQ(scheduler.tick(5s), 0u);
    EXPECT_EQ(scheduler.tick(5s), 2u);
    ASSERT_TRUE(eventually([&] { return collected.size() == 4; }));
    EXPECT_EQ(east->checks(), 2);
    EXPECT_EQ(west->checks(), 2);
}

TEST(ProbeSchedulerTest, SamplesAreCountedByOutcome) {
    ControlMetrics metrics;
    ProbeScheduler scheduler(1, metrics);
    Collected collected;
    ASSERT_TRUE(scheduler.add(probeOf("us-west", std::make_shared<FakeEndpoint>(false)), 1s,
                              collected.sink()));

    scheduler.tick(1ms);
    ASSERT_TRUE(eventually([&] { return collected.size() == 1; }));

    auto failures = seriesKey("afc_probe_total", {{"service", "checkout"},
                                                  {"region", "us-west"},
                                                  {"outcome", "failure"}});
    EXPECT_TRUE(eventually([&] { return metrics.counterValue(failures) == 1; }));
    EXPECT_EQ(metrics.histogramCount(seriesKey(
                  "afc_probe_latency_ms", {{"service", "checkout"}, {"region", "us-west"}})),
              1u);
}

TEST(ProbeSchedulerTest, InFlightProbeSuppressesNextTick) {
    ControlMetrics metrics;
    ProbeScheduler scheduler(2, metrics);
    Collected collected;
    auto held = std::make_shared<HeldEndpoint>();
    ASSERT_TRUE(scheduler.add(probeOf("us-east", held), 100ms, collected.sink()));

    scheduler.tick(1ms);
    ASSERT_TRUE(held->waitEntered());

    scheduler.tick(100ms);
    EXPECT_TRUE(eventually([&] { return scheduler.suppressedCount() == 1; }));

    held->release();
    ASSERT_TRUE(eventually([&] { return collected.size() == 1; }));
    EXPECT_EQ(metrics.counterValue(seriesKey("afc_probe_suppressed_total",
                                             {{"service", "checkout"}, {"region", "us-east"}})),
              1u);
}

TEST(ProbeSchedulerTest, ThrowingSinkDoesNotWedgeProbe) {
    ControlMetrics metrics;
    ProbeScheduler scheduler(1, metrics);
    std::atomic<int> calls{0};
    ASSERT_TRUE(scheduler.add(probeOf("us-east", std::make_shared<FakeEndpoint>()), 1s,
                              [&](ProbeSample) {
                                  calls.fetch_add(1);
                                  throw std::runtime_error("queue gone");
                              }));

    scheduler.tick(1ms);
    ASSERT_TRUE(eventually([&] { return calls.load() == 1; }));
    // Give the worker a moment to clear the in-flight flag.
    std::this_thread::sleep_for(20ms);
    scheduler.tick(1s);
    EXPECT_TRUE(eventually([&] { return calls.load() == 2; }));
    EXPECT_EQ(scheduler.suppressedCount(), 0u);
}

TEST(ProbeSchedulerTest, NonStandardSinkExceptionDoesNotWedgeScheduling) {
    ControlMetrics metrics;
    ProbeScheduler scheduler(1, metrics);
    std::atomic<int> calls{0};
    ASSERT_TRUE(scheduler.add(probeOf("us-east", std::make_shared<FakeEndpoint>()), 1s,
                              [&](ProbeSample) {
                                  calls.fetch_add(1);
                                  throw 42;
                              }));

    scheduler.tick(1ms);
    ASSERT_TRUE(eventually([&] { return calls.load() == 1; }));
    std::this_thread::sleep_for(20ms);
    scheduler.tick(1s);
    EXPECT_TRUE(eventually([&] { return calls.load() == 2; }));
    EXPECT_EQ(scheduler.suppressedCount(), 0u);
}

TEST(ProbeSchedulerTest, TimerThreadDrivesProbes) {
    ControlMetrics metrics;
    ProbeScheduler scheduler(2, metrics);
    Collected collected;
    ASSERT_TRUE(scheduler.add(probeOf("us-east", std::make_shared<FakeEndpoint>()), 20ms,
                              collected.sink()));

    ASSERT_TRUE(scheduler.start(5ms));
    EXPECT_TRUE(scheduler.isRunning());
    EXPECT_TRUE(eventually([&] { return collected.size() >= 3; }));

    scheduler.stop();
    scheduler.stop();
    EXPECT_FALSE(scheduler.isRunning());
}
