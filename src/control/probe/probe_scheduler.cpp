/// @file probe_scheduler.cpp
/// @brief ProbeScheduler over TaskScheduler interval tasks.

#include "afc/control/probe_scheduler.hpp"

#include "afc/foundation/control_logger.hpp"
#include "afc/foundation/control_metrics.hpp"
#include "afc/foundation/task_scheduler.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace afc::control {

using foundation::ControlError;
using foundation::ControlResult;
using foundation::ErrorCode;
using foundation::HistogramBuckets;
using foundation::LogCategory;
using foundation::seriesKey;

namespace {

/// Clears the in-flight flag however the tick leaves the task.
struct InFlightGuard {
    explicit InFlightGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~InFlightGuard() { flag_.store(false, std::memory_order_release); }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

struct ProbeScheduler::Impl {
    foundation::TaskScheduler scheduler;
    foundation::ControlMetrics& metrics;
    std::atomic<uint64_t> suppressed{0};
    std::atomic<std::size_t> probes{0};

    std::atomic<bool> running{false};
    std::thread timerThread;
    std::mutex timerMutex;
    std::condition_variable timerCv;

    Impl(std::size_t threads, foundation::ControlMetrics& m) : scheduler(threads), metrics(m) {}

    void runTimer(Millis resolution) {
        auto last = Clock::now();
        std::unique_lock lock(timerMutex);
        while (running.load(std::memory_order_relaxed)) {
            timerCv.wait_for(lock, resolution);
            if (!running.load(std::memory_order_relaxed)) {
                break;
            }
            auto now = Clock::now();
            auto delta = std::chrono::duration_cast<Millis>(now - last);
            last = now;
            lock.unlock();
            scheduler.processTick(delta);
            lock.lock();
        }
    }
};

ProbeScheduler::ProbeScheduler(std::size_t threads, foundation::ControlMetrics& metrics)
    : impl_(std::make_unique<Impl>(threads, metrics)) {}

ProbeScheduler::~ProbeScheduler() {
    stop();
}

ControlResult<void> ProbeScheduler::add(std::shared_ptr<HealthProbe> probe,
                                        Millis interval, SampleSink sink) {
    if (!probe || !sink) {
        return ControlResult<void>::err(
            ControlError(ErrorCode::InvalidArgument, "probe and sink are required"));
    }

    foundation::MetricLabels labels{{"service", probe->service().value()},
                                    {"region", probe->region().value()}};
    auto latencySeries = seriesKey("afc_probe_latency_ms", labels);
    auto suppressedSeries = seriesKey("afc_probe_suppressed_total", labels);
    impl_->metrics.registerHistogram(latencySeries, HistogramBuckets::probeLatency());

    auto name = "probe:" + probe->service().value() + "/" + probe->region().value();
    auto inFlight = std::make_shared<std::atomic<bool>>(false);
    auto* impl = impl_.get();

    auto task = [impl, probe, sink = std::move(sink), inFlight, labels,
                 latencySeries, suppressedSeries]() {
        if (inFlight->exchange(true, std::memory_order_acq_rel)) {
            impl->suppressed.fetch_add(1, std::memory_order_relaxed);
            impl->metrics.incrementCounter(suppressedSeries);
            AFC_LOG_DEBUG(LogCategory::Probe,
                          "probe still in flight, tick suppressed for " +
                              probe->service().value() + "/" + probe->region().value());
            return;
        }

        InFlightGuard guard(*inFlight);
        auto sample = probe->probe();
        auto outcomeLabels = labels;
        outcomeLabels.emplace_back("outcome", std::string(probeOutcomeName(sample.outcome)));
        impl->metrics.incrementCounter(seriesKey("afc_probe_total", outcomeLabels));
        impl->metrics.recordHistogram(latencySeries, static_cast<double>(sample.latency.count()));

        try {
            sink(std::move(sample));
        } catch (const std::exception& e) {
            AFC_LOG_ERROR(LogCategory::Probe, std::string("sample sink failed: ") + e.what());
        } catch (...) {
            AFC_LOG_ERROR(LogCategory::Probe, "sample sink threw a non-standard exception");
        }
    };

    auto id = impl_->scheduler.scheduleInterval(std::move(name), interval, std::move(task));
    if (!id) {
        return ControlResult<void>::err(id.error());
    }
    impl_->probes.fetch_add(1, std::memory_order_relaxed);
    return ControlResult<void>::ok();
}

ControlResult<void> ProbeScheduler::start(Millis resolution) {
    if (impl_->running.exchange(true)) {
        return ControlResult<void>::ok();
    }
    impl_->timerThread = std::thread([this, resolution]() { impl_->runTimer(resolution); });
    AFC_LOG_INFO(LogCategory::Probe,
                 "probe scheduler started with " + std::to_string(probeCount()) + " probe(s)");
    return ControlResult<void>::ok();
}

void ProbeScheduler::stop() {
    if (impl_->running.exchange(false)) {
        {
            std::lock_guard lock(impl_->timerMutex);
        }
        impl_->timerCv.notify_all();
        if (impl_->timerThread.joinable()) {
            impl_->timerThread.join();
        }
    }
    impl_->scheduler.shutdown();
}

std::size_t ProbeScheduler::tick(Millis delta) {
    return impl_->scheduler.processTick(delta);
}

std::size_t ProbeScheduler::probeCount() const {
    return impl_->probes.load(std::memory_order_relaxed);
}

uint64_t ProbeScheduler::suppressedCount() const {
    return impl_->suppressed.load(std::memory_order_relaxed);
}

bool ProbeScheduler::isRunning() const {
    return impl_->running.load(std::memory_order_relaxed);
}

} // namespace afc::control
