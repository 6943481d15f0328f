#pragma once

/// @file probe_scheduler.hpp
/// @brief Fixed-interval probing of every (service, region) on a thread pool.

#include "afc/control/health_probe.hpp"
#include "afc/foundation/control_result.hpp"

#include <cstdint>
#include <functional>
#include <memory>

namespace afc::foundation {
class ControlMetrics;
}

namespace afc::control {

/// Receives every sample a scheduled probe produces.
using SampleSink = std::function<void(ProbeSample)>;

/// Runs one recurring probe task per registered HealthProbe.
///
/// A timer thread advances the TaskScheduler's interval tasks; each due probe
/// runs on a pool worker. If the previous invocation for the same pair is
/// still in flight when the next one starts, the new one is suppressed and
/// counted in `afc_probe_suppressed_total`.
///
/// @code
///   ProbeScheduler scheduler(4, ControlMetrics::instance());
///   scheduler.add(probe, std::chrono::seconds(10),
///                 [&loop](ProbeSample s) { loop.submitSample(std::move(s)); });
///   scheduler.start();
/// @endcode
class ProbeScheduler {
public:
    ProbeScheduler(std::size_t threads, foundation::ControlMetrics& metrics);
    ~ProbeScheduler();

    ProbeScheduler(const ProbeScheduler&) = delete;
    ProbeScheduler& operator=(const ProbeScheduler&) = delete;

    /// Register a probe. The first invocation happens on the first tick.
    foundation::ControlResult<void> add(std::shared_ptr<HealthProbe> probe,
                                        Millis interval, SampleSink sink);

    /// Start the timer thread.
    foundation::ControlResult<void> start(Millis resolution = Millis{100});

    /// Stop the timer thread and wait for running probes. Idempotent.
    void stop();

    /// Advance timers by @p delta and dispatch due probes without the timer
    /// thread. Returns the number of probes dispatched.
    std::size_t tick(Millis delta);

    [[nodiscard]] std::size_t probeCount() const;
    [[nodiscard]] uint64_t suppressedCount() const;
    [[nodiscard]] bool isRunning() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace afc::control
