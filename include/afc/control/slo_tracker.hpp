#pragma once

/// @file slo_tracker.hpp
/// @brief Rolling-window SLO compliance and error-budget burn rate.

#include "afc/control/fleet_types.hpp"
#include "afc/foundation/control_result.hpp"

#include <deque>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace afc::control {

/// Error budget of one service over one window, recomputed per query.
struct ErrorBudget {
    ServiceId service;
    TimePoint windowStart{};
    TimePoint windowEnd{};
    uint64_t totalSamples = 0;
    uint64_t consumedFailures = 0;
    double allowedFailures = 0.0;  ///< totalSamples * (1 - target)
    double compliance = 1.0;
    double burnRate = 0.0;

    /// Fraction of the budget still unspent (negative once overspent).
    [[nodiscard]] double remainingRatio() const {
        if (allowedFailures <= 0.0) {
            return consumedFailures == 0 ? 1.0 : -1.0;
        }
        return 1.0 - static_cast<double>(consumedFailures) / allowedFailures;
    }
};

/// Burn rate for a compliance against a target:
/// 0 when compliance >= target, otherwise (1 - compliance) / (1 - target).
[[nodiscard]] double computeBurnRate(double compliance, double target);

/// Time-ordered outcome series with cumulative good counts, so any window
/// count is an exact difference of two prefix sums.
class SampleSeries {
public:
    void add(TimePoint at, bool good);

    /// Drop samples at or before @p cutoff.
    void evictThrough(TimePoint cutoff);

    /// Samples in the half-open interval (from, to]: {good, total}.
    [[nodiscard]] std::pair<uint64_t, uint64_t> count(TimePoint from, TimePoint to) const;

    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] TimePoint latest() const { return entries_.back().at; }

private:
    struct Entry {
        TimePoint at;
        bool good;
        uint64_t cumGood;  ///< Good samples up to and including this one.
    };

    [[nodiscard]] uint64_t goodBefore(std::size_t index) const;

    std::deque<Entry> entries_;
};

/// Per-service sliding windows over probe outcomes.
///
/// A sample is good iff it succeeded within the service's latency ceiling.
/// Samples older than the longest window (relative to the newest sample) are
/// evicted on every record. Queries take an explicit `now`; an empty window
/// has compliance 1.0 and burn rate 0.
///
/// Thread-safe (shared_mutex: many readers, serialized writers).
class SloTracker {
public:
    SloTracker() = default;

    SloTracker(const SloTracker&) = delete;
    SloTracker& operator=(const SloTracker&) = delete;

    /// Start tracking a service. Re-registering keeps existing samples.
    void registerService(const ServiceSpec& spec);

    /// Append a sample. @return ServiceNotFound for an unregistered service.
    foundation::ControlResult<void> record(const ProbeSample& sample);

    [[nodiscard]] foundation::ControlResult<double> compliance(
        const ServiceId& service, SloWindow window, TimePoint now) const;

    [[nodiscard]] foundation::ControlResult<double> burnRate(
        const ServiceId& service, SloWindow window, TimePoint now) const;

    /// Region-scoped compliance: only samples of @p region count.
    [[nodiscard]] foundation::ControlResult<double> compliance(
        const ServiceId& service, const RegionId& region, SloWindow window, TimePoint now) const;

    [[nodiscard]] foundation::ControlResult<double> burnRate(
        const ServiceId& service, const RegionId& region, SloWindow window, TimePoint now) const;

    [[nodiscard]] foundation::ControlResult<ErrorBudget> errorBudget(
        const ServiceId& service, SloWindow window, TimePoint now) const;

    /// Samples currently retained for @p service (0 if unknown).
    [[nodiscard]] std::size_t sampleCount(const ServiceId& service) const;

    [[nodiscard]] std::chrono::seconds windowLength(const ServiceId& service,
                                                    SloWindow window) const;

private:
    struct ServiceWindows {
        SloTarget target;
        SloWindows windows;
        SampleSeries all;
        std::unordered_map<RegionId, SampleSeries> byRegion;

        [[nodiscard]] std::chrono::seconds length(SloWindow w) const {
            return w == SloWindow::Short ? windows.shortWindow : windows.longWindow;
        }
    };

    foundation::ControlResult<const ServiceWindows*> find(const ServiceId& service) const;

    mutable std::shared_mutex mutex_;
    std::unordered_map<ServiceId, ServiceWindows> services_;
};

} // namespace afc::control
