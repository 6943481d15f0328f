#pragma once

/// @file failure_detector.hpp
/// @brief Per (service, region) hysteresis state machine over probe samples
///        and region-scoped burn rate.

#include "afc/control/fleet_types.hpp"
#include "afc/foundation/control_result.hpp"

#include <atomic>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace afc::control {

class RegionStateStore;
class SloTracker;

enum class DetectorState : uint8_t {
    Healthy,
    SuspectedDegraded,
    Degraded,
    Unreachable,
    Recovering
};

[[nodiscard]] std::string_view detectorStateName(DetectorState state);

/// Store state written for a detector state.
[[nodiscard]] RegionState storeStateFor(DetectorState state);

/// An accepted detector transition, handed to the coordinator.
struct DetectorTransition {
    ServiceId service;
    RegionId region;
    DetectorState from = DetectorState::Healthy;
    DetectorState to = DetectorState::Healthy;
    TimePoint at{};
    std::string reason;
};

/// Failure detector for every registered (service, region).
///
/// Degradation path (one step per evaluation):
///   Healthy -> SuspectedDegraded   one failure, or short burn > suspect rate
///   SuspectedDegraded -> Degraded  N consecutive failures within T
///   Degraded -> Unreachable        short burn > hard rate for a full short
///                                  window, or a failure streak >= RTO / 2
/// Recovery path (M consecutive successes per step, M > N):
///   SuspectedDegraded -> Healthy, Degraded|Unreachable -> Recovering,
///   Recovering -> Healthy. Entering Healthy also needs short burn <= suspect
///   rate; a failure while Recovering falls back to Degraded.
///
/// A transition is accepted only once the mapped store state is written with
/// compare-and-set (one re-read and retry on conflict). Writes over
/// executor-owned store states, or a second conflict, defer the transition to
/// a later evaluation. The detector never acts on the executor.
class FailureDetector {
public:
    FailureDetector(RegionStateStore& store, const SloTracker& slo);

    FailureDetector(const FailureDetector&) = delete;
    FailureDetector& operator=(const FailureDetector&) = delete;

    void registerService(const ServiceSpec& spec);

    /// Consume a sample already recorded in the SLO tracker.
    /// @return Accepted transitions (zero or one).
    std::vector<DetectorTransition> onSample(const ProbeSample& sample);

    /// Re-evaluate time and burn based rules for every region of @p service.
    std::vector<DetectorTransition> evaluate(const ServiceId& service, TimePoint now);

    [[nodiscard]] foundation::ControlResult<DetectorState> state(const ServiceId& service,
                                                                 const RegionId& region) const;

    /// Transitions deferred because the store write could not be applied.
    [[nodiscard]] uint64_t deferredCount() const {
        return deferred_.load(std::memory_order_relaxed);
    }

private:
    struct PairState {
        DetectorState state = DetectorState::Healthy;
        uint32_t consecutiveFailures = 0;
        uint32_t consecutiveSuccesses = 0;
        std::deque<TimePoint> recentFailures;  // last N failures of the streak
        std::optional<TimePoint> streakStart;
        std::optional<TimePoint> hardBurnSince;
    };

    struct Proposal {
        DetectorState to;
        std::string reason;
    };

    std::optional<Proposal> decide(const ServiceSpec& spec, const PairState& pair,
                                   std::optional<bool> sampleSucceeded, double burn,
                                   TimePoint now) const;

    bool applyToStore(const ServiceId& service, const RegionId& region,
                      DetectorState from, DetectorState to);

    std::optional<DetectorTransition> step(const ServiceSpec& spec, const RegionId& region,
                                           PairState& pair,
                                           std::optional<bool> sampleSucceeded,
                                           TimePoint now);

    RegionStateStore& store_;
    const SloTracker& slo_;

    mutable std::mutex mutex_;
    std::unordered_map<ServiceId, ServiceSpec> specs_;
    std::unordered_map<ServiceId, std::unordered_map<RegionId, PairState>> pairs_;
    std::atomic<uint64_t> deferred_{0};
};

} // namespace afc::control
