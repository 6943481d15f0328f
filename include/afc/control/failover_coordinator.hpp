#pragma once

/// @file failover_coordinator.hpp
/// @brief Per-service failover state machine. Owns the service's single live
///        FailoverEvent and drives the FailoverExecutor through it.

#include "afc/control/cancellation.hpp"
#include "afc/control/external_apis.hpp"
#include "afc/control/failover_event.hpp"
#include "afc/control/failover_executor.hpp"
#include "afc/control/failure_detector.hpp"
#include "afc/control/notifier.hpp"
#include "afc/foundation/control_result.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace afc::foundation {
class ControlMetrics;
}

namespace afc::control {

class FailoverJournal;
class RegionStateStore;
class SloTracker;

enum class CoordinatorState : uint8_t {
    Stable,
    Evaluating,
    FailoverInProgress,
    Verifying,
    RollingBack,
    Aborted
};

[[nodiscard]] std::string_view coordinatorStateName(CoordinatorState state);

enum class ManualSignalKind : uint8_t {
    Abort,          ///< Evaluating -> Aborted, or cancel the running failover.
    ForceFailover,  ///< Start a failover to `target` regardless of criteria.
    ClearAbort      ///< Aborted -> Stable(designated primary).
};

[[nodiscard]] std::string_view manualSignalKindName(ManualSignalKind kind);

/// Operator override. Never inferred by the controller.
struct ManualSignal {
    ManualSignalKind kind = ManualSignalKind::Abort;
    ServiceId service;
    std::string operatorId;
    std::optional<RegionId> target;
    std::string note;
};

/// Point-in-time view of a coordinator.
struct CoordinatorSnapshot {
    ServiceId service;
    CoordinatorState state = CoordinatorState::Stable;
    RegionId primary;
    std::optional<RegionId> target;
    std::optional<FailoverEvent> liveEvent;
    std::optional<FailoverEvent> lastEvent;
    uint64_t escalations = 0;
};

/// Monotonic source of FailoverEventIds shared by every coordinator.
class EventIdSequence {
public:
    /// Continue after @p last (ids read back from the journal).
    void seed(uint64_t last) {
        uint64_t current = last_.load();
        while (current < last && !last_.compare_exchange_weak(current, last)) {
        }
    }

    FailoverEventId next() { return FailoverEventId(last_.fetch_add(1) + 1); }

private:
    std::atomic<uint64_t> last_{0};
};

/// Direct probe of one region, used for post-failover verification.
using RegionProber = std::function<ProbeSample(const ServiceId&, const RegionId&)>;

/// Collaborators of a coordinator. References must outlive it.
struct CoordinatorContext {
    RegionStateStore& store;
    const SloTracker& slo;
    Notifier& notifier;
    foundation::ControlMetrics& metrics;
    EventIdSequence& ids;
    FleetApis apis;
    RegionProber prober;
    FailoverJournal* journal = nullptr;
    std::vector<std::string> authorizedOperators;
};

/// Failover state machine of one service.
///
///   Stable(R) --primary unreachable / hard burn >= RTO--> Evaluating
///   Evaluating --qualified target R'--> FailoverInProgress(R')
///   Evaluating --primary healthy, burn cleared--> Stable(R)
///   FailoverInProgress --steps done--> Verifying
///   FailoverInProgress --step failed--> RollingBack
///   Verifying --N probes succeed--> Stable(R')
///   Verifying --any probe fails--> RollingBack
///   RollingBack --compensated--> Stable(R)
///   RollingBack --compensation failed--> Aborted
///
/// A qualified target is the first region in priority order whose store state
/// is Healthy and whose replication lag is within the RPO. Without one the
/// coordinator stays in Evaluating and escalates at most once per escalation
/// interval. At most one live FailoverEvent exists per service: a trigger
/// observed while one is live is refused with FailoverAlreadyLive.
///
/// Execution runs on the calling thread (the service's decision loop);
/// cancelRunning() may be called from any thread.
class FailoverCoordinator {
public:
    FailoverCoordinator(ServiceSpec spec, CoordinatorContext context);

    FailoverCoordinator(const FailoverCoordinator&) = delete;
    FailoverCoordinator& operator=(const FailoverCoordinator&) = delete;

    /// React to an accepted detector transition.
    void onTransition(const DetectorTransition& transition, TimePoint now);

    /// Periodic re-check: trigger conditions, target selection, escalation.
    void tick(TimePoint now);

    /// Apply an operator signal.
    /// @return PermissionDenied for an unauthorized operator, InvalidTransition
    ///         if the signal does not apply in the current state,
    ///         FailoverAlreadyLive for a forced failover during a live event.
    foundation::ControlResult<void> signal(const ManualSignal& signal);

    /// Trip the cancellation token of the running event (if any).
    /// The running failover compensates its completed steps and ends Aborted.
    void cancelRunning();

    /// Continue a live event read back from the journal.
    foundation::ControlResult<void> resume(FailoverEvent event);

    [[nodiscard]] bool isAuthorized(const std::string& operatorId) const;

    [[nodiscard]] CoordinatorState state() const;
    [[nodiscard]] CoordinatorSnapshot snapshot() const;
    [[nodiscard]] const ServiceSpec& spec() const { return spec_; }

private:
    /// Claim the live slot and create the event under the lock.
    foundation::ControlResult<FailoverEvent> begin(const RegionId& target,
                                                   std::string reason, bool manual);

    /// Execute, verify, complete or roll back a claimed event.
    void drive(FailoverEvent event);

    bool verify(const FailoverEvent& event);
    foundation::ControlResult<void> complete(FailoverEvent& event);
    void rollBack(FailoverEvent& event, bool aborting, const std::string& cause);
    /// Journal the final snapshot, free the live slot and leave the
    /// in-progress states for Stable or (when @p abort) Aborted.
    void finish(const FailoverEvent& event, bool abort, const std::string& outcome);

    foundation::ControlResult<void> applySignal(const ManualSignal& signal);
    void evaluate(TimePoint now);

    [[nodiscard]] RegionId currentPrimary() const;
    std::optional<RegionId> selectTarget(const RegionId& primary, std::string& why);
    bool hardBurnSustained(const RegionId& primary, TimePoint now);
    [[nodiscard]] bool primaryUnreachable(const RegionId& primary) const;
    void escalate(TimePoint now, const std::string& why);

    void setState(CoordinatorState next, const std::string& why);
    void announce(CoordinatorState from, CoordinatorState to, const std::string& why);

    /// Store the snapshot and journal it. @return Steps changed since the
    ///         previous snapshot.
    std::vector<StepRecord> recordEvent(const FailoverEvent& event);
    void publishEvent(ControlEventKind kind, const FailoverEvent& event,
                      const std::string& message);

    ServiceSpec spec_;
    CoordinatorContext ctx_;
    FailoverExecutor executor_;

    mutable std::mutex mutex_;
    CoordinatorState state_ = CoordinatorState::Stable;
    std::optional<RegionId> target_;
    std::optional<FailoverEvent> live_;
    std::optional<FailoverEvent> last_;
    std::shared_ptr<CancellationToken> token_;
    bool abortRequested_ = false;
    std::optional<TimePoint> hardBurnSince_;
    std::optional<TimePoint> lastEscalation_;
    uint64_t escalations_ = 0;
};

} // namespace afc::control
