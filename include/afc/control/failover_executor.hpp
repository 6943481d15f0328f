#pragma once

/// @file failover_executor.hpp
/// @brief Runs the ordered, idempotent failover steps of a FailoverEvent.

#include "afc/control/cancellation.hpp"
#include "afc/control/external_apis.hpp"
#include "afc/control/failover_event.hpp"
#include "afc/foundation/control_result.hpp"

#include <functional>

namespace afc::foundation {
class ControlMetrics;
}

namespace afc::control {

class RegionStateStore;

/// Invoked after every mutation of the event's history, before the executor
/// takes its next action (journal append, coordinator snapshot).
using EventRecorder = std::function<void(const FailoverEvent&)>;

/// Executes the four failover steps with per-step timeout, bounded
/// exponential-backoff retry and compensation.
///
/// | Step              | Action                          | Compensation               |
/// |-------------------|---------------------------------|----------------------------|
/// | quiesce_writes    | quiesce old primary (skipped if | resume writes on old       |
/// |                   | it is unreachable)              | primary                    |
/// | promote_database  | promote target                  | demote target              |
/// | update_routing    | route service to target         | route back to old primary  |
/// | resume_writes     | resume writes on target         | quiesce target             |
///
/// execute() starts at the first step that is neither succeeded nor skipped,
/// so re-invoking it after a crash or failure resumes where it stopped. An
/// attempt that errors or outlives the step timeout is a failed attempt.
/// Around promotion the target's store state goes healthy -> promoting ->
/// promoted and is restored if promotion does not complete.
class FailoverExecutor {
public:
    FailoverExecutor(FleetApis apis, RegionStateStore& store,
                     foundation::ControlMetrics& metrics);

    FailoverExecutor(const FailoverExecutor&) = delete;
    FailoverExecutor& operator=(const FailoverExecutor&) = delete;

    void setRecorder(EventRecorder recorder);

    /// Run the remaining steps.
    /// @return Success when every step is done; ExecutorStepFailure after a
    ///         step exhausted its retries; StepCancelled if @p token tripped.
    foundation::ControlResult<void> execute(FailoverEvent& event, const ServiceSpec& spec,
                                            const CancellationToken& token);

    /// Compensate, in reverse order, every step that succeeded and every
    /// failed or cancelled step with at least one attempt.
    /// @return Success, or RollbackFailure if any compensation failed.
    foundation::ControlResult<void> rollback(FailoverEvent& event, const ServiceSpec& spec);

private:
    foundation::ControlResult<std::string> invoke(StepKind step, const FailoverEvent& event,
                                                  Millis timeout);
    foundation::ControlResult<void> compensate(StepKind step, const FailoverEvent& event,
                                               Millis timeout);

    foundation::ControlResult<void> enterPromoting(const FailoverEvent& event);
    foundation::ControlResult<void> markPromoted(const FailoverEvent& event);
    void restoreTarget(const FailoverEvent& event, RegionState to);

    foundation::ControlResult<void> record(FailoverEvent& event, const StepRecord& rec);

    FleetApis apis_;
    RegionStateStore& store_;
    foundation::ControlMetrics& metrics_;
    EventRecorder recorder_;
};

} // namespace afc::control
