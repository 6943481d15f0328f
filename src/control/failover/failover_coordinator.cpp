/// @file failover_coordinator.cpp
/// @brief FailoverCoordinator trigger evaluation, target selection,
///        verification, completion and rollback.

#include "afc/control/failover_coordinator.hpp"

#include "afc/control/failover_journal.hpp"
#include "afc/control/region_state_store.hpp"
#include "afc/control/slo_tracker.hpp"
#include "afc/foundation/control_logger.hpp"
#include "afc/foundation/control_metrics.hpp"
#include "afc/foundation/json_log_formatter.hpp"

#include <algorithm>

namespace afc::control {

using foundation::ControlError;
using foundation::ControlResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::seriesKey;

std::string_view coordinatorStateName(CoordinatorState state) {
    switch (state) {
        case CoordinatorState::Stable:             return "stable";
        case CoordinatorState::Evaluating:         return "evaluating";
        case CoordinatorState::FailoverInProgress: return "failover_in_progress";
        case CoordinatorState::Verifying:          return "verifying";
        case CoordinatorState::RollingBack:        return "rolling_back";
        case CoordinatorState::Aborted:            return "aborted";
    }
    return "unknown";
}

std::string_view manualSignalKindName(ManualSignalKind kind) {
    switch (kind) {
        case ManualSignalKind::Abort:         return "abort";
        case ManualSignalKind::ForceFailover: return "force_failover";
        case ManualSignalKind::ClearAbort:    return "clear_abort";
    }
    return "unknown";
}

namespace {

bool isLiveState(CoordinatorState state) {
    return state == CoordinatorState::FailoverInProgress ||
           state == CoordinatorState::Verifying || state == CoordinatorState::RollingBack;
}

std::string formatSeconds(std::chrono::seconds s) {
    return std::to_string(s.count()) + "s";
}

} // namespace

FailoverCoordinator::FailoverCoordinator(ServiceSpec spec, CoordinatorContext context)
    : spec_(std::move(spec)),
      ctx_(std::move(context)),
      executor_(ctx_.apis, ctx_.store, ctx_.metrics) {
    executor_.setRecorder([this](const FailoverEvent& event) {
        for (const auto& rec : recordEvent(event)) {
            publishEvent(ControlEventKind::StepRecorded, event,
                         std::string(stepKindName(rec.step)) + " " +
                             std::string(stepStatusName(rec.status)) +
                             (rec.message.empty() ? "" : ": " + rec.message));
        }
    });
    ctx_.metrics.registerHistogram(
        seriesKey("afc_failover_duration_seconds", {{"service", spec_.id.value()}}),
        foundation::HistogramBuckets::failoverDuration());
    ctx_.metrics.setGauge(seriesKey("afc_coordinator_state", {{"service", spec_.id.value()}}),
                          0.0);
}

// ---------------------------------------------------------------------------
// Triggers
// ---------------------------------------------------------------------------

void FailoverCoordinator::onTransition(const DetectorTransition& transition, TimePoint now) {
    auto current = state();
    if (current != CoordinatorState::Stable && current != CoordinatorState::Evaluating) {
        return;
    }
    // In Stable only the primary matters; in Evaluating a standby recovering
    // may produce a qualified target.
    if (current == CoordinatorState::Stable && transition.region != currentPrimary()) {
        return;
    }
    tick(now);
}

void FailoverCoordinator::tick(TimePoint now) {
    auto current = state();
    if (current == CoordinatorState::Stable) {
        auto primary = currentPrimary();
        if (primaryUnreachable(primary)) {
            setState(CoordinatorState::Evaluating, "primary " + primary.value() + " unreachable");
        } else if (hardBurnSustained(primary, now)) {
            setState(CoordinatorState::Evaluating,
                     "burn rate above " + std::to_string(spec_.detector.hardBurnRate) +
                         " for at least RTO " + formatSeconds(spec_.rto));
        } else {
            return;
        }
        current = state();
    }
    if (current == CoordinatorState::Evaluating) {
        evaluate(now);
    }
}

void FailoverCoordinator::evaluate(TimePoint now) {
    auto primary = currentPrimary();
    bool unreachable = primaryUnreachable(primary);
    bool burning = hardBurnSustained(primary, now);

    auto rec = ctx_.store.get(spec_.id, primary);
    if (!unreachable && !burning && rec && rec.value().state == RegionState::Healthy) {
        setState(CoordinatorState::Stable, "primary " + primary.value() + " recovered");
        return;
    }

    std::string why;
    auto target = selectTarget(primary, why);
    if (!target) {
        escalate(now, "no qualified failover target for " + spec_.id.value() + ": " + why);
        return;
    }

    std::string reason = unreachable ? "primary " + primary.value() + " unreachable"
                                     : "primary " + primary.value() + " burning error budget";
    auto claimed = begin(*target, std::move(reason), false);
    if (!claimed) {
        AFC_LOG_DEBUG(LogCategory::Coordinator,
                      "failover not started: " + std::string(claimed.error().message()));
        return;
    }
    drive(std::move(claimed.value()));
}

bool FailoverCoordinator::primaryUnreachable(const RegionId& primary) const {
    auto rec = ctx_.store.get(spec_.id, primary);
    return rec && rec.value().state == RegionState::Unreachable;
}

bool FailoverCoordinator::hardBurnSustained(const RegionId& primary, TimePoint now) {
    auto burn = ctx_.slo.burnRate(spec_.id, primary, SloWindow::Short, now);
    std::lock_guard lock(mutex_);
    if (!burn || burn.value() <= spec_.detector.hardBurnRate) {
        hardBurnSince_.reset();
        return false;
    }
    if (!hardBurnSince_) {
        hardBurnSince_ = now;
    }
    return now - *hardBurnSince_ >= spec_.rto;
}

std::optional<RegionId> FailoverCoordinator::selectTarget(const RegionId& primary,
                                                          std::string& why) {
    auto regions = ctx_.store.snapshot(spec_.id);
    if (!regions) {
        why = std::string(regions.error().message());
        return std::nullopt;
    }
    if (!ctx_.apis.replication) {
        why = "no replication monitor";
        return std::nullopt;
    }

    std::vector<std::string> rejected;
    for (const auto& rec : regions.value()) {
        if (rec.region == primary) {
            continue;
        }
        if (rec.state != RegionState::Healthy) {
            rejected.push_back(rec.region.value() + " is " +
                               std::string(regionStateName(rec.state)));
            continue;
        }
        auto lag = ctx_.apis.replication->replicationLag(spec_.id, rec.region,
                                                         spec_.step.timeout);
        if (!lag) {
            rejected.push_back(rec.region.value() + " lag unknown (" +
                               std::string(lag.error().message()) + ")");
            continue;
        }
        if (lag.value() > spec_.rpo) {
            rejected.push_back(rec.region.value() + " lag " + formatSeconds(lag.value()) +
                               " exceeds RPO " + formatSeconds(spec_.rpo));
            continue;
        }
        return rec.region;
    }

    for (std::size_t i = 0; i < rejected.size(); ++i) {
        why += (i == 0 ? "" : "; ") + rejected[i];
    }
    if (why.empty()) {
        why = "no standby regions";
    }
    return std::nullopt;
}

void FailoverCoordinator::escalate(TimePoint now, const std::string& why) {
    uint64_t count = 0;
    {
        std::lock_guard lock(mutex_);
        if (lastEscalation_ && now - *lastEscalation_ < spec_.escalationInterval) {
            return;
        }
        lastEscalation_ = now;
        count = ++escalations_;
    }

    AFC_LOG_WARN(LogCategory::Coordinator, why);
    ctx_.metrics.incrementCounter(
        seriesKey("afc_escalations_total", {{"service", spec_.id.value()}}));

    ControlEvent event;
    event.kind = ControlEventKind::Escalation;
    event.service = spec_.id;
    event.message = why;
    event.at = WallClock::now();
    event.fields.emplace_back("escalation_count", std::to_string(count));
    ctx_.notifier.notify(event);
}

// ---------------------------------------------------------------------------
// Manual signals
// ---------------------------------------------------------------------------

bool FailoverCoordinator::isAuthorized(const std::string& operatorId) const {
    const auto& ops = ctx_.authorizedOperators;
    return !operatorId.empty() && std::find(ops.begin(), ops.end(), operatorId) != ops.end();
}

ControlResult<void> FailoverCoordinator::signal(const ManualSignal& signal) {
    auto kind = std::string(manualSignalKindName(signal.kind));

    ControlEvent received;
    received.service = spec_.id;
    received.region = signal.target;
    received.at = WallClock::now();
    received.fields.emplace_back("signal", kind);
    received.fields.emplace_back("operator", signal.operatorId);

    ControlResult<void> result = ControlResult<void>::ok();
    if (!isAuthorized(signal.operatorId)) {
        result = ControlResult<void>::err(ControlError(
            ErrorCode::PermissionDenied,
            "operator '" + signal.operatorId + "' is not authorized for " + kind));
    } else {
        received.kind = ControlEventKind::ManualSignal;
        received.message = signal.note.empty() ? kind : kind + ": " + signal.note;
        ctx_.notifier.notify(received);
        result = applySignal(signal);
    }

    ctx_.metrics.incrementCounter(seriesKey(
        "afc_manual_signals_total",
        {{"service", spec_.id.value()}, {"signal", kind}, {"outcome", result ? "accepted" : "rejected"}}));

    if (!result) {
        AFC_LOG_WARN(LogCategory::Coordinator,
                     kind + " rejected: " + std::string(result.error().message()));
        received.kind = ControlEventKind::SignalRejected;
        received.message = std::string(result.error().message());
        ctx_.notifier.notify(received);
    }
    return result;
}

ControlResult<void> FailoverCoordinator::applySignal(const ManualSignal& signal) {
    switch (signal.kind) {
        case ManualSignalKind::Abort: {
            std::unique_lock lock(mutex_);
            auto current = state_;
            if (current == CoordinatorState::Aborted) {
                return ControlResult<void>::ok();
            }
            if (isLiveState(current)) {
                abortRequested_ = true;
                if (token_) {
                    token_->cancel();
                }
                return ControlResult<void>::ok();
            }
            if (current == CoordinatorState::Evaluating) {
                state_ = CoordinatorState::Aborted;
                lock.unlock();
                announce(current, CoordinatorState::Aborted,
                         "aborted by " + signal.operatorId);
                return ControlResult<void>::ok();
            }
            return ControlResult<void>::err(ControlError(
                ErrorCode::InvalidTransition, "nothing to abort while stable"));
        }

        case ManualSignalKind::ForceFailover: {
            if (!signal.target || !signal.target->isValid()) {
                return ControlResult<void>::err(
                    ControlError(ErrorCode::InvalidArgument, "force_failover needs a target"));
            }
            if (spec_.findRegion(*signal.target) == nullptr) {
                return ControlResult<void>::err(ControlError(
                    ErrorCode::RegionNotFound,
                    "region " + signal.target->value() + " is not a candidate of " +
                        spec_.id.value()));
            }
            if (*signal.target == currentPrimary()) {
                return ControlResult<void>::err(ControlError(
                    ErrorCode::InvalidArgument,
                    signal.target->value() + " is already the primary"));
            }
            auto claimed = begin(*signal.target, "manual failover by " + signal.operatorId,
                                 true);
            if (!claimed) {
                return ControlResult<void>::err(claimed.error());
            }
            drive(std::move(claimed.value()));
            return ControlResult<void>::ok();
        }

        case ManualSignalKind::ClearAbort: {
            std::unique_lock lock(mutex_);
            if (state_ != CoordinatorState::Aborted) {
                return ControlResult<void>::err(ControlError(
                    ErrorCode::InvalidTransition,
                    "clear_abort only applies to an aborted service"));
            }
            state_ = CoordinatorState::Stable;
            hardBurnSince_.reset();
            lastEscalation_.reset();
            lock.unlock();
            announce(CoordinatorState::Aborted, CoordinatorState::Stable,
                     "abort cleared by " + signal.operatorId);
            return ControlResult<void>::ok();
        }
    }
    return ControlResult<void>::err(ControlError(ErrorCode::InvalidArgument, "unknown signal"));
}

void FailoverCoordinator::cancelRunning() {
    std::lock_guard lock(mutex_);
    if (!isLiveState(state_)) {
        return;
    }
    abortRequested_ = true;
    if (token_) {
        token_->cancel();
    }
}

// ---------------------------------------------------------------------------
// Event lifecycle
// ---------------------------------------------------------------------------

ControlResult<FailoverEvent> FailoverCoordinator::begin(const RegionId& target,
                                                        std::string reason, bool manual) {
    auto primary = currentPrimary();
    CoordinatorState previous;
    FailoverEvent event;
    {
        std::lock_guard lock(mutex_);
        if (live_) {
            return ControlResult<FailoverEvent>::err(ControlError(
                ErrorCode::FailoverAlreadyLive,
                "failover " + std::to_string(live_->id().value()) + " is live for " +
                    spec_.id.value(),
                live_->id()));
        }
        if (state_ == CoordinatorState::Aborted) {
            return ControlResult<FailoverEvent>::err(ControlError(
                ErrorCode::InvalidTransition, spec_.id.value() + " is aborted"));
        }
        event = FailoverEvent(ctx_.ids.next(), spec_.id, primary, target, std::move(reason),
                              manual, WallClock::now());
        live_ = event;
        target_ = target;
        token_ = std::make_shared<CancellationToken>();
        abortRequested_ = false;
        previous = state_;
        state_ = CoordinatorState::FailoverInProgress;
    }

    if (ctx_.journal != nullptr) {
        auto appended = ctx_.journal->append(event);
        if (!appended) {
            AFC_LOG_ERROR(LogCategory::Coordinator,
                          "journal append failed: " + std::string(appended.error().message()));
        }
    }
    announce(previous, CoordinatorState::FailoverInProgress, event.reason());
    publishEvent(ControlEventKind::FailoverStarted, event,
                 "failover " + primary.value() + " -> " + target.value() + ": " +
                     event.reason());
    ctx_.metrics.incrementCounter(
        seriesKey("afc_failovers_started_total",
                  {{"service", spec_.id.value()}, {"trigger", manual ? "manual" : "automatic"}}));
    return ControlResult<FailoverEvent>::ok(std::move(event));
}

ControlResult<void> FailoverCoordinator::resume(FailoverEvent event) {
    if (event.isTerminal()) {
        return ControlResult<void>::err(
            ControlError(ErrorCode::EventTerminal, "event is already terminal"));
    }
    CoordinatorState previous;
    CoordinatorState next = event.phase() == FailoverPhase::Verifying
                                ? CoordinatorState::Verifying
                                : event.phase() == FailoverPhase::RollingBack
                                      ? CoordinatorState::RollingBack
                                      : CoordinatorState::FailoverInProgress;
    {
        std::lock_guard lock(mutex_);
        if (live_) {
            return ControlResult<void>::err(ControlError(
                ErrorCode::FailoverAlreadyLive, "a failover is already live", live_->id()));
        }
        live_ = event;
        target_ = event.toRegion();
        token_ = std::make_shared<CancellationToken>();
        abortRequested_ = false;
        previous = state_;
        state_ = next;
    }
    announce(previous, next, "resuming failover " + std::to_string(event.id().value()));

    if (event.phase() == FailoverPhase::RollingBack) {
        foundation::CorrelationScope scope("failover-" + std::to_string(event.id().value()));
        rollBack(event, false, "rollback resumed after restart");
    } else {
        drive(std::move(event));
    }
    return ControlResult<void>::ok();
}

void FailoverCoordinator::drive(FailoverEvent event) {
    foundation::CorrelationScope scope("failover-" + std::to_string(event.id().value()));

    std::shared_ptr<CancellationToken> token;
    {
        std::lock_guard lock(mutex_);
        token = token_;
    }

    auto executed = executor_.execute(event, spec_, *token);
    if (!executed) {
        bool aborting = executed.error().code() == ErrorCode::StepCancelled;
        {
            std::lock_guard lock(mutex_);
            aborting = aborting || abortRequested_;
        }
        rollBack(event, aborting, std::string(executed.error().message()));
        return;
    }

    if (event.phase() != FailoverPhase::Verifying) {
        auto phased = event.setPhase(FailoverPhase::Verifying, WallClock::now());
        if (!phased) {
            rollBack(event, false,
                     "cannot enter verification: " + std::string(phased.error().message()));
            return;
        }
        recordEvent(event);
    }
    setState(CoordinatorState::Verifying,
             "verifying " + event.toRegion().value() + " with " +
                 std::to_string(spec_.probe.verificationProbes) + " probe(s)");

    if (!verify(event)) {
        bool aborting = token->isCancelled();
        rollBack(event, aborting,
                 aborting ? "verification cancelled by operator"
                          : "verification of " + event.toRegion().value() + " failed");
        return;
    }

    auto completed = complete(event);
    if (!completed) {
        rollBack(event, false, std::string(completed.error().message()));
    }
}

bool FailoverCoordinator::verify(const FailoverEvent& event) {
    if (!ctx_.prober) {
        AFC_LOG_ERROR(LogCategory::Coordinator, "no prober configured for verification");
        return false;
    }
    std::shared_ptr<CancellationToken> token;
    {
        std::lock_guard lock(mutex_);
        token = token_;
    }
    for (uint32_t i = 0; i < spec_.probe.verificationProbes; ++i) {
        if (token && token->isCancelled()) {
            return false;
        }
        auto sample = ctx_.prober(event.service(), event.toRegion());
        if (!sample.succeeded()) {
            AFC_LOG_WARN(LogCategory::Coordinator,
                         "verification probe " + std::to_string(i + 1) + " against " +
                             event.toRegion().value() + " " +
                             std::string(probeOutcomeName(sample.outcome)) +
                             (sample.detail.empty() ? "" : ": " + sample.detail));
            return false;
        }
    }
    return true;
}

ControlResult<void> FailoverCoordinator::complete(FailoverEvent& event) {
    auto swapped = ctx_.store.compareAndSetPrimary(spec_.id, event.fromRegion(), event.toRegion());
    if (!swapped) {
        return swapped;
    }
    auto healthy = ctx_.store.transition(spec_.id, event.toRegion(), RegionState::Promoted,
                                         RegionState::Healthy);
    if (!healthy) {
        AFC_LOG_WARN(LogCategory::Coordinator,
                     "new primary state not reset: " + std::string(healthy.error().message()));
    }

    auto phased = event.setPhase(FailoverPhase::Completed, WallClock::now());
    if (!phased) {
        return phased;
    }
    recordEvent(event);

    CoordinatorState previous;
    {
        std::lock_guard lock(mutex_);
        previous = state_;
        state_ = CoordinatorState::Stable;
        target_.reset();
        token_.reset();
        abortRequested_ = false;
        hardBurnSince_.reset();
        lastEscalation_.reset();
    }
    announce(previous, CoordinatorState::Stable, "primary is now " + event.toRegion().value());
    publishEvent(ControlEventKind::FailoverCompleted, event,
                 "failover to " + event.toRegion().value() + " completed");

    ctx_.metrics.incrementCounter(seriesKey(
        "afc_failovers_total", {{"service", spec_.id.value()}, {"outcome", "completed"}}));
    auto duration = std::chrono::duration<double>(*event.finishedAt() - event.triggeredAt());
    ctx_.metrics.recordHistogram(
        seriesKey("afc_failover_duration_seconds", {{"service", spec_.id.value()}}),
        duration.count());
    return ControlResult<void>::ok();
}

void FailoverCoordinator::rollBack(FailoverEvent& event, bool aborting, const std::string& cause) {
    if (event.phase() != FailoverPhase::RollingBack) {
        auto phased = event.setPhase(FailoverPhase::RollingBack, WallClock::now());
        if (!phased) {
            // Already terminal: its steps can no longer be compensated.
            AFC_LOG_ERROR(LogCategory::Coordinator,
                          cause + "; " + std::string(phased.error().message()));
            finish(event, true, cause + "; " + std::string(phased.error().message()));
            return;
        }
        recordEvent(event);
    }
    setState(CoordinatorState::RollingBack, cause);
    publishEvent(ControlEventKind::RollbackStarted, event, cause);

    auto rolledBack = executor_.rollback(event, spec_);
    {
        std::lock_guard lock(mutex_);
        aborting = aborting || abortRequested_;
    }
    bool abort = aborting || !rolledBack;
    std::string outcome = !rolledBack ? std::string(rolledBack.error().message())
                          : aborting  ? "aborted by operator"
                                      : "rolled back: " + cause;

    auto phased = event.setPhase(abort ? FailoverPhase::Aborted : FailoverPhase::RolledBack,
                                 WallClock::now());
    if (!phased) {
        AFC_LOG_ERROR(LogCategory::Coordinator, std::string(phased.error().message()));
    }
    finish(event, abort, outcome);
}

void FailoverCoordinator::finish(const FailoverEvent& event, bool abort,
                                 const std::string& outcome) {
    recordEvent(event);

    CoordinatorState previous;
    CoordinatorState next = abort ? CoordinatorState::Aborted : CoordinatorState::Stable;
    {
        std::lock_guard lock(mutex_);
        if (live_ && live_->id() == event.id()) {
            last_ = event;
            live_.reset();
        }
        previous = state_;
        state_ = next;
        target_.reset();
        token_.reset();
        abortRequested_ = false;
        hardBurnSince_.reset();
    }
    announce(previous, next, outcome);
    publishEvent(abort ? ControlEventKind::FailoverAborted : ControlEventKind::FailoverRolledBack,
                 event, outcome);
    ctx_.metrics.incrementCounter(
        seriesKey("afc_failovers_total", {{"service", spec_.id.value()},
                                          {"outcome", abort ? "aborted" : "rolled_back"}}));
}

// ---------------------------------------------------------------------------
// State and snapshots
// ---------------------------------------------------------------------------

RegionId FailoverCoordinator::currentPrimary() const {
    auto primary = ctx_.store.primaryOf(spec_.id);
    return primary ? primary.value() : spec_.configuredPrimary().value_or(RegionId{});
}

void FailoverCoordinator::setState(CoordinatorState next, const std::string& why) {
    CoordinatorState previous;
    {
        std::lock_guard lock(mutex_);
        previous = state_;
        state_ = next;
    }
    if (previous != next) {
        announce(previous, next, why);
    }
}

void FailoverCoordinator::announce(CoordinatorState from, CoordinatorState to,
                                   const std::string& why) {
    ctx_.metrics.setGauge(seriesKey("afc_coordinator_state", {{"service", spec_.id.value()}}),
                          static_cast<double>(to));

    LogContext logCtx;
    logCtx.serviceId = spec_.id;
    logCtx.extra["from"] = std::string(coordinatorStateName(from));
    logCtx.extra["to"] = std::string(coordinatorStateName(to));
    foundation::ControlLogger::instance().logWithContext(
        to == CoordinatorState::Aborted ? LogLevel::Error : LogLevel::Info,
        LogCategory::Coordinator,
        std::string(coordinatorStateName(from)) + " -> " +
            std::string(coordinatorStateName(to)) + ": " + why,
        logCtx);

    ControlEvent event;
    event.kind = ControlEventKind::CoordinatorTransition;
    event.service = spec_.id;
    event.message = why;
    event.at = WallClock::now();
    event.fields.emplace_back("from", std::string(coordinatorStateName(from)));
    event.fields.emplace_back("to", std::string(coordinatorStateName(to)));
    ctx_.notifier.notify(event);
}

std::vector<StepRecord> FailoverCoordinator::recordEvent(const FailoverEvent& event) {
    std::vector<StepRecord> changed;
    {
        std::lock_guard lock(mutex_);
        const std::vector<StepRecord>* before = live_ ? &live_->steps() : nullptr;
        for (std::size_t i = 0; i < event.steps().size(); ++i) {
            const auto& now = event.steps()[i];
            if (before == nullptr || i >= before->size() || (*before)[i].status != now.status ||
                (*before)[i].attempts != now.attempts) {
                changed.push_back(now);
            }
        }
        if (event.isTerminal()) {
            live_.reset();
            last_ = event;
        } else {
            live_ = event;
        }
    }

    if (ctx_.journal != nullptr) {
        auto appended = ctx_.journal->append(event);
        if (!appended) {
            AFC_LOG_ERROR(LogCategory::Coordinator,
                          "journal append failed: " + std::string(appended.error().message()));
        }
    }
    return changed;
}

void FailoverCoordinator::publishEvent(ControlEventKind kind, const FailoverEvent& event,
                                       const std::string& message) {
    ControlEvent out;
    out.kind = kind;
    out.service = event.service();
    out.region = event.toRegion();
    out.eventId = event.id();
    out.message = message;
    out.at = WallClock::now();
    out.fields.emplace_back("from", event.fromRegion().value());
    out.fields.emplace_back("to", event.toRegion().value());
    out.fields.emplace_back("phase", std::string(failoverPhaseName(event.phase())));
    out.fields.emplace_back("manual", event.manual() ? "true" : "false");
    ctx_.notifier.notify(out);
}

CoordinatorState FailoverCoordinator::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

CoordinatorSnapshot FailoverCoordinator::snapshot() const {
    CoordinatorSnapshot snap;
    snap.service = spec_.id;
    snap.primary = currentPrimary();
    std::lock_guard lock(mutex_);
    snap.state = state_;
    snap.target = target_;
    snap.liveEvent = live_;
    snap.lastEvent = last_;
    snap.escalations = escalations_;
    return snap;
}

} // namespace afc::control
