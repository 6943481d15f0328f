/// @file failover_executor.cpp
/// @brief FailoverExecutor step loop, retry/backoff and compensation.

#include "afc/control/failover_executor.hpp"

#include "afc/control/region_state_store.hpp"
#include "afc/foundation/control_logger.hpp"
#include "afc/foundation/control_metrics.hpp"

#include <thread>

namespace afc::control {

using foundation::ControlError;
using foundation::ControlResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::seriesKey;

namespace {

void logStep(LogLevel level, const FailoverEvent& event, const StepRecord& rec) {
    LogContext ctx;
    ctx.serviceId = event.service();
    ctx.regionId = event.toRegion();
    ctx.eventId = event.id();
    ctx.extra["step"] = std::string(stepKindName(rec.step));
    ctx.extra["status"] = std::string(stepStatusName(rec.status));
    ctx.extra["attempts"] = std::to_string(rec.attempts);
    foundation::ControlLogger::instance().logWithContext(
        level, LogCategory::Executor,
        rec.message.empty() ? std::string(stepKindName(rec.step)) : rec.message, ctx);
}

/// A step needs compensation once any attempt reached the remote API: a
/// failed or cancelled attempt may still have been applied there (a promote
/// that answered after the step timeout, a reply lost on the wire).
bool mayHaveTakenEffect(const StepRecord& rec) {
    switch (rec.status) {
        case StepStatus::Succeeded:
            return true;
        case StepStatus::Failed:
        case StepStatus::Cancelled:
            return rec.attempts >= 1;
        default:
            return false;
    }
}

} // namespace

FailoverExecutor::FailoverExecutor(FleetApis apis, RegionStateStore& store,
                                   foundation::ControlMetrics& metrics)
    : apis_(std::move(apis)), store_(store), metrics_(metrics) {}

void FailoverExecutor::setRecorder(EventRecorder recorder) {
    recorder_ = std::move(recorder);
}

ControlResult<void> FailoverExecutor::record(FailoverEvent& event, const StepRecord& rec) {
    auto updated = event.updateStep(rec);
    if (!updated) {
        return updated;
    }
    if (recorder_) {
        recorder_(event);
    }
    return ControlResult<void>::ok();
}

// ---------------------------------------------------------------------------
// execute()
// ---------------------------------------------------------------------------

ControlResult<void> FailoverExecutor::execute(FailoverEvent& event, const ServiceSpec& spec,
                                              const CancellationToken& token) {
    if (!apis_.complete()) {
        return ControlResult<void>::err(
            ControlError(ErrorCode::InvalidArgument, "executor is missing a capability API"));
    }
    const auto& retry = spec.step.retry;

    while (auto next = event.nextPendingStep()) {
        StepRecord rec = event.step(*next);
        if (!rec.startedAt) {
            rec.startedAt = WallClock::now();
        }

        if (*next == StepKind::QuiesceWrites) {
            auto old = store_.get(event.service(), event.fromRegion());
            if (old && old.value().state == RegionState::Unreachable) {
                rec.status = StepStatus::Skipped;
                rec.message = "old primary " + event.fromRegion().value() + " unreachable";
                rec.finishedAt = WallClock::now();
                auto recorded = record(event, rec);
                if (!recorded) {
                    return recorded;
                }
                logStep(LogLevel::Warning, event, rec);
                continue;
            }
        }

        bool succeeded = false;
        bool cancelled = false;
        for (uint32_t attempt = 1; attempt <= retry.maxAttempts; ++attempt) {
            if (token.isCancelled() || !token.sleepFor(retry.backoffBefore(attempt))) {
                cancelled = true;
                break;
            }

            ++rec.attempts;
            auto start = Clock::now();
            auto result = invoke(*next, event, spec.step.timeout);
            auto elapsed = std::chrono::duration_cast<Millis>(Clock::now() - start);

            std::string outcome;
            if (result && elapsed <= spec.step.timeout) {
                rec.status = StepStatus::Succeeded;
                rec.message = result.value();
                rec.finishedAt = WallClock::now();
                succeeded = true;
                outcome = "success";
            } else {
                rec.status = StepStatus::Failed;
                rec.message = result
                    ? "exceeded step timeout of " + std::to_string(spec.step.timeout.count()) + "ms"
                    : std::string(result.error().message());
                outcome = "failure";
            }
            metrics_.incrementCounter(seriesKey(
                "afc_failover_step_attempts_total",
                {{"step", std::string(stepKindName(*next))}, {"outcome", outcome}}));

            auto recorded = record(event, rec);
            if (!recorded) {
                return recorded;
            }
            logStep(succeeded ? LogLevel::Info : LogLevel::Warning, event, rec);
            if (succeeded) {
                break;
            }
        }

        if (cancelled) {
            rec.status = StepStatus::Cancelled;
            rec.message = "cancelled by operator";
            rec.finishedAt = WallClock::now();
            auto recorded = record(event, rec);
            if (!recorded) {
                return recorded;
            }
            logStep(LogLevel::Warning, event, rec);
            if (*next == StepKind::PromoteDatabase) {
                restoreTarget(event, RegionState::Healthy);
            }
            return ControlResult<void>::err(ControlError(
                ErrorCode::StepCancelled,
                "step " + std::string(stepKindName(*next)) + " cancelled"));
        }

        if (!succeeded) {
            rec.finishedAt = WallClock::now();
            auto recorded = record(event, rec);
            if (!recorded) {
                return recorded;
            }
            if (*next == StepKind::PromoteDatabase) {
                restoreTarget(event, RegionState::Healthy);
            }
            return ControlResult<void>::err(ControlError(
                ErrorCode::ExecutorStepFailure,
                "step " + std::string(stepKindName(*next)) + " failed after " +
                    std::to_string(rec.attempts) + " attempt(s): " + rec.message,
                *next));
        }
    }

    return ControlResult<void>::ok();
}

// ---------------------------------------------------------------------------
// rollback()
// ---------------------------------------------------------------------------

ControlResult<void> FailoverExecutor::rollback(FailoverEvent& event, const ServiceSpec& spec) {
    if (!apis_.complete()) {
        return ControlResult<void>::err(
            ControlError(ErrorCode::InvalidArgument, "executor is missing a capability API"));
    }
    const auto& retry = spec.step.retry;
    bool allCompensated = true;
    std::string firstFailure;

    for (auto it = kStepOrder.rbegin(); it != kStepOrder.rend(); ++it) {
        StepRecord rec = event.step(*it);
        if (!mayHaveTakenEffect(rec)) {
            continue;
        }

        bool done = false;
        std::string lastError;
        for (uint32_t attempt = 1; attempt <= retry.maxAttempts && !done; ++attempt) {
            std::this_thread::sleep_for(retry.backoffBefore(attempt));
            auto start = Clock::now();
            auto result = compensate(*it, event, spec.step.timeout);
            auto elapsed = std::chrono::duration_cast<Millis>(Clock::now() - start);
            if (result && elapsed <= spec.step.timeout) {
                done = true;
            } else {
                lastError = result ? "compensation exceeded step timeout"
                                   : std::string(result.error().message());
            }
        }

        rec.status = done ? StepStatus::Compensated : StepStatus::CompensationFailed;
        rec.message = done ? "compensated" : lastError;
        rec.finishedAt = WallClock::now();
        auto recorded = record(event, rec);
        if (!recorded) {
            return recorded;
        }
        logStep(done ? LogLevel::Info : LogLevel::Error, event, rec);

        if (!done && allCompensated) {
            allCompensated = false;
            firstFailure = std::string(stepKindName(*it)) + ": " + lastError;
        }
    }

    if (!allCompensated) {
        return ControlResult<void>::err(
            ControlError(ErrorCode::RollbackFailure, "rollback incomplete: " + firstFailure));
    }
    return ControlResult<void>::ok();
}

// ---------------------------------------------------------------------------
// Step actions
// ---------------------------------------------------------------------------

ControlResult<std::string> FailoverExecutor::invoke(StepKind step, const FailoverEvent& event,
                                                    Millis timeout) {
    const auto& svc = event.service();
    switch (step) {
        case StepKind::QuiesceWrites: {
            auto r = apis_.writes->quiesce(svc, event.fromRegion(), timeout);
            if (!r) {
                return ControlResult<std::string>::err(r.error());
            }
            return ControlResult<std::string>::ok("writes quiesced on " + event.fromRegion().value());
        }
        case StepKind::PromoteDatabase: {
            auto entered = enterPromoting(event);
            if (!entered) {
                return ControlResult<std::string>::err(entered.error());
            }
            auto r = apis_.promotion->promote(svc, event.toRegion(), timeout);
            if (!r) {
                return ControlResult<std::string>::err(r.error());
            }
            auto promoted = markPromoted(event);
            if (!promoted) {
                return ControlResult<std::string>::err(promoted.error());
            }
            return ControlResult<std::string>::ok(
                r.value() == PromotionResult::AlreadyPrimary
                    ? event.toRegion().value() + " already primary"
                    : event.toRegion().value() + " promoted");
        }
        case StepKind::UpdateRouting: {
            auto r = apis_.routing->routeTo(svc, event.toRegion(), timeout);
            if (!r) {
                return ControlResult<std::string>::err(r.error());
            }
            return ControlResult<std::string>::ok("traffic routed to " + event.toRegion().value());
        }
        case StepKind::ResumeWrites: {
            auto r = apis_.writes->resume(svc, event.toRegion(), timeout);
            if (!r) {
                return ControlResult<std::string>::err(r.error());
            }
            return ControlResult<std::string>::ok("writes resumed on " + event.toRegion().value());
        }
    }
    return ControlResult<std::string>::err(
        ControlError(ErrorCode::InvalidArgument, "unknown step"));
}

ControlResult<void> FailoverExecutor::compensate(StepKind step, const FailoverEvent& event,
                                                 Millis timeout) {
    const auto& svc = event.service();
    switch (step) {
        case StepKind::QuiesceWrites:
            return apis_.writes->resume(svc, event.fromRegion(), timeout);
        case StepKind::PromoteDatabase: {
            auto r = apis_.promotion->demote(svc, event.toRegion(), timeout);
            restoreTarget(event, r ? RegionState::Healthy : RegionState::Failed);
            return r;
        }
        case StepKind::UpdateRouting:
            return apis_.routing->routeTo(svc, event.fromRegion(), timeout);
        case StepKind::ResumeWrites:
            return apis_.writes->quiesce(svc, event.toRegion(), timeout);
    }
    return ControlResult<void>::err(ControlError(ErrorCode::InvalidArgument, "unknown step"));
}

// ---------------------------------------------------------------------------
// Target store state
// ---------------------------------------------------------------------------

ControlResult<void> FailoverExecutor::enterPromoting(const FailoverEvent& event) {
    auto rec = store_.get(event.service(), event.toRegion());
    if (!rec) {
        return ControlResult<void>::err(rec.error());
    }
    auto state = rec.value().state;
    if (state == RegionState::Promoting || state == RegionState::Promoted) {
        return ControlResult<void>::ok();
    }
    auto r = store_.transition(event.service(), event.toRegion(), state, RegionState::Promoting);
    if (!r) {
        return ControlResult<void>::err(r.error());
    }
    return ControlResult<void>::ok();
}

ControlResult<void> FailoverExecutor::markPromoted(const FailoverEvent& event) {
    auto r = store_.transition(event.service(), event.toRegion(), RegionState::Promoting,
                               RegionState::Promoted);
    if (!r) {
        const auto* seen = r.error().context<RegionRecord>();
        if (seen != nullptr && seen->state == RegionState::Promoted) {
            return ControlResult<void>::ok();
        }
        return ControlResult<void>::err(r.error());
    }
    return ControlResult<void>::ok();
}

void FailoverExecutor::restoreTarget(const FailoverEvent& event, RegionState to) {
    for (int attempt = 0; attempt < 2; ++attempt) {
        auto rec = store_.get(event.service(), event.toRegion());
        if (!rec) {
            return;
        }
        auto state = rec.value().state;
        if (state != RegionState::Promoting && state != RegionState::Promoted &&
            !(state == RegionState::Failed && to != RegionState::Failed)) {
            return;
        }
        if (store_.transition(event.service(), event.toRegion(), state, to)) {
            return;
        }
    }
    AFC_LOG_ERROR(LogCategory::Executor,
                  "could not restore store state of " + event.toRegion().value());
}

} // namespace afc::control
