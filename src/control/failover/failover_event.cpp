/// @file failover_event.cpp
/// @brief FailoverEvent history and name tables.

#include "afc/control/failover_event.hpp"

namespace afc::control {

using foundation::ControlError;
using foundation::ControlResult;
using foundation::ErrorCode;

std::string_view failoverPhaseName(FailoverPhase phase) {
    switch (phase) {
        case FailoverPhase::InProgress:  return "in_progress";
        case FailoverPhase::Verifying:   return "verifying";
        case FailoverPhase::RollingBack: return "rolling_back";
        case FailoverPhase::Completed:   return "completed";
        case FailoverPhase::RolledBack:  return "rolled_back";
        case FailoverPhase::Aborted:     return "aborted";
    }
    return "unknown";
}

std::string_view stepKindName(StepKind step) {
    switch (step) {
        case StepKind::QuiesceWrites:   return "quiesce_writes";
        case StepKind::PromoteDatabase: return "promote_database";
        case StepKind::UpdateRouting:   return "update_routing";
        case StepKind::ResumeWrites:    return "resume_writes";
    }
    return "unknown";
}

std::string_view stepStatusName(StepStatus status) {
    switch (status) {
        case StepStatus::Pending:            return "pending";
        case StepStatus::Succeeded:          return "succeeded";
        case StepStatus::Failed:             return "failed";
        case StepStatus::Skipped:            return "skipped";
        case StepStatus::Cancelled:          return "cancelled";
        case StepStatus::Compensated:        return "compensated";
        case StepStatus::CompensationFailed: return "compensation_failed";
    }
    return "unknown";
}

std::optional<FailoverPhase> parseFailoverPhase(std::string_view name) {
    for (auto p : {FailoverPhase::InProgress, FailoverPhase::Verifying,
                   FailoverPhase::RollingBack, FailoverPhase::Completed,
                   FailoverPhase::RolledBack, FailoverPhase::Aborted}) {
        if (failoverPhaseName(p) == name) {
            return p;
        }
    }
    return std::nullopt;
}

std::optional<StepKind> parseStepKind(std::string_view name) {
    for (auto k : kStepOrder) {
        if (stepKindName(k) == name) {
            return k;
        }
    }
    return std::nullopt;
}

std::optional<StepStatus> parseStepStatus(std::string_view name) {
    for (auto s : {StepStatus::Pending, StepStatus::Succeeded, StepStatus::Failed,
                   StepStatus::Skipped, StepStatus::Cancelled, StepStatus::Compensated,
                   StepStatus::CompensationFailed}) {
        if (stepStatusName(s) == name) {
            return s;
        }
    }
    return std::nullopt;
}

FailoverEvent::FailoverEvent(FailoverEventId id, ServiceId service, RegionId from,
                             RegionId to, std::string reason, bool manual,
                             WallTime triggeredAt)
    : id_(id),
      service_(std::move(service)),
      from_(std::move(from)),
      to_(std::move(to)),
      reason_(std::move(reason)),
      manual_(manual),
      triggeredAt_(triggeredAt) {
    steps_.reserve(kStepOrder.size());
    for (auto kind : kStepOrder) {
        steps_.push_back(StepRecord{kind, StepStatus::Pending, 0, {}, {}, {}});
    }
}

const StepRecord& FailoverEvent::step(StepKind kind) const {
    return steps_[static_cast<std::size_t>(kind)];
}

std::optional<StepKind> FailoverEvent::nextPendingStep() const {
    for (const auto& rec : steps_) {
        if (!rec.isDone()) {
            return rec.step;
        }
    }
    return std::nullopt;
}

ControlResult<void> FailoverEvent::setPhase(FailoverPhase phase, WallTime at) {
    if (isTerminal()) {
        return ControlResult<void>::err(ControlError(
            ErrorCode::EventTerminal,
            "event " + std::to_string(id_.value()) + " is already " +
                std::string(failoverPhaseName(phase_))));
    }
    phase_ = phase;
    if (isTerminalPhase(phase)) {
        finishedAt_ = at;
    }
    return ControlResult<void>::ok();
}

ControlResult<void> FailoverEvent::updateStep(const StepRecord& record) {
    if (isTerminal()) {
        return ControlResult<void>::err(ControlError(
            ErrorCode::EventTerminal,
            "event " + std::to_string(id_.value()) + " is already " +
                std::string(failoverPhaseName(phase_))));
    }
    steps_[static_cast<std::size_t>(record.step)] = record;
    return ControlResult<void>::ok();
}

FailoverEvent FailoverEvent::restore(FailoverEventId id, ServiceId service, RegionId from,
                                     RegionId to, std::string reason, bool manual,
                                     WallTime triggeredAt, FailoverPhase phase,
                                     std::vector<StepRecord> steps,
                                     std::optional<WallTime> finishedAt) {
    FailoverEvent event(id, std::move(service), std::move(from), std::move(to),
                        std::move(reason), manual, triggeredAt);
    for (auto& rec : steps) {
        auto index = static_cast<std::size_t>(rec.step);
        if (index < event.steps_.size()) {
            event.steps_[index] = std::move(rec);
        }
    }
    event.phase_ = phase;
    event.finishedAt_ = finishedAt;
    return event;
}

} // namespace afc::control
