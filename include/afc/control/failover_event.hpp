#pragma once

/// @file failover_event.hpp
/// @brief FailoverEvent: one attempt to move a service's primary, with its
///        ordered step history.

#include "afc/control/fleet_types.hpp"
#include "afc/foundation/control_result.hpp"

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace afc::control {

/// Wall clock for event timestamps (persisted in the journal).
using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;

enum class FailoverPhase : uint8_t {
    InProgress,
    Verifying,
    RollingBack,
    Completed,
    RolledBack,
    Aborted
};

enum class StepKind : uint8_t {
    QuiesceWrites,    ///< Stop writes on the old primary (if reachable).
    PromoteDatabase,  ///< Promote the target's database to primary.
    UpdateRouting,    ///< Point DNS / traffic manager at the target.
    ResumeWrites      ///< Re-enable writes on the target.
};

enum class StepStatus : uint8_t {
    Pending,
    Succeeded,
    Failed,
    Skipped,
    Cancelled,
    Compensated,
    CompensationFailed
};

/// Execution order of the failover steps.
inline constexpr std::array<StepKind, 4> kStepOrder = {
    StepKind::QuiesceWrites, StepKind::PromoteDatabase,
    StepKind::UpdateRouting, StepKind::ResumeWrites};

[[nodiscard]] std::string_view failoverPhaseName(FailoverPhase phase);
[[nodiscard]] std::string_view stepKindName(StepKind step);
[[nodiscard]] std::string_view stepStatusName(StepStatus status);

[[nodiscard]] std::optional<FailoverPhase> parseFailoverPhase(std::string_view name);
[[nodiscard]] std::optional<StepKind> parseStepKind(std::string_view name);
[[nodiscard]] std::optional<StepStatus> parseStepStatus(std::string_view name);

[[nodiscard]] constexpr bool isTerminalPhase(FailoverPhase phase) {
    return phase == FailoverPhase::Completed || phase == FailoverPhase::RolledBack ||
           phase == FailoverPhase::Aborted;
}

/// Outcome of one step so far.
struct StepRecord {
    StepKind step = StepKind::QuiesceWrites;
    StepStatus status = StepStatus::Pending;
    uint32_t attempts = 0;
    std::string message;
    std::optional<WallTime> startedAt;
    std::optional<WallTime> finishedAt;

    /// Succeeded or Skipped: nothing left to do on resume.
    [[nodiscard]] bool isDone() const {
        return status == StepStatus::Succeeded || status == StepStatus::Skipped;
    }
};

/// A failover attempt. Immutable once its phase is terminal.
class FailoverEvent {
public:
    FailoverEvent() = default;

    FailoverEvent(FailoverEventId id, ServiceId service, RegionId from, RegionId to,
                  std::string reason, bool manual, WallTime triggeredAt);

    [[nodiscard]] FailoverEventId id() const { return id_; }
    [[nodiscard]] const ServiceId& service() const { return service_; }
    [[nodiscard]] const RegionId& fromRegion() const { return from_; }
    [[nodiscard]] const RegionId& toRegion() const { return to_; }
    [[nodiscard]] const std::string& reason() const { return reason_; }
    [[nodiscard]] bool manual() const { return manual_; }
    [[nodiscard]] WallTime triggeredAt() const { return triggeredAt_; }
    [[nodiscard]] FailoverPhase phase() const { return phase_; }
    [[nodiscard]] bool isTerminal() const { return isTerminalPhase(phase_); }
    [[nodiscard]] const std::vector<StepRecord>& steps() const { return steps_; }
    [[nodiscard]] std::optional<WallTime> finishedAt() const { return finishedAt_; }

    [[nodiscard]] const StepRecord& step(StepKind kind) const;

    /// First step in order that is not done, if any.
    [[nodiscard]] std::optional<StepKind> nextPendingStep() const;

    /// @return EventTerminal if the event is already terminal.
    foundation::ControlResult<void> setPhase(FailoverPhase phase, WallTime at);

    /// Replace the record of @p record.step.
    /// @return EventTerminal if the event is already terminal.
    foundation::ControlResult<void> updateStep(const StepRecord& record);

    /// Rebuild an event read back from the journal.
    static FailoverEvent restore(FailoverEventId id, ServiceId service, RegionId from,
                                 RegionId to, std::string reason, bool manual,
                                 WallTime triggeredAt, FailoverPhase phase,
                                 std::vector<StepRecord> steps,
                                 std::optional<WallTime> finishedAt);

private:
    FailoverEventId id_;
    ServiceId service_;
    RegionId from_;
    RegionId to_;
    std::string reason_;
    bool manual_ = false;
    WallTime triggeredAt_{};
    FailoverPhase phase_ = FailoverPhase::InProgress;
    std::vector<StepRecord> steps_;
    std::optional<WallTime> finishedAt_;
};

} // namespace afc::control
