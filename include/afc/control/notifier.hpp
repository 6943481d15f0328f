#pragma once

/// @file notifier.hpp
/// @brief Fire-and-forget fan-out of structured controller events.

#include "afc/control/failover_event.hpp"
#include "afc/foundation/signal.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace afc::control {

enum class ControlEventKind : uint8_t {
    RegionTransition,       ///< Failure detector accepted a transition.
    CoordinatorTransition,  ///< Per-service coordinator changed state.
    FailoverStarted,
    StepRecorded,
    FailoverCompleted,
    RollbackStarted,
    FailoverRolledBack,
    FailoverAborted,
    Escalation,             ///< Operator attention needed.
    ManualSignal,
    SignalRejected
};

[[nodiscard]] std::string_view controlEventKindName(ControlEventKind kind);

struct ControlEvent {
    ControlEventKind kind = ControlEventKind::Escalation;
    ServiceId service;
    std::optional<RegionId> region;
    std::optional<FailoverEventId> eventId;
    std::string message;
    WallTime at{};
    std::vector<std::pair<std::string, std::string>> fields;
};

/// Render an event as one JSON object.
[[nodiscard]] std::string toJson(const ControlEvent& event);

/// Destination of controller events (pager, chat hook, log stream).
class EventSink {
public:
    virtual ~EventSink() = default;

    /// May throw; the notifier contains and counts the failure.
    virtual void deliver(const ControlEvent& event) = 0;
};

/// Writes every event as a JSON line through the Notify log category.
class LogEventSink : public EventSink {
public:
    void deliver(const ControlEvent& event) override;
};

/// Broadcasts events to every registered sink.
///
/// notify() never fails and never throws: a sink failure is logged and
/// counted, and the remaining sinks still receive the event.
class Notifier {
public:
    using SinkId = foundation::Signal<const ControlEvent&>::SlotId;

    Notifier();

    Notifier(const Notifier&) = delete;
    Notifier& operator=(const Notifier&) = delete;

    SinkId addSink(std::shared_ptr<EventSink> sink);
    void removeSink(SinkId id);

    void notify(const ControlEvent& event) noexcept;

    [[nodiscard]] uint64_t publishedCount() const {
        return published_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t sinkFailureCount() const {
        return sinkFailures_.load(std::memory_order_relaxed);
    }

private:
    foundation::Signal<const ControlEvent&> signal_;
    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> sinkFailures_{0};
};

} // namespace afc::control
