/// @file notifier.cpp
/// @brief Notifier fan-out and JSON rendering of controller events.

#include "afc/control/notifier.hpp"

#include "afc/foundation/control_logger.hpp"
#include "afc/foundation/json_log_formatter.hpp"

#include <cstdio>
#include <ctime>

namespace afc::control {

using foundation::LogCategory;

std::string_view controlEventKindName(ControlEventKind kind) {
    switch (kind) {
        case ControlEventKind::RegionTransition:      return "region_transition";
        case ControlEventKind::CoordinatorTransition: return "coordinator_transition";
        case ControlEventKind::FailoverStarted:       return "failover_started";
        case ControlEventKind::StepRecorded:          return "step_recorded";
        case ControlEventKind::FailoverCompleted:     return "failover_completed";
        case ControlEventKind::RollbackStarted:       return "rollback_started";
        case ControlEventKind::FailoverRolledBack:    return "failover_rolled_back";
        case ControlEventKind::FailoverAborted:       return "failover_aborted";
        case ControlEventKind::Escalation:            return "escalation";
        case ControlEventKind::ManualSignal:          return "manual_signal";
        case ControlEventKind::SignalRejected:        return "signal_rejected";
    }
    return "unknown";
}

namespace {

std::string isoTime(WallTime at) {
    std::time_t tt = WallClock::to_time_t(at);
    std::tm utc{};
    gmtime_r(&tt, &utc);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ", utc.tm_year + 1900,
                  utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec);
    return buf;
}

} // namespace

std::string toJson(const ControlEvent& event) {
    nlohmann::ordered_json doc;
    doc["kind"] = std::string(controlEventKindName(event.kind));
    doc["at"] = isoTime(event.at);
    doc["service"] = event.service.value();
    if (event.region) {
        doc["region"] = event.region->value();
    }
    if (event.eventId) {
        doc["event_id"] = event.eventId->value();
    }
    doc["message"] = event.message;
    for (const auto& [key, value] : event.fields) {
        doc[key] = value;
    }
    return foundation::toJsonText(doc);
}

void LogEventSink::deliver(const ControlEvent& event) {
    auto level = event.kind == ControlEventKind::Escalation ||
                         event.kind == ControlEventKind::FailoverAborted
                     ? foundation::LogLevel::Warning
                     : foundation::LogLevel::Info;
    AFC_LOG(level, LogCategory::Notify, toJson(event));
}

Notifier::Notifier() {
    signal_.onSlotFailure([this](SinkId id, const std::string& what) {
        sinkFailures_.fetch_add(1, std::memory_order_relaxed);
        AFC_LOG_WARN(LogCategory::Notify,
                     "event sink " + std::to_string(id) + " failed: " + what);
    });
}

Notifier::SinkId Notifier::addSink(std::shared_ptr<EventSink> sink) {
    return signal_.connect([sink = std::move(sink)](const ControlEvent& e) { sink->deliver(e); });
}

void Notifier::removeSink(SinkId id) {
    signal_.disconnect(id);
}

void Notifier::notify(const ControlEvent& event) noexcept {
    published_.fetch_add(1, std::memory_order_relaxed);
    signal_.emit(event);
}

} // namespace afc::control
