#pragma once

/// @file json_log_formatter.hpp
/// @brief JSON log lines and the thread-local correlation id.
///
/// Lines are single-line objects for ELK / Loki ingestion. While a failover
/// event executes, the coordinator installs a CorrelationScope so every line
/// it and the executor log can be joined on "failover-<id>".

#include "afc/foundation/control_logger.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace afc::foundation {

/// Sets the calling thread's correlation id until destruction.
class CorrelationScope {
public:
    explicit CorrelationScope(std::string correlationId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope&) = delete;
    CorrelationScope& operator=(const CorrelationScope&) = delete;

    /// Empty when no scope is active on this thread.
    [[nodiscard]] static const std::string& current();

private:
    std::string previous_;
};

/// Compact serialization used for every JSON document the controller emits.
/// Invalid UTF-8 in operator or endpoint supplied text is replaced, never
/// thrown.
[[nodiscard]] std::string toJsonText(const nlohmann::ordered_json& value);

/// Field order: timestamp, level, category, correlation_id, message, then
/// service, region, event_id and extra when present. correlation_id comes
/// from LogContext::traceId, else the active CorrelationScope.
class JsonLogFormatter {
public:
    [[nodiscard]] static std::string format(LogLevel level,
                                            LogCategory category,
                                            std::string_view message,
                                            const LogContext& ctx = {});
};

}  // namespace afc::foundation
