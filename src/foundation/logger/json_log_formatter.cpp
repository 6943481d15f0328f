/// @file json_log_formatter.cpp
/// @brief JSON log lines built with nlohmann::ordered_json.

#include "afc/foundation/json_log_formatter.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace afc::foundation {

namespace {

thread_local std::string tl_correlationId;

std::string nowMillisUtc() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) %
              1000;
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&tt, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
        << std::setfill('0') << ms.count() << 'Z';
    return out.str();
}

} // namespace

CorrelationScope::CorrelationScope(std::string correlationId)
    : previous_(std::exchange(tl_correlationId, std::move(correlationId))) {}

CorrelationScope::~CorrelationScope() {
    tl_correlationId = std::move(previous_);
}

const std::string& CorrelationScope::current() {
    return tl_correlationId;
}

std::string toJsonText(const nlohmann::ordered_json& value) {
    return value.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string JsonLogFormatter::format(LogLevel level,
                                     LogCategory category,
                                     std::string_view message,
                                     const LogContext& ctx) {
    nlohmann::ordered_json line;
    line["timestamp"] = nowMillisUtc();
    line["level"] = std::string(logLevelName(level));
    line["category"] = std::string(logCategoryName(category));

    const std::string& correlation =
        (ctx.traceId && !ctx.traceId->empty()) ? *ctx.traceId : tl_correlationId;
    if (!correlation.empty()) {
        line["correlation_id"] = correlation;
    }
    line["message"] = std::string(message);

    if (ctx.serviceId && ctx.serviceId->isValid()) {
        line["service"] = ctx.serviceId->value();
    }
    if (ctx.regionId && ctx.regionId->isValid()) {
        line["region"] = ctx.regionId->value();
    }
    if (ctx.eventId && ctx.eventId->isValid()) {
        line["event_id"] = ctx.eventId->value();
    }
    if (!ctx.extra.empty()) {
        line["extra"] = ctx.extra;
    }
    return toJsonText(line);
}

}  // namespace afc::foundation
