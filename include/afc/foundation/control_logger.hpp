#pragma once

/// @file control_logger.hpp
/// @brief ControlLogger wrapping kcenon logger interfaces for structured controller logging.
///
/// Provides category-based filtering, structured logging with fleet context
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "afc/foundation/control_result.hpp"
#include "afc/foundation/types.hpp"

namespace afc::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Controller log categories, one per pipeline stage.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Process lifecycle, wiring
    Probe       = 1, ///< Health probes and probe scheduling
    Slo         = 2, ///< SLO windows and burn rate
    Detector    = 3, ///< Failure detector transitions
    Coordinator = 4, ///< Failover coordinator state machine
    Executor    = 5, ///< Failover steps, retries, compensation
    Config      = 6, ///< Fleet configuration loading
    Notify      = 7  ///< Event sinks
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Probe", "Slo", "Detector", "Coordinator", "Executor", "Config", "Notify"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.serviceId = ServiceId("checkout");
///   ctx.regionId = RegionId("us-east");
///   ctx.extra["burn_rate"] = "12.4";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Detector,
///                         "region degraded", ctx);
/// @endcode
struct LogContext {
    std::optional<ServiceId> serviceId;
    std::optional<RegionId> regionId;
    std::optional<FailoverEventId> eventId;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Controller logger wrapping kcenon's logging interfaces.
///
/// Uses PIMPL so the kcenon headers stay out of the public API. Each
/// category resolves to the logger registered as "afc.<Category>" in
/// GlobalLoggerRegistry and falls back to the default logger.
///
/// Default log levels per category:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | Probe       | Info          |
/// | Slo         | Info          |
/// | Detector    | Debug         |
/// | Coordinator | Debug         |
/// | Executor    | Debug         |
/// | Config      | Info          |
/// | Notify      | Info          |
class ControlLogger {
public:
    ControlLogger();
    ~ControlLogger();

    ControlLogger(const ControlLogger&) = delete;
    ControlLogger& operator=(const ControlLogger&) = delete;
    ControlLogger(ControlLogger&&) noexcept;
    ControlLogger& operator=(ControlLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Render lines with JsonLogFormatter instead of the
    /// "[Category] message {key=val}" text form.
    void setJsonMode(bool enabled);
    [[nodiscard]] bool isJsonMode() const;

    /// Flush the default kcenon logger.
    ControlResult<void> flush();

    /// Process-wide logger used by the AFC_LOG macros.
    static ControlLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parse "trace", "debug", "info", "warning", "error", "critical" or "off".
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace afc::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global, outside the namespace)
// ---------------------------------------------------------------------------

/// AFC_MIN_LOG_LEVEL can be defined before including this header to compile
/// out calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off

#ifndef AFC_MIN_LOG_LEVEL
    #define AFC_MIN_LOG_LEVEL 0
#endif

#define AFC_LOG(level, cat, msg)                                                    \
    do {                                                                            \
        _Pragma("GCC diagnostic push")                                              \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                         \
        if (static_cast<int>(level) >= AFC_MIN_LOG_LEVEL &&                         \
            ::afc::foundation::ControlLogger::instance().isEnabled((level), (cat)))  \
        {                                                                           \
            ::afc::foundation::ControlLogger::instance().log((level), (cat), (msg)); \
        }                                                                           \
        _Pragma("GCC diagnostic pop")                                               \
    } while (0)

#define AFC_LOG_DEBUG(cat, msg) \
    AFC_LOG(::afc::foundation::LogLevel::Debug, (cat), (msg))

#define AFC_LOG_INFO(cat, msg) \
    AFC_LOG(::afc::foundation::LogLevel::Info, (cat), (msg))

#define AFC_LOG_WARN(cat, msg) \
    AFC_LOG(::afc::foundation::LogLevel::Warning, (cat), (msg))

#define AFC_LOG_ERROR(cat, msg) \
    AFC_LOG(::afc::foundation::LogLevel::Error, (cat), (msg))
