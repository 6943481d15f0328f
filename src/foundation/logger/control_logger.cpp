/// @file control_logger.cpp
/// @brief ControlLogger implementation over kcenon logger interfaces.

#include "afc/foundation/control_logger.hpp"
#include "afc/foundation/json_log_formatter.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>

namespace afc::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: AFC -> kcenon
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,   // Core
    LogLevel::Info,   // Probe
    LogLevel::Info,   // Slo
    LogLevel::Debug,  // Detector
    LogLevel::Debug,  // Coordinator
    LogLevel::Debug,  // Executor
    LogLevel::Info,   // Config
    LogLevel::Info    // Notify
};

static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.serviceId && ctx.serviceId->isValid()) {
        append("service", ctx.serviceId->value());
    }
    if (ctx.regionId && ctx.regionId->isValid()) {
        append("region", ctx.regionId->value());
    }
    if (ctx.eventId && ctx.eventId->isValid()) {
        append("event_id", std::to_string(ctx.eventId->value()));
    }
    if (ctx.traceId && !ctx.traceId->empty()) {
        append("trace_id", *ctx.traceId);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct ControlLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;
    std::array<std::string, kLogCategoryCount> loggerNames;
    std::atomic<bool> jsonMode{false};

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("afc.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        // Named logger first; the registry hands back its shared NullLogger
        // for unknown names, in which case the default logger is used.
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        if (logger == kci::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return logger;
    }
};

ControlLogger::ControlLogger() : impl_(std::make_unique<Impl>()) {}

ControlLogger::~ControlLogger() = default;

ControlLogger::ControlLogger(ControlLogger&&) noexcept = default;
ControlLogger& ControlLogger::operator=(ControlLogger&&) noexcept = default;

void ControlLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }

    if (impl_->jsonMode.load(std::memory_order_relaxed)) {
        (void)impl_->getLogger(cat)->log(mapLevel(level),
                                         JsonLogFormatter::format(level, cat, msg));
        return;
    }

    // Format: [Category] message
    std::string formatted;
    formatted.reserve(msg.size() + 16);
    formatted += '[';
    formatted += logCategoryName(cat);
    formatted += "] ";
    formatted += msg;

    (void)impl_->getLogger(cat)->log(mapLevel(level), formatted);
}

void ControlLogger::logWithContext(LogLevel level, LogCategory cat,
                                   std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }

    if (impl_->jsonMode.load(std::memory_order_relaxed)) {
        (void)impl_->getLogger(cat)->log(mapLevel(level),
                                         JsonLogFormatter::format(level, cat, msg, ctx));
        return;
    }

    std::string ctxStr = formatContext(ctx);

    // Format: [Category] message {key=val, ...}
    std::string formatted;
    formatted.reserve(msg.size() + ctxStr.size() + 20);
    formatted += '[';
    formatted += logCategoryName(cat);
    formatted += "] ";
    formatted += msg;
    if (!ctxStr.empty()) {
        formatted += " {";
        formatted += ctxStr;
        formatted += '}';
    }

    (void)impl_->getLogger(cat)->log(mapLevel(level), formatted);
}

void ControlLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel ControlLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool ControlLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

void ControlLogger::setJsonMode(bool enabled) {
    impl_->jsonMode.store(enabled, std::memory_order_relaxed);
}

bool ControlLogger::isJsonMode() const {
    return impl_->jsonMode.load(std::memory_order_relaxed);
}

ControlResult<void> ControlLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto result = registry.get_default_logger()->flush();
    if (result.is_err()) {
        return ControlResult<void>::err(
            ControlError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return ControlResult<void>::ok();
}

ControlLogger& ControlLogger::instance() {
    static ControlLogger inst;
    return inst;
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    if (name == "trace") { return LogLevel::Trace; }
    if (name == "debug") { return LogLevel::Debug; }
    if (name == "info") { return LogLevel::Info; }
    if (name == "warning" || name == "warn") { return LogLevel::Warning; }
    if (name == "error") { return LogLevel::Error; }
    if (name == "critical") { return LogLevel::Critical; }
    if (name == "off") { return LogLevel::Off; }
    return std::nullopt;
}

} // namespace afc::foundation
