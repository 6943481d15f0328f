#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the failover controller.

#include <cstdint>
#include <string_view>

namespace afc::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of an
/// error can be read off the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,
    PermissionDenied = 0x0006,
    Unauthenticated = 0x0007,

    // Probe (0x0100 - 0x01FF)
    ProbeTimeout = 0x0100,
    ProbeFailure = 0x0101,
    ProbeConnectFailed = 0x0102,
    ProbeInvalidResponse = 0x0103,

    // Region state (0x0200 - 0x02FF)
    ConflictError = 0x0200,
    ServiceNotFound = 0x0201,
    RegionNotFound = 0x0202,
    InvalidTransition = 0x0203,

    // Failover (0x0300 - 0x03FF)
    ExecutorStepFailure = 0x0300,
    StepTimeout = 0x0301,
    StepCancelled = 0x0302,
    RollbackFailure = 0x0303,
    FailoverAlreadyLive = 0x0304,
    NoQualifiedTarget = 0x0305,
    VerificationFailed = 0x0306,
    EventTerminal = 0x0307,

    // Network (0x0400 - 0x04FF)
    NetworkError = 0x0400,
    ConnectionFailed = 0x0401,
    Timeout = 0x0402,
    ListenFailed = 0x0403,
    InvalidMessage = 0x0404,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigurationError = 0x0603,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    JobNotFound = 0x0702,
    JobCancelled = 0x0703,
    QueueFull = 0x0704,
    QueueClosed = 0x0705,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,

    // Journal (0x0900 - 0x09FF)
    JournalError = 0x0900,
    JournalNotOpen = 0x0901,
    JournalWriteFailed = 0x0902,
    JournalReadFailed = 0x0903,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Probe";
        case 0x0200: return "State";
        case 0x0300: return "Failover";
        case 0x0400: return "Network";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        case 0x0900: return "Journal";
        default: return "Unknown";
    }
}

} // namespace afc::foundation
