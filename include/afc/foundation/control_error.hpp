#pragma once

/// @file control_error.hpp
/// @brief Controller error type used with Result<T, ControlError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "afc/foundation/error_code.hpp"

namespace afc::foundation {

/// Error carrying a categorized code, a human-readable message and optional
/// type-erased context (for example the RegionRecord seen on a CAS conflict).
class ControlError {
public:
    ControlError() = default;

    explicit ControlError(ErrorCode code)
        : code_(code) {}

    ControlError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    ControlError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (nullptr on type mismatch or when empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace afc::foundation
