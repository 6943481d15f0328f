#pragma once

/// @file cancellation.hpp
/// @brief Cooperative cancellation shared between a coordinator and the
///        executor running a failover.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace afc::control {

class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /// Trip the token and wake every sleeper.
    void cancel();

    [[nodiscard]] bool isCancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

    /// Sleep up to @p duration.
    /// @return false if the token was (or became) cancelled.
    bool sleepFor(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace afc::control
