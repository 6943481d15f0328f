/// @file cancellation.cpp
/// @brief CancellationToken.

#include "afc/control/cancellation.hpp"

namespace afc::control {

void CancellationToken::cancel() {
    {
        std::lock_guard lock(mutex_);
        cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool CancellationToken::sleepFor(std::chrono::milliseconds duration) const {
    std::unique_lock lock(mutex_);
    return !cv_.wait_for(lock, duration, [this] { return isCancelled(); });
}

} // namespace afc::control
