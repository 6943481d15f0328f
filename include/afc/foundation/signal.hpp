#pragma once

/// @file signal.hpp
/// @brief Thread-safe Signal<Args...> used to fan controller events out to sinks.
///
/// Slots are registered via connect() and invoked when emit() is called.
/// emit() snapshots the slots under a shared lock and invokes them outside
/// it, so a slot may connect or disconnect without deadlocking.

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace afc::foundation {

/// Thread-safe signal (observer pattern).
///
/// A slot that throws does not stop the remaining slots from running; emit()
/// reports how many slots failed and hands each failure to the optional
/// failure handler. Slots run in connection order.
///
/// Example:
/// @code
///   Signal<const ControlEvent&> onEvent;
///   auto id = onEvent.connect([](const ControlEvent& e) { forward(e); });
///   onEvent.emit(event);
///   onEvent.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;
    using FailureHandler = std::function<void(SlotId, const std::string&)>;

    Signal() = default;
    ~Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    /// Register a callback. Returns a SlotId for later disconnect().
    SlotId connect(Slot slot) {
        auto id = nextId_.fetch_add(1, std::memory_order_relaxed);
        std::unique_lock lock(mutex_);
        slots_.emplace(id, std::move(slot));
        return id;
    }

    /// Remove a previously registered callback by its SlotId.
    void disconnect(SlotId id) {
        std::unique_lock lock(mutex_);
        slots_.erase(id);
    }

    /// Install a handler invoked (outside any lock) for every slot that throws.
    void onSlotFailure(FailureHandler handler) {
        std::unique_lock lock(mutex_);
        failureHandler_ = std::move(handler);
    }

    /// Fire the signal. Returns the number of slots that threw.
    std::size_t emit(Args... args) const {
        std::vector<std::pair<SlotId, Slot>> snapshot;
        FailureHandler handler;
        {
            std::shared_lock lock(mutex_);
            snapshot.reserve(slots_.size());
            for (const auto& [id, slot] : slots_) {
                snapshot.emplace_back(id, slot);
            }
            handler = failureHandler_;
        }

        std::size_t failures = 0;
        for (const auto& [id, slot] : snapshot) {
            try {
                slot(args...);
            } catch (const std::exception& e) {
                ++failures;
                if (handler) {
                    handler(id, e.what());
                }
            }
        }
        return failures;
    }

    [[nodiscard]] std::size_t slotCount() const {
        std::shared_lock lock(mutex_);
        return slots_.size();
    }

private:
    // Ordered so slots fire in connection order.
    std::map<SlotId, Slot> slots_;
    FailureHandler failureHandler_;
    std::atomic<SlotId> nextId_{1};
    mutable std::shared_mutex mutex_;
};

} // namespace afc::foundation
