#pragma once

/// @file decision_loop.hpp
/// @brief Serial decision task of one service fed by a bounded, ordered queue.

#include "afc/control/failover_coordinator.hpp"
#include "afc/control/failover_event.hpp"
#include "afc/control/fleet_types.hpp"
#include "afc/foundation/control_result.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <variant>

namespace afc::foundation {
class ControlMetrics;
}

namespace afc::control {

/// Periodic re-evaluation without new input.
struct DecisionTick {
    TimePoint at{};
};

/// Everything that can change a service's decisions, in arrival order.
/// A FailoverEvent item resumes a journaled live event.
using DecisionItem = std::variant<ProbeSample, ManualSignal, DecisionTick, FailoverEvent>;

using DecisionHandler = std::function<void(DecisionItem)>;

struct DecisionLoopOptions {
    std::size_t capacity = 1024;
    Millis enqueueTimeout{100};
    Millis tickInterval{1000};
};

/// One decision thread per service; all of the service's transitions are
/// applied serially on it.
///
/// submit() blocks at most enqueueTimeout while the queue is full, then drops
/// the new item (counted in afc_decision_queue_dropped_total). When no item
/// arrives the loop hands a DecisionTick to the handler every tickInterval.
class ServiceDecisionLoop {
public:
    ServiceDecisionLoop(ServiceId service, DecisionLoopOptions options, DecisionHandler handler,
                        foundation::ControlMetrics& metrics);
    ~ServiceDecisionLoop();

    ServiceDecisionLoop(const ServiceDecisionLoop&) = delete;
    ServiceDecisionLoop& operator=(const ServiceDecisionLoop&) = delete;

    foundation::ControlResult<void> start();

    /// Stop the thread. Items still queued are discarded.
    void stop();

    /// @return QueueFull if the item was dropped, QueueClosed after stop().
    foundation::ControlResult<void> submit(DecisionItem item);

    /// Handle every queued item on the calling thread. Only valid while the
    /// loop thread is not running.
    std::size_t drain();

    [[nodiscard]] const ServiceId& service() const { return service_; }
    [[nodiscard]] std::size_t pending() const;
    [[nodiscard]] bool isRunning() const { return running_.load(std::memory_order_acquire); }
    [[nodiscard]] uint64_t droppedCount() const {
        return dropped_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t processedCount() const {
        return processed_.load(std::memory_order_relaxed);
    }

private:
    void run();
    void handle(DecisionItem item);

    ServiceId service_;
    DecisionLoopOptions options_;
    DecisionHandler handler_;
    foundation::ControlMetrics& metrics_;

    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::deque<DecisionItem> queue_;
    bool closed_ = false;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> processed_{0};
};

} // namespace afc::control
