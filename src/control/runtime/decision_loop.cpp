/// @file decision_loop.cpp
/// @brief ServiceDecisionLoop queue and thread.

#include "afc/control/decision_loop.hpp"

#include "afc/foundation/control_logger.hpp"
#include "afc/foundation/control_metrics.hpp"

#include <exception>
#include <optional>

namespace afc::control {

using foundation::ControlError;
using foundation::ControlResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::seriesKey;

ServiceDecisionLoop::ServiceDecisionLoop(ServiceId service, DecisionLoopOptions options,
                                         DecisionHandler handler,
                                         foundation::ControlMetrics& metrics)
    : service_(std::move(service)),
      options_(options),
      handler_(std::move(handler)),
      metrics_(metrics) {}

ServiceDecisionLoop::~ServiceDecisionLoop() {
    stop();
}

ControlResult<void> ServiceDecisionLoop::start() {
    if (options_.capacity == 0 || options_.tickInterval <= Millis::zero()) {
        return ControlResult<void>::err(ControlError(
            ErrorCode::InvalidArgument, "decision loop needs a capacity and a tick interval"));
    }
    if (running_.exchange(true)) {
        return ControlResult<void>::ok();
    }
    {
        std::lock_guard lock(mutex_);
        closed_ = false;
    }
    thread_ = std::thread([this] { run(); });
    AFC_LOG_DEBUG(LogCategory::Core, "decision loop started for " + service_.value());
    return ControlResult<void>::ok();
}

void ServiceDecisionLoop::stop() {
    std::size_t discarded = 0;
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
        discarded = queue_.size();
        queue_.clear();
    }
    notEmpty_.notify_all();
    notFull_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false, std::memory_order_release);
    if (discarded > 0) {
        AFC_LOG_WARN(LogCategory::Core, "discarded " + std::to_string(discarded) +
                                            " queued decision item(s) for " + service_.value());
    }
}

ControlResult<void> ServiceDecisionLoop::submit(DecisionItem item) {
    std::unique_lock lock(mutex_);
    if (closed_) {
        return ControlResult<void>::err(
            ControlError(ErrorCode::QueueClosed, "decision loop is stopping"));
    }
    bool space = notFull_.wait_for(lock, options_.enqueueTimeout, [this] {
        return closed_ || queue_.size() < options_.capacity;
    });
    if (closed_) {
        return ControlResult<void>::err(
            ControlError(ErrorCode::QueueClosed, "decision loop is stopping"));
    }
    if (!space) {
        lock.unlock();
        dropped_.fetch_add(1, std::memory_order_relaxed);
        metrics_.incrementCounter(
            seriesKey("afc_decision_queue_dropped_total", {{"service", service_.value()}}));
        AFC_LOG_WARN(LogCategory::Core, "decision queue full for " + service_.value() +
                                            ", item dropped");
        return ControlResult<void>::err(
            ControlError(ErrorCode::QueueFull, "decision queue full for " + service_.value()));
    }
    queue_.push_back(std::move(item));
    auto depth = queue_.size();
    lock.unlock();

    metrics_.setGauge(seriesKey("afc_decision_queue_depth", {{"service", service_.value()}}),
                      static_cast<double>(depth));
    notEmpty_.notify_one();
    return ControlResult<void>::ok();
}

std::size_t ServiceDecisionLoop::drain() {
    std::size_t handled = 0;
    while (true) {
        DecisionItem item;
        {
            std::lock_guard lock(mutex_);
            if (queue_.empty()) {
                break;
            }
            item = std::move(queue_.front());
            queue_.pop_front();
        }
        notFull_.notify_one();
        handle(std::move(item));
        ++handled;
    }
    return handled;
}

std::size_t ServiceDecisionLoop::pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

void ServiceDecisionLoop::run() {
    auto nextTick = Clock::now() + options_.tickInterval;
    while (true) {
        std::optional<DecisionItem> item;
        {
            std::unique_lock lock(mutex_);
            notEmpty_.wait_until(lock, nextTick, [this] { return closed_ || !queue_.empty(); });
            if (closed_) {
                break;
            }
            if (!queue_.empty()) {
                item = std::move(queue_.front());
                queue_.pop_front();
            }
        }

        if (item) {
            notFull_.notify_one();
            handle(std::move(*item));
        }

        auto now = Clock::now();
        if (now >= nextTick) {
            handle(DecisionTick{now});
            nextTick = now + options_.tickInterval;
        }
    }
}

void ServiceDecisionLoop::handle(DecisionItem item) {
    try {
        handler_(std::move(item));
    } catch (const std::exception& e) {
        AFC_LOG_ERROR(LogCategory::Core,
                      "decision handler for " + service_.value() + " threw: " + e.what());
    }
    processed_.fetch_add(1, std::memory_order_relaxed);
}

} // namespace afc::control
