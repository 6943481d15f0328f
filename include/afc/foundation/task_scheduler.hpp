#pragma once

/// @file task_scheduler.hpp
/// @brief TaskScheduler wrapping kcenon thread_system for probe and background work.

#include "afc/foundation/control_result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace afc::foundation {

/// Priority levels for scheduled tasks.
///
/// Maps to kcenon::thread::job_priority internally:
///   Critical -> highest, High -> high, Normal -> normal, Low -> low
enum class TaskPriority { Critical, High, Normal, Low };

/// Task scheduler backed by a kcenon thread pool.
///
/// One-shot tasks are dispatched immediately; interval tasks are advanced by
/// processTick() and dispatched into the pool each time their interval
/// elapses. The probe scheduler drives processTick() from its timer thread.
///
/// Example:
/// @code
///   TaskScheduler scheduler(4);
///   auto id = scheduler.scheduleInterval("probe:checkout/us-east",
///                                        std::chrono::seconds(10),
///                                        [] { runProbe(); });
///   scheduler.processTick(std::chrono::milliseconds(100));
/// @endcode
class TaskScheduler {
public:
    using TaskId = uint64_t;
    using TaskFunc = std::function<void()>;

    explicit TaskScheduler(std::size_t numThreads = std::thread::hardware_concurrency());

    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;
    TaskScheduler(TaskScheduler&&) noexcept;
    TaskScheduler& operator=(TaskScheduler&&) noexcept;

    /// Dispatch a one-shot task.
    /// @return The assigned TaskId, or JobScheduleFailed.
    ControlResult<TaskId> schedule(TaskFunc task, TaskPriority priority = TaskPriority::Normal);

    /// Register a recurring task that fires every @p interval of ticked time.
    /// When @p fireImmediately is true the first dispatch happens on the next
    /// processTick() call.
    ControlResult<TaskId> scheduleInterval(std::string name,
                                           std::chrono::milliseconds interval,
                                           TaskFunc task,
                                           bool fireImmediately = true);

    /// Advance interval timers by @p deltaTime and dispatch due tasks.
    /// @return Number of tasks dispatched.
    std::size_t processTick(std::chrono::milliseconds deltaTime);

    /// Block until the one-shot task @p id completes.
    /// @return Success, JobNotFound, or ThreadError if the task threw.
    ControlResult<void> wait(TaskId id);

    /// Cancel a pending one-shot task or disable an interval task.
    ControlResult<void> cancel(TaskId id);

    /// Number of interval tasks currently enabled.
    [[nodiscard]] std::size_t intervalTaskCount() const;

    /// Stop the pool, waiting for running tasks. Idempotent.
    void shutdown();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace afc::foundation
