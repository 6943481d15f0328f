/// @file task_scheduler.cpp
/// @brief TaskScheduler implementation over kcenon thread_system.

#include "afc/foundation/task_scheduler.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <atomic>
#include <future>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "afc/foundation/control_logger.hpp"

namespace afc::foundation {

static kcenon::thread::job_priority mapPriority(TaskPriority p) {
    switch (p) {
        case TaskPriority::Critical: return kcenon::thread::job_priority::highest;
        case TaskPriority::High:     return kcenon::thread::job_priority::high;
        case TaskPriority::Normal:   return kcenon::thread::job_priority::normal;
        case TaskPriority::Low:      return kcenon::thread::job_priority::low;
    }
    return kcenon::thread::job_priority::normal;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct TaskScheduler::Impl {
    struct IntervalEntry {
        TaskId id;
        std::string name;
        std::chrono::milliseconds interval;
        std::chrono::milliseconds elapsed{0};
        TaskFunc func;
        bool enabled{true};
    };

    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::atomic<uint64_t> nextTaskId{1};
    bool stopped{false};

    std::unordered_map<TaskId, std::shared_future<void>> futures;
    std::unordered_map<TaskId, std::shared_ptr<std::atomic<bool>>> cancelFlags;

    std::vector<IntervalEntry> intervalTasks;

    mutable std::mutex mutex;

    bool enqueue(const std::string& name, kcenon::thread::job_priority priority,
                 std::function<void()> work) {
        auto job = kcenon::thread::job_builder()
            .name(name)
            .priority(priority)
            .work([name, fn = std::move(work)]() -> kcenon::common::VoidResult {
                try {
                    fn();
                } catch (const std::exception& e) {
                    AFC_LOG_ERROR(LogCategory::Core, "task " + name + " failed: " + e.what());
                } catch (...) {
                    AFC_LOG_ERROR(LogCategory::Core,
                                  "task " + name + " failed with a non-standard exception");
                }
                return kcenon::common::VoidResult::ok(std::monostate{});
            })
            .build();
        return !pool->enqueue(std::move(job)).is_err();
    }
};

TaskScheduler::TaskScheduler(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("afc_task_scheduler");

    if (numThreads == 0) {
        numThreads = 1;
    }
    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(numThreads);
    for (std::size_t i = 0; i < numThreads; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

TaskScheduler::~TaskScheduler() {
    if (impl_) {
        shutdown();
    }
}

TaskScheduler::TaskScheduler(TaskScheduler&&) noexcept = default;
TaskScheduler& TaskScheduler::operator=(TaskScheduler&&) noexcept = default;

// ---------------------------------------------------------------------------
// schedule()
// ---------------------------------------------------------------------------
ControlResult<TaskScheduler::TaskId> TaskScheduler::schedule(
    TaskFunc task, TaskPriority priority)
{
    auto id = impl_->nextTaskId.fetch_add(1, std::memory_order_relaxed);
    auto cancelFlag = std::make_shared<std::atomic<bool>>(false);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future().share();

    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->stopped) {
            return ControlResult<TaskId>::err(
                ControlError(ErrorCode::JobScheduleFailed, "scheduler is shut down"));
        }
        impl_->futures[id] = future;
        impl_->cancelFlags[id] = cancelFlag;
    }

    bool queued = impl_->enqueue(
        "afc_task_" + std::to_string(id), mapPriority(priority),
        [fn = std::move(task), cancelFlag, promise]() {
            try {
                if (!cancelFlag->load(std::memory_order_acquire)) {
                    fn();
                }
                promise->set_value();
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });

    if (!queued) {
        std::lock_guard lock(impl_->mutex);
        impl_->futures.erase(id);
        impl_->cancelFlags.erase(id);
        return ControlResult<TaskId>::err(
            ControlError(ErrorCode::JobScheduleFailed, "failed to enqueue task"));
    }

    return ControlResult<TaskId>::ok(id);
}

// ---------------------------------------------------------------------------
// scheduleInterval()
// ---------------------------------------------------------------------------
ControlResult<TaskScheduler::TaskId> TaskScheduler::scheduleInterval(
    std::string name, std::chrono::milliseconds interval, TaskFunc task,
    bool fireImmediately)
{
    if (interval.count() <= 0) {
        return ControlResult<TaskId>::err(
            ControlError(ErrorCode::InvalidArgument, "interval must be positive"));
    }

    auto id = impl_->nextTaskId.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard lock(impl_->mutex);
    impl_->intervalTasks.push_back(Impl::IntervalEntry{
        id, std::move(name), interval,
        fireImmediately ? interval : std::chrono::milliseconds{0},
        std::move(task), true});

    return ControlResult<TaskId>::ok(id);
}

// ---------------------------------------------------------------------------
// processTick()
// ---------------------------------------------------------------------------
std::size_t TaskScheduler::processTick(std::chrono::milliseconds deltaTime) {
    std::vector<std::pair<std::string, TaskFunc>> due;
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->stopped) {
            return 0;
        }
        for (auto& entry : impl_->intervalTasks) {
            if (!entry.enabled) {
                continue;
            }
            entry.elapsed += deltaTime;
            if (entry.elapsed >= entry.interval) {
                entry.elapsed = std::chrono::milliseconds{0};
                due.emplace_back(entry.name, entry.func);
            }
        }
    }

    // Enqueue outside the lock.
    std::size_t dispatched = 0;
    for (auto& [name, fn] : due) {
        if (impl_->enqueue(name, kcenon::thread::job_priority::normal, std::move(fn))) {
            ++dispatched;
        } else {
            AFC_LOG_WARN(LogCategory::Core, "failed to dispatch interval task " + name);
        }
    }
    return dispatched;
}

// ---------------------------------------------------------------------------
// wait()
// ---------------------------------------------------------------------------
ControlResult<void> TaskScheduler::wait(TaskId id) {
    std::shared_future<void> future;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->futures.find(id);
        if (it == impl_->futures.end()) {
            return ControlResult<void>::err(
                ControlError(ErrorCode::JobNotFound, "task not found"));
        }
        future = it->second;
    }

    try {
        future.get();
    } catch (const std::exception& e) {
        return ControlResult<void>::err(
            ControlError(ErrorCode::ThreadError, std::string("task failed: ") + e.what()));
    } catch (...) {
        return ControlResult<void>::err(
            ControlError(ErrorCode::ThreadError, "task failed with a non-standard exception"));
    }

    return ControlResult<void>::ok();
}

// ---------------------------------------------------------------------------
// cancel()
// ---------------------------------------------------------------------------
ControlResult<void> TaskScheduler::cancel(TaskId id) {
    std::lock_guard lock(impl_->mutex);

    auto flagIt = impl_->cancelFlags.find(id);
    if (flagIt == impl_->cancelFlags.end()) {
        for (auto& entry : impl_->intervalTasks) {
            if (entry.id == id) {
                entry.enabled = false;
                return ControlResult<void>::ok();
            }
        }
        return ControlResult<void>::err(
            ControlError(ErrorCode::JobNotFound, "task not found"));
    }

    auto futIt = impl_->futures.find(id);
    if (futIt != impl_->futures.end()) {
        auto status = futIt->second.wait_for(std::chrono::seconds(0));
        if (status == std::future_status::ready) {
            return ControlResult<void>::err(
                ControlError(ErrorCode::JobCancelled, "task already completed"));
        }
    }

    flagIt->second->store(true, std::memory_order_release);
    return ControlResult<void>::ok();
}

std::size_t TaskScheduler::intervalTaskCount() const {
    std::lock_guard lock(impl_->mutex);
    std::size_t count = 0;
    for (const auto& entry : impl_->intervalTasks) {
        if (entry.enabled) {
            ++count;
        }
    }
    return count;
}

void TaskScheduler::shutdown() {
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->stopped) {
            return;
        }
        impl_->stopped = true;
    }
    if (impl_->pool) {
        impl_->pool->stop(false); // graceful: wait for running jobs
    }
}

} // namespace afc::foundation
