#ifndef FETCH_EXEC_CONTEXT_HH
#define FETCH_EXEC_CONTEXT_HH

#include "../utils.hh"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace fetch {
namespace detail {
/// Thread-safe wrapper around an object.
template <typename _ty>
class synchronised {
    using value_type = _ty;

    value_type value;
    mutable std::mutex mutex;

public:
    synchronised() = default;
    nocopy(synchronised);
    nomove(synchronised);

    /// Run a function with the lock held. The function may take the
    /// lock as a second argument, e.g. to wait on a condition variable.
    template <typename func>
    auto with_lock(func&& f) {
        std::unique_lock lock{mutex};
        if constexpr (std::is_invocable_v<func, value_type&>) return std::invoke(std::forward<func>(f), value);
        else return std::invoke(std::forward<func>(f), value, lock);
    }

    template <typename func>
    auto with_lock(func&& f) const {
        std::unique_lock lock{mutex};
        return std::invoke(std::forward<func>(f), value);
    }
};
} // namespace detail

/// Flag used to stop a loop running on another thread.
class stop_flag {
    std::atomic_flag flag = ATOMIC_FLAG_INIT;

public:
    stop_flag() = default;
    ~stop_flag() = default;
    nomove(stop_flag);
    nocopy(stop_flag);

    void stop() noexcept { flag.test_and_set(); }
    [[nodiscard]] bool stopped() const noexcept { return flag.test(); }
};

/// Context for threads and jobs.
///
/// A fixed number of worker threads pull tasks off a shared queue and
/// run them to completion. Tasks that are still queued when the context
/// is destroyed are run before the workers are joined.
class execution_context final {
    using task_t = std::function<void(execution_context&)>;

    /// Queue of tasks waiting for a free worker.
    detail::synchronised<std::queue<task_t>> task_queue;

    /// Signalled whenever a task is queued or the context stops.
    std::condition_variable task_queue_cv;

    /// Set once the context is being torn down.
    stop_flag stopping;

    /// Workers.
    std::vector<std::jthread> threads;

    /// Worker main loop.
    void run_worker() {
        for (;;) {
            task_t task;
            bool have_task = task_queue.with_lock([&](auto& queue, auto& lock) {
                task_queue_cv.wait(lock, [&] { return not queue.empty() or stopping.stopped(); });
                if (queue.empty()) return false;
                task = std::move(queue.front());
                queue.pop();
                return true;
            });

            /// Queue drained and we’re stopping.
            if (not have_task) return;

            try {
                std::invoke(task, *this);
            } catch (const std::exception& e) {
                err("Exception in worker thread: {}", e.what());
            }
        }
    }

public:
    /// Create a new execution context.
    explicit execution_context(usz thread_count = std::thread::hardware_concurrency() ?: 2) {
        if (thread_count == 0) thread_count = 1;
        threads.reserve(thread_count);
        for (usz i = 0; i < thread_count; ++i) threads.emplace_back([this] { run_worker(); });
    }

    /// Run everything that is still queued, then join the workers.
    ~execution_context() {
        /// Under the lock, or a worker could miss the wakeup.
        task_queue.with_lock([&](auto&) { stopping.stop(); });
        task_queue_cv.notify_all();
        threads.clear();
    }

    nocopy(execution_context);
    nomove(execution_context);

    /// Add a task to the execution context.
    ///
    /// The task may take the context as its only argument.
    template <typename func>
    void add_task(func&& f) {
        task_t task;
        if constexpr (std::is_invocable_v<func, execution_context&>) task = std::forward<func>(f);
        else task = [f = std::forward<func>(f)](execution_context&) mutable { f(); };

        task_queue.with_lock([&](auto& queue) { queue.push(std::move(task)); });
        task_queue_cv.notify_one();
    }

    /// Number of worker threads.
    [[nodiscard]] usz size() const { return threads.size(); }
};
} // namespace fetch

#endif // FETCH_EXEC_CONTEXT_HH
