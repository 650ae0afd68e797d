#pragma once

#include "core/error.hpp"
#include "core/utils.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <format>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace orabridge {

inline constexpr const char* TASK_JOIN_ERROR = "Task join error";

struct WorkerPoolConfig {
    size_t threads = 4;
    size_t queue_capacity = 1024;
};

struct WorkerPoolStats {
    uint64_t submitted = 0;
    uint64_t completed = 0;
    uint64_t rejected = 0;
    uint64_t panicked = 0;   // units that threw instead of returning a Result
    size_t queued = 0;
};

/**
 * @brief Fixed pool of threads allowed to make blocking native calls
 *
 * Callers hand in a unit of work and get a std::future back immediately;
 * the calling thread never waits on the native call. Units run to
 * completion once started (no cancellation, no timeout).
 *
 * Design:
 * - Bounded FIFO (deque + condition_variable); a full queue rejects
 * - Exceptions thrown by a unit are caught on the worker and reported
 *   as CONCURRENCY_ERROR, never propagated into the worker thread
 * - shutdown(false) discards queued units; their futures then report
 *   TASK_JOIN_ERROR through join()
 * - Queue, lock and counters live in a State shared with the workers, so
 *   a unit may release the last reference to the pool from a worker thread:
 *   that worker is detached instead of joined and exits on its own
 */
class BlockingWorkerPool {
public:
    explicit BlockingWorkerPool(const WorkerPoolConfig& config = {});
    ~BlockingWorkerPool();

    BlockingWorkerPool(const BlockingWorkerPool&) = delete;
    BlockingWorkerPool& operator=(const BlockingWorkerPool&) = delete;

    /**
     * @brief Dispatch a blocking unit
     * @return Future for the unit's result; already-ready CONCURRENCY_ERROR
     *         if the pool is stopped or the queue is full
     */
    template<typename T>
    [[nodiscard]] std::future<Result<T>> submit(std::function<Result<T>()> task);

    /**
     * @brief Stop accepting work and join the workers
     * @param drain true: run everything already queued; false: discard it
     */
    void shutdown(bool drain = true);

    [[nodiscard]] bool is_running() const { return state_->running.load(std::memory_order_acquire); }
    [[nodiscard]] size_t thread_count() const { return workers_.size(); }
    [[nodiscard]] WorkerPoolStats get_stats() const;

private:
    struct State {
        explicit State(size_t capacity) : queue_capacity(capacity) {}

        const size_t queue_capacity;
        std::deque<std::function<void()>> queue;
        std::mutex mutex;
        std::condition_variable cv;

        std::atomic<bool> running{false};
        std::atomic<uint64_t> submitted{0};
        std::atomic<uint64_t> completed{0};
        std::atomic<uint64_t> rejected{0};
        std::atomic<uint64_t> panicked{0};
    };

    bool enqueue(std::function<void()> job);
    static void worker_loop(std::shared_ptr<State> state);

    template<typename T>
    static Result<T> run_guarded(State& state, const std::function<Result<T>()>& task);

    std::shared_ptr<State> state_;
    std::vector<std::thread> workers_;
};

template<typename T>
Result<T> BlockingWorkerPool::run_guarded(State& state, const std::function<Result<T>()>& task) {
    try {
        return task();
    } catch (const std::exception& e) {
        state.panicked.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Blocking task threw: {}", e.what()));
        return Result<T>::error(ErrorCategory::CONCURRENCY_ERROR,
            std::format("blocking task failed: {}", e.what()));
    } catch (...) {
        state.panicked.fetch_add(1, std::memory_order_relaxed);
        utils::log::error("Blocking task threw a non-standard exception");
        return Result<T>::error(ErrorCategory::CONCURRENCY_ERROR,
            "blocking task failed: unknown exception");
    }
}

template<typename T>
std::future<Result<T>> BlockingWorkerPool::submit(std::function<Result<T>()> task) {
    auto promise = std::make_shared<std::promise<Result<T>>>();
    auto future = promise->get_future();

    // Dropping the job unrun destroys its promise copy; join() sees broken_promise.
    // Only the running worker touches the State, and it holds its own reference.
    auto job = [state = state_.get(), promise, task = std::move(task)]() {
        promise->set_value(run_guarded<T>(*state, task));
    };

    if (!enqueue(std::move(job))) {
        promise->set_value(Result<T>::error(ErrorCategory::CONCURRENCY_ERROR,
            is_running() ? "blocking worker queue is full" : "blocking worker pool is shut down"));
    }
    return future;
}

/**
 * @brief Wait for a dispatched unit's response
 *
 * A unit that never completed (discarded, worker gone) surfaces as
 * CONCURRENCY_ERROR "Task join error", distinct from native failures.
 */
template<typename T>
[[nodiscard]] Result<T> join(std::future<Result<T>> future) {
    if (!future.valid()) {
        return Result<T>::error(ErrorCategory::CONCURRENCY_ERROR, TASK_JOIN_ERROR);
    }
    try {
        return future.get();
    } catch (const std::future_error& e) {
        return Result<T>::error(ErrorCategory::CONCURRENCY_ERROR,
            std::format("{}: {}", TASK_JOIN_ERROR, e.what()));
    }
}

} // namespace orabridge
