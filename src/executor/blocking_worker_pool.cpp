#include "executor/blocking_worker_pool.hpp"

#include <algorithm>

namespace orabridge {

BlockingWorkerPool::BlockingWorkerPool(const WorkerPoolConfig& config)
    : state_(std::make_shared<State>(std::max<size_t>(config.queue_capacity, 1))) {

    const size_t threads = std::max<size_t>(config.threads, 1);
    state_->running.store(true, std::memory_order_release);

    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back(&BlockingWorkerPool::worker_loop, state_);
    }

    utils::log::info(std::format("BlockingWorkerPool started: {} threads, queue capacity {}",
        threads, state_->queue_capacity));
}

BlockingWorkerPool::~BlockingWorkerPool() {
    shutdown(true);
}

bool BlockingWorkerPool::enqueue(std::function<void()> job) {
    {
        std::lock_guard lock(state_->mutex);
        if (!state_->running.load(std::memory_order_acquire)) {
            state_->rejected.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        if (state_->queue.size() >= state_->queue_capacity) {
            state_->rejected.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Blocking worker queue full ({}), rejecting task",
                state_->queue_capacity));
            return false;
        }
        state_->queue.push_back(std::move(job));
        state_->submitted.fetch_add(1, std::memory_order_relaxed);
    }
    state_->cv.notify_one();
    return true;
}

void BlockingWorkerPool::worker_loop(std::shared_ptr<State> state) {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock lock(state->mutex);
            state->cv.wait(lock, [&state] {
                return !state->queue.empty() || !state->running.load(std::memory_order_acquire);
            });
            if (state->queue.empty()) {
                return;  // stopped and drained
            }
            job = std::move(state->queue.front());
            state->queue.pop_front();
        }

        job();
        state->completed.fetch_add(1, std::memory_order_relaxed);
        // May release the last reference to the pool itself
        job = nullptr;
    }
}

void BlockingWorkerPool::shutdown(bool drain) {
    std::deque<std::function<void()>> discarded;
    {
        std::lock_guard lock(state_->mutex);
        if (!state_->running.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
        if (!drain) {
            discarded.swap(state_->queue);
        }
    }
    state_->cv.notify_all();

    const auto self = std::this_thread::get_id();
    for (auto& worker : workers_) {
        if (!worker.joinable()) {
            continue;
        }
        if (worker.get_id() == self) {
            // Called from one of our own units; it drains and exits on its own
            worker.detach();
            continue;
        }
        worker.join();
    }

    if (!discarded.empty()) {
        utils::log::warn(std::format("BlockingWorkerPool discarded {} queued tasks", discarded.size()));
    }
    // discarded destroyed here: each dropped job breaks its promise
    utils::log::info("BlockingWorkerPool stopped");
}

WorkerPoolStats BlockingWorkerPool::get_stats() const {
    WorkerPoolStats stats;
    stats.submitted = state_->submitted.load(std::memory_order_relaxed);
    stats.completed = state_->completed.load(std::memory_order_relaxed);
    stats.rejected = state_->rejected.load(std::memory_order_relaxed);
    stats.panicked = state_->panicked.load(std::memory_order_relaxed);
    {
        std::lock_guard lock(state_->mutex);
        stats.queued = state_->queue.size();
    }
    return stats;
}

} // namespace orabridge
