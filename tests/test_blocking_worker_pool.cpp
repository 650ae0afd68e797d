#include <catch2/catch_test_macros.hpp>
#include "executor/blocking_worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace orabridge;

namespace {

// One-shot latch built on a shared future
struct Gate {
    std::promise<void> promise;
    std::shared_future<void> future = promise.get_future().share();

    void open() { promise.set_value(); }
    void wait() const { future.wait(); }
};

} // namespace

TEST_CASE("BlockingWorkerPool: unit result is delivered through the future", "[pool]") {
    BlockingWorkerPool pool(WorkerPoolConfig{2, 16});
    auto fut = pool.submit<int>([] { return Result<int>::ok(41 + 1); });

    auto r = join(std::move(fut));
    REQUIRE(r.is_ok());
    CHECK(r.value() == 42);
}

TEST_CASE("BlockingWorkerPool: unit errors pass through unchanged", "[pool]") {
    BlockingWorkerPool pool;
    auto r = join(pool.submit<int>([] {
        return Result<int>::error(ErrorCategory::STATEMENT_ERROR, "ORA-00942");
    }));
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::STATEMENT_ERROR);
    CHECK(r.error_message() == "ORA-00942");
}

TEST_CASE("BlockingWorkerPool: every submitted unit completes", "[pool]") {
    BlockingWorkerPool pool(WorkerPoolConfig{4, 256});
    std::atomic<int> counter{0};

    std::vector<std::future<Status>> futures;
    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.submit<void>([&counter] {
            counter.fetch_add(1);
            return Status::ok();
        }));
    }
    for (auto& f : futures) {
        REQUIRE(join(std::move(f)).is_ok());
    }

    CHECK(counter.load() == 100);
    const auto stats = pool.get_stats();
    CHECK(stats.submitted == 100);
    CHECK(stats.completed == 100);
    CHECK(stats.rejected == 0);
}

TEST_CASE("BlockingWorkerPool: a throwing unit becomes a concurrency error", "[pool]") {
    BlockingWorkerPool pool(WorkerPoolConfig{1, 8});
    auto r = join(pool.submit<int>([]() -> Result<int> {
        throw std::runtime_error("driver crashed");
    }));
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::CONCURRENCY_ERROR);
    CHECK(r.error_message().find("driver crashed") != std::string::npos);

    // The worker survives
    auto next = join(pool.submit<int>([] { return Result<int>::ok(1); }));
    REQUIRE(next.is_ok());
    CHECK(pool.get_stats().panicked == 1);
}

TEST_CASE("BlockingWorkerPool: full queue rejects immediately", "[pool]") {
    BlockingWorkerPool pool(WorkerPoolConfig{1, 1});
    Gate started;
    Gate release;

    auto busy = pool.submit<int>([&] {
        started.open();
        release.wait();
        return Result<int>::ok(1);
    });
    started.wait();

    auto queued = pool.submit<int>([] { return Result<int>::ok(2); });
    auto rejected = pool.submit<int>([] { return Result<int>::ok(3); });

    auto r = join(std::move(rejected));
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::CONCURRENCY_ERROR);
    CHECK(r.error_message() == "blocking worker queue is full");

    release.open();
    CHECK(join(std::move(busy)).value() == 1);
    CHECK(join(std::move(queued)).value() == 2);
    CHECK(pool.get_stats().rejected == 1);
}

TEST_CASE("BlockingWorkerPool: submit after shutdown is rejected", "[pool]") {
    BlockingWorkerPool pool(WorkerPoolConfig{1, 4});
    pool.shutdown();
    CHECK_FALSE(pool.is_running());

    auto r = join(pool.submit<int>([] { return Result<int>::ok(1); }));
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::CONCURRENCY_ERROR);
    CHECK(r.error_message() == "blocking worker pool is shut down");
}

TEST_CASE("BlockingWorkerPool: discarded units surface as a join error", "[pool]") {
    BlockingWorkerPool pool(WorkerPoolConfig{1, 4});
    Gate started;
    Gate release;

    auto busy = pool.submit<int>([&] {
        started.open();
        release.wait();
        return Result<int>::ok(1);
    });
    started.wait();
    auto dropped = pool.submit<int>([] { return Result<int>::ok(2); });

    std::thread releaser([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        release.open();
    });
    pool.shutdown(false);
    releaser.join();

    CHECK(join(std::move(busy)).is_ok());

    auto r = join(std::move(dropped));
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::CONCURRENCY_ERROR);
    CHECK(r.error_message().starts_with(TASK_JOIN_ERROR));
}

TEST_CASE("BlockingWorkerPool: joining an empty future is a join error", "[pool]") {
    std::future<Result<int>> empty;
    auto r = join(std::move(empty));
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::CONCURRENCY_ERROR);
    CHECK(r.error_message() == TASK_JOIN_ERROR);
}

TEST_CASE("BlockingWorkerPool: zero sizes are clamped to one", "[pool]") {
    BlockingWorkerPool pool(WorkerPoolConfig{0, 0});
    CHECK(pool.thread_count() == 1);
    CHECK(join(pool.submit<int>([] { return Result<int>::ok(5); })).value() == 5);
}

TEST_CASE("BlockingWorkerPool: a unit may release the last pool reference", "[pool][lifetime]") {
    auto pool = std::make_shared<BlockingWorkerPool>(WorkerPoolConfig{2, 8});
    std::weak_ptr<BlockingWorkerPool> watcher = pool;

    {
        auto fut = pool->submit<int>([pool] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            return Result<int>::ok(1);
        });
    }
    pool.reset();  // the unit now holds the only reference

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!watcher.expired() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    CHECK(watcher.expired());

    // Let the detached worker finish its loop
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
}
