#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include "portico/worker_pool.hpp"

using namespace portico;
using namespace std::chrono_literals;

// =============================================================================
// Execution Tests
// =============================================================================

TEST(WorkerPoolTest, Submit_ManyTasks_ShouldRunEveryTask) {
    WorkerPool pool(4, 16);
    std::atomic<int> ran{0};

    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(pool.submit([&] { ++ran; }));
    }

    EXPECT_TRUE(pool.shutdown(5s));
    EXPECT_EQ(ran.load(), 100);
}

TEST(WorkerPoolTest, Submit_ConcurrentTasks_ShouldNeverExceedThreadCount) {
    WorkerPool pool(3, 64);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    for (int i = 0; i < 30; ++i) {
        pool.submit([&] {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(5ms);
            --running;
        });
    }

    EXPECT_TRUE(pool.shutdown(5s));
    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 2);
}

TEST(WorkerPoolTest, Submit_TaskThrows_ShouldKeepWorkerAlive) {
    WorkerPool pool(1, 4);
    std::atomic<int> ran{0};

    pool.submit([] { throw std::runtime_error("boom"); });
    pool.submit([&] { ++ran; });

    EXPECT_TRUE(pool.shutdown(5s));
    EXPECT_EQ(ran.load(), 1);
}

// =============================================================================
// Backpressure Tests
// =============================================================================

TEST(WorkerPoolTest, Submit_QueueFull_ShouldBlockUntilSpaceFrees) {
    WorkerPool pool(1, 1);
    std::atomic<bool> release{false};
    std::atomic<bool> third_submitted{false};

    pool.submit([&] { while (!release) std::this_thread::sleep_for(1ms); });
    // Wait until the worker has taken the first task off the queue.
    while (pool.active() == 0) std::this_thread::sleep_for(1ms);
    pool.submit([] {});

    std::thread producer([&] {
        pool.submit([] {});
        third_submitted = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(third_submitted.load());

    release = true;
    producer.join();
    EXPECT_TRUE(third_submitted.load());
    EXPECT_TRUE(pool.shutdown(5s));
}

// =============================================================================
// Shutdown Tests
// =============================================================================

TEST(WorkerPoolTest, Submit_AfterShutdown_ShouldReturnFalse) {
    WorkerPool pool(2, 4);
    pool.shutdown(1s);

    EXPECT_FALSE(pool.submit([] {}));
}

TEST(WorkerPoolTest, Shutdown_GraceExpires_ShouldDiscardQueuedTasks) {
    WorkerPool pool(1, 8);
    std::atomic<bool> release{false};
    std::atomic<int> ran{0};

    pool.submit([&] { while (!release) std::this_thread::sleep_for(1ms); });
    for (int i = 0; i < 3; ++i) {
        pool.submit([&] { ++ran; });
    }

    std::thread releaser([&] {
        std::this_thread::sleep_for(100ms);
        release = true;
    });
    bool drained = pool.shutdown(20ms);
    releaser.join();

    EXPECT_FALSE(drained);
    EXPECT_EQ(ran.load(), 0);
    EXPECT_EQ(pool.pending(), 0u);
}

TEST(WorkerPoolTest, Shutdown_UnblocksWaitingProducer) {
    WorkerPool pool(1, 1);
    std::atomic<bool> release{false};

    pool.submit([&] { while (!release) std::this_thread::sleep_for(1ms); });
    while (pool.active() == 0) std::this_thread::sleep_for(1ms);
    pool.submit([] {});

    std::atomic<int> result{-1};
    std::thread producer([&] { result = pool.submit([] {}) ? 1 : 0; });
    std::this_thread::sleep_for(20ms);

    std::thread releaser([&] {
        std::this_thread::sleep_for(50ms);
        release = true;
    });
    pool.shutdown(0ms);
    producer.join();
    releaser.join();

    EXPECT_EQ(result.load(), 0);
}
