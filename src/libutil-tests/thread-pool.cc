#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <thread>

#include "seqrt/util/thread-pool.hh"

namespace seqrt {

TEST(ThreadPool, runsAllWork)
{
    ThreadPool pool(4);
    std::atomic<int> sum{0};
    for (int i = 1; i <= 100; ++i)
        pool.enqueue([&sum, i]() { sum += i; });
    pool.wait();
    EXPECT_EQ(sum.load(), 5050);
}

TEST(ThreadPool, defaultsToHardwareConcurrency)
{
    ThreadPool pool;
    EXPECT_GE(pool.concurrency(), 1u);
}

TEST(ThreadPool, waitOnIdlePoolReturns)
{
    ThreadPool pool(2);
    pool.wait();
    SUCCEED();
}

TEST(ThreadPool, destructorDrainsQueue)
{
    std::atomic<int> ran{0};
    {
        ThreadPool pool(1);
        for (int i = 0; i < 10; ++i)
            pool.enqueue([&ran]() { ran++; });
    }
    EXPECT_EQ(ran.load(), 10);
}

TEST(ThreadPool, runQueuedRunsOnCallingThread)
{
    ThreadPool pool(1);
    std::mutex gate;
    std::unique_lock<std::mutex> held(gate);

    // Keep the only worker busy so the next unit stays queued.
    std::atomic<bool> blocking{false};
    pool.enqueue([&]() {
        blocking = true;
        std::lock_guard<std::mutex> lock(gate);
    });
    while (!blocking)
        std::this_thread::yield();

    std::thread::id ranOn;
    pool.enqueue([&]() { ranOn = std::this_thread::get_id(); });

    EXPECT_TRUE(pool.runQueued());
    EXPECT_EQ(ranOn, std::this_thread::get_id());
    EXPECT_FALSE(pool.runQueued());

    held.unlock();
    pool.wait();
}

TEST(InlineExecutor, runsImmediately)
{
    InlineExecutor executor;
    int ran = 0;
    executor.enqueue([&]() { ran++; });
    EXPECT_EQ(ran, 1);
    EXPECT_EQ(executor.concurrency(), 1u);
    EXPECT_FALSE(executor.runQueued());
}

} // namespace seqrt
