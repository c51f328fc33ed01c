#pragma once
///@file

#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace seqrt {

/**
 * Something that runs units of work. Parallel sequences do not start
 * threads of their own; the caller chooses how work is executed by
 * handing them an `Executor`.
 */
class Executor
{
public:
    typedef std::function<void()> work_t;

    virtual ~Executor() {}

    /**
     * Submit a unit of work. The work function must not throw; callers
     * are expected to capture failures themselves.
     */
    virtual void enqueue(const work_t & t) = 0;

    /**
     * Run one queued unit of work on the calling thread, if there is
     * one. A thread that waits for its own units calls this so that
     * units it depends on cannot be stuck behind it in the queue.
     *
     * @return false if nothing was queued.
     */
    virtual bool runQueued()
    {
        return false;
    }

    /**
     * Number of units that can make progress at the same time.
     */
    virtual size_t concurrency() const = 0;
};

/**
 * Runs every unit of work immediately on the calling thread.
 */
class InlineExecutor : public Executor
{
public:
    void enqueue(const work_t & t) override
    {
        t();
    }

    size_t concurrency() const override
    {
        return 1;
    }
};

/**
 * A simple thread pool that executes a queue of work items
 * (lambdas) on a fixed number of worker threads.
 */
class ThreadPool : public Executor
{
public:

    /**
     * @param maxThreads Number of worker threads; 0 means the number
     * of hardware threads.
     */
    ThreadPool(size_t maxThreads = 0);

    ~ThreadPool();

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool & operator=(const ThreadPool &) = delete;

    /**
     * Enqueue a function to be executed by the thread pool.
     */
    void enqueue(const work_t & t) override;

    bool runQueued() override;

    size_t concurrency() const override
    {
        return maxThreads;
    }

    /**
     * Block until the queue is empty and no work item is running.
     */
    void wait();

private:

    size_t maxThreads;

    struct State
    {
        std::deque<work_t> pending;
        size_t active = 0;
        bool quit = false;
    };

    std::mutex mutex;
    State state;

    std::condition_variable work;
    std::condition_variable inactivity;

    std::vector<std::thread> workers;

    void doWork();

    void run(work_t & w);

    void shutdown();
};

} // namespace seqrt
