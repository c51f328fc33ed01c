#include "seqrt/util/thread-pool.hh"
#include "seqrt/util/error.hh"
#include "seqrt/util/logging.hh"

namespace seqrt {

ThreadPool::ThreadPool(size_t _maxThreads)
    : maxThreads(_maxThreads)
{
    if (!maxThreads) {
        maxThreads = std::thread::hardware_concurrency();
        if (!maxThreads)
            maxThreads = 1;
    }

    debug("starting pool of %d threads", maxThreads);

    for (size_t n = 0; n < maxThreads; ++n)
        workers.emplace_back(&ThreadPool::doWork, this);
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        // NB. the flag is set under the lock: a worker that has just
        // checked `quit` would otherwise wait on `work` forever.
        state.quit = true;
    }

    work.notify_all();

    debug("reaping %d worker threads", workers.size());

    for (auto & thr : workers)
        thr.join();
    workers.clear();
}

void ThreadPool::enqueue(const work_t & t)
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (state.quit)
            throw Error("cannot enqueue work on a thread pool that is shutting down");
        state.pending.push_back(t);
    }
    work.notify_one();
}

bool ThreadPool::runQueued()
{
    work_t w;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (state.pending.empty())
            return false;
        w = std::move(state.pending.front());
        state.pending.pop_front();
        state.active++;
    }
    run(w);
    return true;
}

void ThreadPool::run(work_t & w)
{
    w();

    {
        std::lock_guard<std::mutex> lock(mutex);
        state.active--;
    }
    inactivity.notify_all();
}

void ThreadPool::wait()
{
    std::unique_lock<std::mutex> lock(mutex);
    inactivity.wait(lock, [&] { return state.pending.empty() && state.active == 0; });
}

void ThreadPool::doWork()
{
    while (true) {
        work_t w;
        {
            std::unique_lock<std::mutex> lock(mutex);
            work.wait(lock, [&] { return state.quit || !state.pending.empty(); });
            if (state.quit && state.pending.empty())
                return;
            w = std::move(state.pending.front());
            state.pending.pop_front();
            state.active++;
        }

        run(w);
    }
}

} // namespace seqrt
