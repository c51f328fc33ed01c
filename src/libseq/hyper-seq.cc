#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>

#include "seqrt/seq/array.hh"
#include "seqrt/seq/hyper-seq.hh"
#include "seqrt/seq/seq-error.hh"
#include "seqrt/seq/settings.hh"
#include "seqrt/seq/stats.hh"
#include "seqrt/util/logging.hh"

namespace seqrt {

HyperConfig HyperConfig::fromSettings()
{
    HyperConfig config;
    config.batch = std::max<size_t>(seqSettings.hyperBatch, 1);
    config.degree = std::max<size_t>(seqSettings.hyperDegree, 1);
    return config;
}

/**
 * Drives the pipeline of a HyperSeq one window of at most `degree`
 * batches at a time. All batches of a window are finished before their
 * results are released, so a failure or cancellation never leaks part
 * of a window.
 */
class HyperIterator : public Iterator
{
    typedef HyperSeq::Stage Stage;

    struct Batch
    {
        size_t index;
        ValueVector in;
        ValueVector out;
        std::exception_ptr error;
        std::string message;
    };

    std::unique_ptr<Iterator> source;
    std::vector<Stage> stages;
    HyperConfig config;
    HyperOrder order;
    ref<Executor> executor;
    std::shared_ptr<std::atomic<bool>> cancelled;

    std::deque<Value> ready;
    size_t nextBatch = 0;
    bool exhausted = false;
    bool stoppedByCancel = false;

    void runUnit(Batch & batch) const
    {
        for (auto & v : batch.in) {
            ValueVector current{v};
            for (auto & stage : stages) {
                ValueVector next;
                for (auto & x : current)
                    stage(x, next);
                current = std::move(next);
            }
            batch.out.insert(batch.out.end(), current.begin(), current.end());
        }
    }

    std::vector<Batch> cutWindow()
    {
        std::vector<Batch> batches;
        while (batches.size() < config.degree && !exhausted) {
            Batch batch{.index = nextBatch};
            while (batch.in.size() < config.batch) {
                auto v = source->pull();
                if (!v) {
                    exhausted = true;
                    break;
                }
                batch.in.push_back(v->decont());
            }
            if (batch.in.empty())
                break;
            nextBatch++;
            batches.push_back(std::move(batch));
        }
        return batches;
    }

    void runWindow()
    {
        if (*cancelled) {
            debug("parallel sequence cancelled after %d batches", nextBatch);
            stoppedByCancel = true;
            exhausted = true;
            return;
        }

        auto batches = cutWindow();
        if (batches.empty())
            return;

        std::mutex mutex;
        std::condition_variable finished;
        size_t pending = 0;
        std::vector<size_t> completion;
        std::atomic<bool> failed{false};

        auto work = [&](size_t n) {
            auto & batch = batches[n];
            if (!*cancelled && !failed) {
                try {
                    runUnit(batch);
                } catch (std::exception & e) {
                    batch.error = std::current_exception();
                    batch.message = e.what();
                    failed = true;
                } catch (...) {
                    batch.error = std::current_exception();
                    batch.message = "unknown exception";
                    failed = true;
                }
            }
            std::lock_guard<std::mutex> lock(mutex);
            completion.push_back(n);
            pending--;
            finished.notify_all();
        };

        std::exception_ptr enqueueError;
        for (size_t n = 0; n < batches.size(); ++n) {
            vomit("dispatching work unit %d with %d elements", batches[n].index, batches[n].in.size());
            {
                std::lock_guard<std::mutex> lock(mutex);
                pending++;
            }
            seqStats.nrHyperUnits++;
            // The mutex must not be held here: an inline executor runs
            // the unit before `enqueue` returns.
            try {
                executor->enqueue([&work, n]() { work(n); });
            } catch (...) {
                std::lock_guard<std::mutex> lock(mutex);
                pending--;
                enqueueError = std::current_exception();
                break;
            }
        }

        {
            // Help with queued units while waiting: this thread may be a
            // worker of `executor`, and our units may be queued behind it.
            std::unique_lock<std::mutex> lock(mutex);
            while (pending) {
                lock.unlock();
                bool helped = executor->runQueued();
                lock.lock();
                if (!helped)
                    finished.wait(lock, [&] { return pending == 0; });
            }
        }

        if (enqueueError) {
            exhausted = true;
            std::rethrow_exception(enqueueError);
        }

        std::vector<std::string> messages;
        std::exception_ptr first;
        for (auto & batch : batches)
            if (batch.error) {
                messages.push_back(batch.message);
                if (!first)
                    first = batch.error;
            }

        if (!messages.empty()) {
            debug("%d of %d work units failed", messages.size(), nextBatch);
            seqStats.nrHyperFailures += messages.size();
            exhausted = true;
            throw WorkUnitFailure(nextBatch, std::move(messages), first);
        }

        if (*cancelled) {
            debug("parallel sequence cancelled; dropping %d finished batches", batches.size());
            stoppedByCancel = true;
            exhausted = true;
            return;
        }

        if (order == HyperOrder::Hyper)
            for (auto & batch : batches)
                ready.insert(ready.end(), batch.out.begin(), batch.out.end());
        else
            for (auto n : completion)
                ready.insert(ready.end(), batches[n].out.begin(), batches[n].out.end());
    }

public:
    HyperIterator(
        std::unique_ptr<Iterator> source,
        std::vector<Stage> stages,
        HyperConfig config,
        HyperOrder order,
        ref<Executor> executor,
        std::shared_ptr<std::atomic<bool>> cancelled)
        : source(std::move(source))
        , stages(std::move(stages))
        , config(config)
        , order(order)
        , executor(std::move(executor))
        , cancelled(std::move(cancelled))
    {
    }

    /**
     * @throws Cancelled once the HyperSeq has been cancelled and the
     * results released before the cancellation are used up.
     */
    std::optional<Value> pull() override
    {
        while (ready.empty() && !exhausted)
            runWindow();
        if (ready.empty()) {
            if (stoppedByCancel)
                throw Cancelled("parallel sequence was cancelled after %d work units", nextBatch);
            return std::nullopt;
        }
        auto v = std::move(ready.front());
        ready.pop_front();
        return v;
    }

    bool isLazy() const override
    {
        return !exhausted && source->isLazy();
    }

    bool wasCancelled() const
    {
        return stoppedByCancel;
    }
};

HyperSeq::HyperSeq(std::unique_ptr<Iterator> source, HyperConfig config, HyperOrder order, ref<Executor> executor)
    : source(std::move(source))
    , config(config)
    , order(order)
    , executor(std::move(executor))
    , cancelled(std::make_shared<std::atomic<bool>>(false))
{
}

HyperSeq::~HyperSeq() = default;

std::unique_ptr<HyperIterator> HyperSeq::start(std::string_view operation)
{
    if (state != State::Fresh)
        throw AlreadyConsumed("cannot %s a HyperSeq that is %s", operation, showState(state));
    debug(
        "starting a parallel sequence with %d stages (batch %d, degree %d)",
        stages.size(),
        config.batch,
        config.degree);
    return std::make_unique<HyperIterator>(
        std::move(source), std::move(stages), config, order, executor, cancelled);
}

ref<HyperSeq> HyperSeq::withStage(Stage stage)
{
    if (state != State::Fresh)
        throw AlreadyConsumed("cannot extend a HyperSeq that is %s", showState(state));
    auto res = make_ref<HyperSeq>(std::move(source), config, order, executor);
    res->stages = std::move(stages);
    res->stages.push_back(std::move(stage));
    state = State::Consumed;
    return res;
}

ref<HyperSeq> HyperSeq::map(std::function<Value(const Value &)> fn)
{
    return withStage([fn](const Value & in, ValueVector & out) {
        auto v = fn(in);
        if (v.isa<tSlip>())
            v.list()->iterator()->pushAll(out);
        else
            out.push_back(std::move(v));
    });
}

ref<HyperSeq> HyperSeq::grep(std::function<bool(const Value &)> pred)
{
    return withStage([pred](const Value & in, ValueVector & out) {
        if (pred(in))
            out.push_back(in);
    });
}

void HyperSeq::forEach(const std::function<void(const Value &)> & consumer)
{
    auto it = start("iterate");
    state = State::Consumed;
    while (true) {
        std::optional<Value> v;
        try {
            v = it->pull();
        } catch (Cancelled &) {
            if (!it->wasCancelled())
                throw;
            return;
        }
        if (!v)
            break;
        consumer(*v);
    }
}

ValueVector HyperSeq::collect(std::string_view operation)
{
    if (state == State::Fresh && source->isLazy())
        throw InfiniteLength("cannot %s a parallel sequence over a lazy source", operation);

    auto it = start(operation);
    state = State::Consumed;

    ValueVector res;
    try {
        while (auto v = it->pull())
            res.push_back(std::move(*v));
    } catch (Cancelled & e) {
        e.addTrace("while trying to %s a parallel sequence", operation);
        throw;
    }

    return res;
}

Value HyperSeq::toArray()
{
    auto values = collect("materialize");
    auto array = Array::make();
    array.assign(Operands::comma(std::move(values)));
    return array.toValue();
}

ref<List> HyperSeq::cache()
{
    if (state == State::Cached)
        return ref<List>(cached);
    auto list = make_ref<List>(ListKind::List, collect("cache"));
    cached = list.get_ptr();
    state = State::Cached;
    return list;
}

std::optional<Value> HyperSeq::pull()
{
    switch (state) {
    case State::Fresh:
        running = start("pull from");
        state = State::Consuming;
        break;
    case State::Consuming:
        break;
    case State::Cached:
    case State::Consumed:
        throw AlreadyConsumed("cannot pull from a HyperSeq that is %s", showState(state));
    }

    std::optional<Value> v;
    try {
        v = running->pull();
    } catch (...) {
        state = State::Consumed;
        running.reset();
        throw;
    }
    if (!v) {
        state = State::Consumed;
        running.reset();
    }
    return v;
}

std::unique_ptr<Iterator> HyperSeq::takeIterator()
{
    auto it = start("iterate");
    state = State::Consumed;
    return it;
}

ref<Seq> HyperSeq::serial()
{
    return make_ref<Seq>(takeIterator());
}

void HyperSeq::cancel()
{
    if (!cancelled->exchange(true)) {
        debug("cancelling a parallel sequence");
        seqStats.nrHyperCancellations++;
    }
}

bool HyperSeq::isLazy() const
{
    switch (state) {
    case State::Fresh:
        return source->isLazy();
    case State::Consuming:
        return running->isLazy();
    case State::Cached:
        return cached->isLazy();
    case State::Consumed:
        return false;
    }
    unreachable();
}

Value HyperSeq::toValue()
{
    Value v;
    v.mkHyperSeq(ref<HyperSeq>(shared_from_this()));
    return v;
}

ref<Executor> defaultExecutor()
{
    static ref<Executor> pool = make_ref<ThreadPool>();
    return pool;
}

Value hyper(const Operands & source, HyperConfig config, ref<Executor> executor)
{
    return make_ref<HyperSeq>(iterationTarget(source), config, HyperOrder::Hyper, std::move(executor))->toValue();
}

Value race(const Operands & source, HyperConfig config, ref<Executor> executor)
{
    return make_ref<HyperSeq>(iterationTarget(source), config, HyperOrder::Race, std::move(executor))->toValue();
}

} // namespace seqrt
