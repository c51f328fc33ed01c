#pragma once
///@file

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "seqrt/seq/binder.hh"
#include "seqrt/seq/sequence.hh"
#include "seqrt/util/thread-pool.hh"

namespace seqrt {

struct HyperConfig
{
    /**
     * Source elements per work unit.
     */
    size_t batch = 64;

    /**
     * Maximum number of work units in flight.
     */
    size_t degree = 4;

    /**
     * The `hyper-batch` and `hyper-degree` settings.
     */
    static HyperConfig fromSettings();
};

enum class HyperOrder {
    /**
     * Results reach consumers in the logical order of the source.
     */
    Hyper,
    /**
     * Results reach `forEach` consumers as work units complete.
     */
    Race,
};

class HyperIterator;

/**
 * A sequence whose transform stages run in work units on an
 * `Executor`. The source is only pulled by the consuming thread, which
 * cuts it into batches of `batch` elements and keeps at most `degree`
 * of them in flight. Each unit writes only the results of its own
 * batch.
 *
 * It follows the state machine of `Seq`. `map()` and `grep()` do not
 * start any work; they move the source into a new HyperSeq and leave
 * this one consumed.
 *
 * Stage functions are called concurrently and must not touch shared
 * lazy Lists or Arrays.
 */
class HyperSeq : public std::enable_shared_from_this<HyperSeq>
{
public:
    typedef Seq::State State;

    /**
     * Append the results for one input element to `out`.
     */
    typedef std::function<void(const Value & in, ValueVector & out)> Stage;

private:
    State state = State::Fresh;

    std::unique_ptr<Iterator> source;

    std::vector<Stage> stages;

    HyperConfig config;

    HyperOrder order;

    ref<Executor> executor;

    std::shared_ptr<std::atomic<bool>> cancelled;

    /**
     * Set while the HyperSeq is being pulled from.
     */
    std::unique_ptr<HyperIterator> running;

    std::shared_ptr<List> cached;

    std::unique_ptr<HyperIterator> start(std::string_view operation);

    ref<HyperSeq> withStage(Stage stage);

    /**
     * Run the whole pipeline. Fails rather than returning partial
     * results.
     */
    ValueVector collect(std::string_view operation);

public:

    HyperSeq(std::unique_ptr<Iterator> source, HyperConfig config, HyperOrder order, ref<Executor> executor);

    ~HyperSeq();

    /**
     * Slips returned by `fn` are spliced.
     */
    ref<HyperSeq> map(std::function<Value(const Value &)> fn);

    ref<HyperSeq> grep(std::function<bool(const Value &)> pred);

    /**
     * Call `consumer` for every result, on the calling thread. Returns
     * early, without an error, if the HyperSeq is cancelled.
     *
     * @throws WorkUnitFailure
     */
    void forEach(const std::function<void(const Value &)> & consumer);

    /**
     * All results, at their logical index, in a new Array.
     *
     * @throws InfiniteLength if the source is lazy.
     * @throws WorkUnitFailure
     * @throws Cancelled
     */
    Value toArray();

    ref<List> cache();

    ref<List> toCachedList()
    {
        return cache();
    }

    /**
     * @throws Cancelled once the results released before a
     * cancellation are used up.
     */
    std::optional<Value> pull();

    /**
     * Transfer the pipeline out as an iterator over its results. The
     * iterator fails with `Cancelled` rather than ending early.
     */
    std::unique_ptr<Iterator> takeIterator();

    /**
     * A Seq over the results.
     */
    ref<Seq> serial();

    /**
     * Stop dispatching work units. Units already running complete;
     * their results are discarded. Consumers other than `forEach` then
     * fail with `Cancelled`.
     */
    void cancel();

    bool isCancelled() const
    {
        return *cancelled;
    }

    bool isLazy() const;

    State getState() const
    {
        return state;
    }

    HyperOrder getOrder() const
    {
        return order;
    }

    const HyperConfig & getConfig() const
    {
        return config;
    }

    Value toValue();
};

/**
 * The process-wide thread pool used when no executor is given.
 */
ref<Executor> defaultExecutor();

Value hyper(
    const Operands & source, HyperConfig config = HyperConfig::fromSettings(), ref<Executor> executor = defaultExecutor());

Value race(
    const Operands & source, HyperConfig config = HyperConfig::fromSettings(), ref<Executor> executor = defaultExecutor());

} // namespace seqrt
