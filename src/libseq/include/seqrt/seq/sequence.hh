#pragma once
///@file

#include <memory>
#include <optional>

#include "seqrt/seq/iterator.hh"
#include "seqrt/seq/list.hh"

namespace seqrt {

/**
 * A one-shot sequence over a producer. It can be pulled to the end
 * once, cached into a List once (after which `cache()` keeps returning
 * that List), or have its producer transferred out. Any other use
 * after that fails with `AlreadyConsumed`.
 *
 * ```
 * Fresh --pull--> Consuming --end--> Consumed
 * Fresh --cache--> Cached
 * Fresh --takeIterator--> Consumed
 * ```
 */
class Seq : public std::enable_shared_from_this<Seq>
{
public:
    enum class State { Fresh, Consuming, Cached, Consumed };

private:
    State state = State::Fresh;

    /**
     * Null once the producer has been transferred or cached.
     */
    std::unique_ptr<Iterator> source;

    std::shared_ptr<List> cached;

    [[noreturn]] void alreadyConsumed(std::string_view operation) const;

public:

    /**
     * Bare Slips produced by `source` are spliced.
     */
    explicit Seq(std::unique_ptr<Iterator> source);

    ~Seq();

    std::optional<Value> pull();

    /**
     * Drain the producer into a List, or, for a lazy producer, a List
     * that reifies on demand.
     */
    ref<List> cache();

    ref<List> toCachedList()
    {
        return cache();
    }

    /**
     * Transfer the producer out of a fresh Seq.
     */
    std::unique_ptr<Iterator> takeIterator();

    size_t elems()
    {
        return cache()->elems();
    }

    bool isLazy() const;

    State getState() const
    {
        return state;
    }

    Value toValue();
};

std::string_view showState(Seq::State state);

Value toSequence(std::unique_ptr<Iterator> it);

} // namespace seqrt
