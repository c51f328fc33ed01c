#pragma once
///@file

#include <functional>
#include <memory>
#include <optional>

#include "seqrt/seq/value.hh"

namespace seqrt {

/**
 * The pull-based production protocol. `pull()` returns the next value,
 * or `std::nullopt` once the producer is exhausted. Pulling an
 * exhausted iterator keeps returning `std::nullopt`.
 *
 * Iterators yield elements as they are stored: the elements of an
 * Array come out as their Containers.
 */
class Iterator
{
public:
    virtual ~Iterator() = default;

    virtual std::optional<Value> pull() = 0;

    /**
     * Whether the producer is declared lazy (possibly infinite). Lazy
     * producers are never drained implicitly.
     */
    virtual bool isLazy() const
    {
        return false;
    }

    /**
     * The number of remaining values, if it is known without
     * producing them.
     */
    virtual std::optional<size_t> countOnly() const
    {
        return std::nullopt;
    }

    /**
     * Append at most `n` values to `target`.
     * @return the number of values appended.
     */
    size_t pushExactly(ValueVector & target, size_t n);

    /**
     * Append every remaining value to `target`.
     * @throws InfiniteLength if the iterator is lazy.
     */
    void pushAll(ValueVector & target);

    bool skipOne();

    /**
     * @return the number of values actually skipped.
     */
    size_t skipAtLeast(size_t n);

    /**
     * Drop every remaining value.
     * @throws InfiniteLength if the iterator is lazy.
     */
    void sinkAll();
};

class ValuesIterator : public Iterator
{
    ValueVector values;
    size_t pos = 0;

public:
    explicit ValuesIterator(ValueVector values)
        : values(std::move(values))
    {
    }

    std::optional<Value> pull() override;

    std::optional<size_t> countOnly() const override
    {
        return values.size() - pos;
    }
};

class List;

/**
 * Iterates a List, Array or Slip in place, reifying lazy storage one
 * element at a time.
 */
class ListIterator : public Iterator
{
    ref<List> list;
    size_t pos;

public:
    explicit ListIterator(ref<List> list, size_t pos = 0)
        : list(std::move(list))
        , pos(pos)
    {
    }

    std::optional<Value> pull() override;

    bool isLazy() const override;

    std::optional<size_t> countOnly() const override;
};

/**
 * Integers from `from` up to and including `to`; without `to`, an
 * infinite (lazy) range.
 */
class RangeIterator : public Iterator
{
    SeqInt next;
    std::optional<SeqInt> to;
    bool done = false;

public:
    RangeIterator(SeqInt from, std::optional<SeqInt> to)
        : next(from)
        , to(to)
    {
    }

    std::optional<Value> pull() override;

    bool isLazy() const override
    {
        return !to;
    }

    std::optional<size_t> countOnly() const override;
};

/**
 * Wraps an external producer callback. The callback returns
 * `std::nullopt` once it is exhausted and is not called again after
 * that.
 */
class GeneratorIterator : public Iterator
{
public:
    typedef std::function<std::optional<Value>()> Producer;

private:
    Producer producer;
    bool lazy;
    bool done = false;

public:
    GeneratorIterator(Producer producer, bool lazy)
        : producer(std::move(producer))
        , lazy(lazy)
    {
    }

    std::optional<Value> pull() override;

    bool isLazy() const override
    {
        return lazy;
    }
};

/**
 * Marks the wrapped producer as lazy.
 */
class LazyIterator : public Iterator
{
    std::unique_ptr<Iterator> inner;

public:
    explicit LazyIterator(std::unique_ptr<Iterator> inner)
        : inner(std::move(inner))
    {
    }

    std::optional<Value> pull() override
    {
        return inner->pull();
    }

    bool isLazy() const override
    {
        return true;
    }
};

/**
 * Splices bare Slips produced by the wrapped iterator: their elements
 * are produced in place of the Slip. Boxed Slips are left alone.
 */
class SpliceIterator : public Iterator
{
    std::unique_ptr<Iterator> inner;
    std::unique_ptr<Iterator> current;

public:
    explicit SpliceIterator(std::unique_ptr<Iterator> inner)
        : inner(std::move(inner))
    {
    }

    std::optional<Value> pull() override;

    bool isLazy() const override;
};

} // namespace seqrt
