#include <algorithm>

#include "seqrt/seq/list-ops.hh"
#include "seqrt/seq/list.hh"
#include "seqrt/seq/sequence.hh"

namespace seqrt {

namespace {

class MapIterator : public Iterator
{
    std::unique_ptr<Iterator> source;
    std::function<Value(const Value &)> fn;

public:
    MapIterator(std::unique_ptr<Iterator> source, std::function<Value(const Value &)> fn)
        : source(std::move(source))
        , fn(std::move(fn))
    {
    }

    std::optional<Value> pull() override
    {
        auto v = source->pull();
        if (!v)
            return std::nullopt;
        return fn(*v);
    }

    bool isLazy() const override
    {
        return source->isLazy();
    }
};

class GrepIterator : public Iterator
{
    std::unique_ptr<Iterator> source;
    std::function<bool(const Value &)> pred;

public:
    GrepIterator(std::unique_ptr<Iterator> source, std::function<bool(const Value &)> pred)
        : source(std::move(source))
        , pred(std::move(pred))
    {
    }

    std::optional<Value> pull() override
    {
        while (auto v = source->pull())
            if (pred(*v))
                return v;
        return std::nullopt;
    }

    bool isLazy() const override
    {
        return source->isLazy();
    }
};

/**
 * At most `n` values. Never lazy, even over an infinite source.
 */
class HeadIterator : public Iterator
{
    std::unique_ptr<Iterator> source;
    size_t remaining;

public:
    HeadIterator(std::unique_ptr<Iterator> source, size_t n)
        : source(std::move(source))
        , remaining(n)
    {
    }

    std::optional<Value> pull() override
    {
        if (remaining == 0)
            return std::nullopt;
        auto v = source->pull();
        if (!v)
            remaining = 0;
        else
            remaining--;
        return v;
    }

    std::optional<size_t> countOnly() const override
    {
        if (remaining == 0)
            return 0;
        auto n = source->countOnly();
        if (!n)
            return std::nullopt;
        return std::min(*n, remaining);
    }
};

class SkipIterator : public Iterator
{
    std::unique_ptr<Iterator> source;
    size_t toSkip;

public:
    SkipIterator(std::unique_ptr<Iterator> source, size_t n)
        : source(std::move(source))
        , toSkip(n)
    {
    }

    std::optional<Value> pull() override
    {
        if (toSkip) {
            source->skipAtLeast(toSkip);
            toSkip = 0;
        }
        return source->pull();
    }

    bool isLazy() const override
    {
        return source->isLazy();
    }
};

class ZipIterator : public Iterator
{
    std::vector<std::unique_ptr<Iterator>> sources;
    bool done = false;

public:
    explicit ZipIterator(std::vector<std::unique_ptr<Iterator>> sources)
        : sources(std::move(sources))
    {
    }

    std::optional<Value> pull() override
    {
        if (done || sources.empty())
            return std::nullopt;
        ValueVector tuple;
        tuple.reserve(sources.size());
        for (auto & source : sources) {
            auto v = source->pull();
            if (!v) {
                done = true;
                return std::nullopt;
            }
            tuple.push_back(std::move(*v));
        }
        return make_ref<List>(ListKind::List, std::move(tuple))->toValue();
    }

    bool isLazy() const override
    {
        if (sources.empty())
            return false;
        for (auto & source : sources)
            if (!source->isLazy())
                return false;
        return true;
    }
};

} // namespace

Value fromValues(ValueVector values)
{
    return toSequence(std::make_unique<ValuesIterator>(std::move(values)));
}

Value range(SeqInt from, SeqInt to)
{
    return toSequence(std::make_unique<RangeIterator>(from, to));
}

Value infiniteRange(SeqInt from)
{
    return toSequence(std::make_unique<RangeIterator>(from, std::nullopt));
}

Value generate(GeneratorIterator::Producer producer, bool lazy)
{
    return toSequence(std::make_unique<GeneratorIterator>(std::move(producer), lazy));
}

Value lazy(const Operands & source)
{
    return toSequence(std::make_unique<LazyIterator>(iterationTarget(source)));
}

Value map(const Operands & source, std::function<Value(const Value &)> fn)
{
    return toSequence(std::make_unique<MapIterator>(iterationTarget(source), std::move(fn)));
}

Value grep(const Operands & source, std::function<bool(const Value &)> pred)
{
    return toSequence(std::make_unique<GrepIterator>(iterationTarget(source), std::move(pred)));
}

Value head(const Operands & source, size_t n)
{
    return toSequence(std::make_unique<HeadIterator>(iterationTarget(source), n));
}

Value skip(const Operands & source, size_t n)
{
    return toSequence(std::make_unique<SkipIterator>(iterationTarget(source), n));
}

Value zip(const std::vector<Operands> & sources)
{
    std::vector<std::unique_ptr<Iterator>> its;
    its.reserve(sources.size());
    for (auto & source : sources)
        its.push_back(iterationTarget(source));
    return toSequence(std::make_unique<ZipIterator>(std::move(its)));
}

} // namespace seqrt
