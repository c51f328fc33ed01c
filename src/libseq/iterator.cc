#include <cstdint>
#include <limits>

#include "seqrt/seq/iterator.hh"
#include "seqrt/seq/list.hh"
#include "seqrt/seq/seq-error.hh"

namespace seqrt {

size_t Iterator::pushExactly(ValueVector & target, size_t n)
{
    size_t pushed = 0;
    while (pushed < n) {
        auto v = pull();
        if (!v)
            break;
        target.push_back(std::move(*v));
        pushed++;
    }
    return pushed;
}

void Iterator::pushAll(ValueVector & target)
{
    if (isLazy())
        throw InfiniteLength("cannot push all values of a lazy iterator");
    if (auto n = countOnly())
        target.reserve(target.size() + *n);
    while (auto v = pull())
        target.push_back(std::move(*v));
}

bool Iterator::skipOne()
{
    return pull().has_value();
}

size_t Iterator::skipAtLeast(size_t n)
{
    size_t skipped = 0;
    while (skipped < n && skipOne())
        skipped++;
    return skipped;
}

void Iterator::sinkAll()
{
    if (isLazy())
        throw InfiniteLength("cannot sink a lazy iterator");
    while (skipOne())
        ;
}

std::optional<Value> ValuesIterator::pull()
{
    if (pos >= values.size())
        return std::nullopt;
    return values[pos++];
}

std::optional<Value> ListIterator::pull()
{
    if (!list->existsAt(pos))
        return std::nullopt;
    return list->at(pos++);
}

bool ListIterator::isLazy() const
{
    return list->isLazy();
}

std::optional<size_t> ListIterator::countOnly() const
{
    if (list->isLazy())
        return std::nullopt;
    auto n = list->reifiedCount();
    return pos < n ? n - pos : 0;
}

std::optional<Value> RangeIterator::pull()
{
    if (done || (to && next > *to))
        return std::nullopt;
    auto res = Value::fromInt(next);
    if (next == std::numeric_limits<SeqInt>::max())
        done = true;
    else
        next++;
    return res;
}

std::optional<size_t> RangeIterator::countOnly() const
{
    if (!to)
        return std::nullopt;
    if (done || next > *to)
        return 0;
    // Unsigned, since the span of a range may not fit in a SeqInt.
    uint64_t span = static_cast<uint64_t>(*to) - static_cast<uint64_t>(next);
    if (span >= std::numeric_limits<size_t>::max())
        return std::nullopt;
    return static_cast<size_t>(span) + 1;
}

std::optional<Value> GeneratorIterator::pull()
{
    if (done)
        return std::nullopt;
    auto v = producer();
    if (!v)
        done = true;
    return v;
}

std::optional<Value> SpliceIterator::pull()
{
    while (true) {
        if (current) {
            if (auto v = current->pull())
                return v;
            current.reset();
        }
        auto v = inner->pull();
        if (!v)
            return std::nullopt;
        if (!v->isa<tSlip>())
            return v;
        current = std::make_unique<ListIterator>(v->list());
    }
}

bool SpliceIterator::isLazy() const
{
    return inner->isLazy() || (current && current->isLazy());
}

} // namespace seqrt
