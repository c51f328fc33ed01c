#include <algorithm>

#include "seqrt/seq/array.hh"
#include "seqrt/seq/container.hh"
#include "seqrt/seq/seq-error.hh"
#include "seqrt/seq/stats.hh"
#include "seqrt/util/logging.hh"

namespace seqrt {

Array Array::make()
{
    return Array(make_ref<List>(ListKind::Array, ValueVector{}));
}

Array Array::fromValue(const Value & v)
{
    auto target = v.decont();
    if (!target.isa<tArray>())
        throw TypeError("expected an Array but got %s", showType(target));
    return Array(target.list());
}

ValueVector Array::boxAll(const Operands & values)
{
    auto args = effectiveArguments(values);
    for (auto & v : args)
        v = box(v);
    return args;
}

void Array::assignAt(size_t i, Value v)
{
    if (!storage->reifyUntil(i)) {
        auto & elems = storage->reified;
        while (elems.size() <= i)
            elems.push_back(box(Value::vNothing));
    }
    storage->reified[i].container()->set(std::move(v));
}

void Array::push(const Operands & values)
{
    if (storage->isLazy())
        throw InfiniteLength("cannot push onto a lazy Array");
    auto boxed = boxAll(values);
    auto & elems = storage->reified;
    elems.insert(elems.end(), boxed.begin(), boxed.end());
}

void Array::unshift(const Operands & values)
{
    auto boxed = boxAll(values);
    auto & elems = storage->reified;
    elems.insert(elems.begin(), boxed.begin(), boxed.end());
}

Value Array::pop()
{
    if (storage->isLazy())
        throw InfiniteLength("cannot pop from a lazy Array");
    auto & elems = storage->reified;
    if (elems.empty())
        throw EmptyCollection("cannot pop from an empty Array");
    auto res = elems.back().decont();
    elems.pop_back();
    return res;
}

Value Array::shift()
{
    if (!storage->reifyUntil(0))
        throw EmptyCollection("cannot shift from an empty Array");
    auto & elems = storage->reified;
    auto res = elems.front().decont();
    elems.erase(elems.begin());
    return res;
}

Value Array::splice(size_t start, size_t count, const Operands & replacement)
{
    if (count > 0)
        storage->reifyUntil(start + count - 1);
    else
        storage->reifyUntil(start);

    auto & elems = storage->reified;
    if (start > elems.size())
        throw IndexOutOfRange("splice start %d is past the end of an Array of %d elements", start, elems.size());
    count = std::min(count, elems.size() - start);

    auto removed = make();
    auto & out = removed.storage->reified;
    for (size_t i = start; i < start + count; ++i)
        out.push_back(box(elems[i]));

    auto boxed = boxAll(replacement);
    elems.erase(elems.begin() + start, elems.begin() + start + count);
    elems.insert(elems.begin() + start, boxed.begin(), boxed.end());

    return removed.toValue();
}

void Array::assign(const Operands & source)
{
    std::unique_ptr<Iterator> it = std::make_unique<SpliceIterator>(iterationTarget(source));

    if (it->isLazy()) {
        debug("assigning a lazy producer to an Array");
        storage->reified.clear();
        storage->todo = std::move(it);
        return;
    }

    ValueVector elems;
    while (auto v = it->pull())
        elems.push_back(box(*v));
    debug("eagerly assigned %d elements to an Array", elems.size());
    storage->todo.reset();
    storage->reified = std::move(elems);
    seqStats.reifiedSizes.record(ListKind::Array, storage->reified.size());
}

void Array::clear()
{
    storage->todo.reset();
    storage->reified.clear();
}

} // namespace seqrt
