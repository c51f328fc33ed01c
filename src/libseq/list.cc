#include "seqrt/seq/list.hh"
#include "seqrt/seq/container.hh"
#include "seqrt/seq/seq-error.hh"
#include "seqrt/seq/stats.hh"
#include "seqrt/util/logging.hh"

namespace seqrt {

std::string_view showListKind(ListKind kind)
{
    switch (kind) {
    case ListKind::List:
        return "List";
    case ListKind::Array:
        return "Array";
    case ListKind::Slip:
        return "Slip";
    }
    unreachable();
}

List::List(ListKind kind, ValueVector elems)
    : kind(kind)
    , reified(std::move(elems))
{
    seqStats.countList(kind);
    seqStats.reifiedSizes.record(kind, reified.size());
}

List::List(ListKind kind, ValueVector reified, std::unique_ptr<Iterator> todo)
    : kind(kind)
    , reified(std::move(reified))
    , todo(std::move(todo))
{
    seqStats.countList(kind);
    if (!this->todo)
        seqStats.reifiedSizes.record(kind, this->reified.size());
}

List::~List() = default;

ref<List> List::fromIterator(ListKind kind, std::unique_ptr<Iterator> it)
{
    std::unique_ptr<Iterator> source = std::make_unique<SpliceIterator>(std::move(it));

    if (source->isLazy()) {
        debug("storing a lazy producer in a new %s", showListKind(kind));
        return make_ref<List>(kind, ValueVector{}, std::move(source));
    }

    ValueVector elems;
    if (auto n = source->countOnly())
        elems.reserve(*n);
    while (auto v = source->pull())
        elems.push_back(kind == ListKind::Array ? box(*v) : std::move(*v));
    return make_ref<List>(kind, std::move(elems));
}

Value List::adopt(const Value & v) const
{
    return kind == ListKind::Array ? box(v) : v;
}

void List::finishReification()
{
    todo.reset();
    seqStats.reifiedSizes.record(kind, reified.size());
}

bool List::reifyUntil(size_t i)
{
    while (i >= reified.size() && todo) {
        std::optional<Value> v;
        try {
            v = todo->pull();
        } catch (BaseError & e) {
            e.addTrace(HintFmt("while reifying element %1% of a %2%", reified.size(), showListKind(kind)));
            throw;
        }
        if (!v)
            finishReification();
        else
            reified.push_back(adopt(*v));
    }
    return i < reified.size();
}

void List::requireFinite()
{
    if (todo)
        throw InfiniteLength("cannot reify a lazy %s", showListKind(kind));
}

size_t List::elems()
{
    if (todo)
        throw InfiniteLength("cannot determine the number of elements of a lazy %s", showListKind(kind));
    return reified.size();
}

Value List::at(size_t i)
{
    if (!reifyUntil(i))
        throw IndexOutOfRange("index %d is out of range for a %s of %d elements", i, showListKind(kind), reified.size());
    return reified[i];
}

bool List::existsAt(size_t i)
{
    return reifyUntil(i);
}

void List::assignAt(size_t i, Value v)
{
    assignElement(at(i), std::move(v));
}

ref<List> List::reverse()
{
    requireFinite();
    return make_ref<List>(ListKind::List, ValueVector(reified.rbegin(), reified.rend()));
}

ref<List> List::rotate(long n)
{
    requireFinite();
    ValueVector res;
    res.reserve(reified.size());
    if (!reified.empty()) {
        long size = static_cast<long>(reified.size());
        long start = ((n % size) + size) % size;
        res.insert(res.end(), reified.begin() + start, reified.end());
        res.insert(res.end(), reified.begin(), reified.begin() + start);
    }
    return make_ref<List>(ListKind::List, std::move(res));
}

std::unique_ptr<Iterator> List::iterator()
{
    return std::make_unique<ListIterator>(ref<List>(shared_from_this()));
}

Value List::toValue()
{
    Value v;
    v.mkList(ref<List>(shared_from_this()));
    return v;
}

Value emptySlip()
{
    static Value empty = make_ref<List>(ListKind::Slip, ValueVector{})->toValue();
    return empty;
}

} // namespace seqrt
