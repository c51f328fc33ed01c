#include "seqrt/seq/binder.hh"
#include "seqrt/seq/hyper-seq.hh"
#include "seqrt/seq/list.hh"
#include "seqrt/seq/seq-error.hh"
#include "seqrt/seq/sequence.hh"
#include "seqrt/util/logging.hh"

namespace seqrt {

ArgumentRule classifyArguments(const Operands & ops)
{
    if (ops.commaBuilt || ops.items.size() != 1)
        return ArgumentRule::CommaList;
    return ops.items[0].isIterable() ? ArgumentRule::Elements : ArgumentRule::Single;
}

std::unique_ptr<Iterator> iterateValue(const Value & v)
{
    switch (v.type()) {
    case nList:
    case nArray:
    case nSlip:
        return v.list()->iterator();
    case nSeq:
        return v.seq()->takeIterator();
    case nHyperSeq:
        return v.hyperSeq()->takeIterator();
    default:
        return std::make_unique<ValuesIterator>(ValueVector{v});
    }
}

std::unique_ptr<Iterator> iterationTarget(const Operands & ops)
{
    switch (classifyArguments(ops)) {
    case ArgumentRule::Single:
        return std::make_unique<ValuesIterator>(ops.items);
    case ArgumentRule::Elements:
        return iterateValue(ops.items[0]);
    case ArgumentRule::CommaList:
        return std::make_unique<SpliceIterator>(std::make_unique<ValuesIterator>(ops.items));
    }
    unreachable();
}

ValueVector effectiveArguments(const Operands & ops)
{
    ValueVector res;
    iterationTarget(ops)->pushAll(res);
    return res;
}

size_t effectiveArgumentCount(const Operands & ops)
{
    return effectiveArguments(ops).size();
}

Value bindToArrayParam(const Value & v, const BindOptions & options)
{
    auto target = v.decont();

    if (target.isPositional())
        return target;

    if (target.isa<tSeq>() || target.isa<tHyperSeq>()) {
        if (options.context != BindContext::Parameter || !options.cacheFallback)
            throw NotPositional("cannot bind a %s to an Array parameter", showType(target));
        debug("binding the cached List of a %s", showType(target));
        auto cached = target.isa<tSeq>() ? target.seq()->cache() : target.hyperSeq()->cache();
        return cached->toValue();
    }

    throw NotPositional("cannot bind a value of type %s to an Array parameter", showType(target));
}

} // namespace seqrt
