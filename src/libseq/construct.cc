#include "seqrt/seq/construct.hh"
#include "seqrt/seq/array.hh"
#include "seqrt/seq/list.hh"

namespace seqrt {

Value makeList(const Operands & ops)
{
    return List::fromIterator(ListKind::List, iterationTarget(ops))->toValue();
}

Value makeArray(const Operands & ops)
{
    auto array = Array::make();
    array.assign(ops);
    return array.toValue();
}

Value toSlip(const Value & v)
{
    auto target = v.decont();
    if (target.isa<tSlip>())
        return target;
    return List::fromIterator(ListKind::Slip, iterateValue(target))->toValue();
}

} // namespace seqrt
