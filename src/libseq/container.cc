#include "seqrt/seq/container.hh"
#include "seqrt/seq/seq-error.hh"
#include "seqrt/seq/stats.hh"

namespace seqrt {

Container::Container(Value initial, bool rw)
    : value(initial.decont())
    , rw(rw)
{
    seqStats.nrContainers++;
}

void Container::set(Value v)
{
    if (!rw)
        throw ImmutableAssignment("cannot assign to a read-only Container holding %s", showType(value));
    value = v.decont();
}

Value box(Value v, bool rw)
{
    Value res;
    res.mkContainer(make_ref<Container>(std::move(v), rw));
    return res;
}

void assignElement(const Value & elem, Value v)
{
    if (!elem.isContainer())
        throw ImmutableAssignment("cannot assign to an immutable element of type %s", showType(elem));
    elem.container()->set(std::move(v));
}

} // namespace seqrt
