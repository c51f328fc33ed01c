#include "seqrt/seq/value.hh"
#include "seqrt/seq/container.hh"
#include "seqrt/seq/hyper-seq.hh"
#include "seqrt/seq/list.hh"
#include "seqrt/seq/sequence.hh"

namespace seqrt {

Value Value::vNothing = []() {
    Value res;
    res.mkNothing();
    return res;
}();

Value Value::vTrue = []() {
    Value res;
    res.mkBool(true);
    return res;
}();

Value Value::vFalse = []() {
    Value res;
    res.mkBool(false);
    return res;
}();

void Value::mkList(ref<List> l)
{
    switch (l->getKind()) {
    case ListKind::List:
        setStorage(tList, std::move(l));
        break;
    case ListKind::Array:
        setStorage(tArray, std::move(l));
        break;
    case ListKind::Slip:
        setStorage(tSlip, std::move(l));
        break;
    }
}

bool Value::isLazy() const
{
    switch (internalType) {
    case tList:
    case tArray:
    case tSlip:
        return list()->isLazy();
    case tSeq:
        return seq()->isLazy();
    case tHyperSeq:
        return hyperSeq()->isLazy();
    case tContainer:
        return container()->get().isLazy();
    default:
        return false;
    }
}

Value Value::decont() const
{
    return isContainer() ? container()->get() : *this;
}

bool Value::sameObject(const Value & other) const
{
    if (internalType != other.internalType)
        return false;
    switch (internalType) {
    case tContainer:
        return container() == other.container();
    case tList:
    case tArray:
    case tSlip:
        return list() == other.list();
    case tSeq:
        return seq() == other.seq();
    case tHyperSeq:
        return hyperSeq() == other.hyperSeq();
    default:
        return false;
    }
}

std::string_view showType(ValueType type)
{
    switch (type) {
    case nNothing:
        return "Nothing";
    case nBool:
        return "Bool";
    case nInt:
        return "Int";
    case nFloat:
        return "Float";
    case nString:
        return "Str";
    case nContainer:
        return "Container";
    case nList:
        return "List";
    case nArray:
        return "Array";
    case nSlip:
        return "Slip";
    case nSeq:
        return "Seq";
    case nHyperSeq:
        return "HyperSeq";
    }
    unreachable();
}

std::string_view showType(const Value & v)
{
    if (!v.isValid())
        return "an uninitialized value";
    return showType(v.type());
}

bool valueEquals(const Value & a0, const Value & b0)
{
    if (!a0.isValid() || !b0.isValid())
        return a0.isValid() == b0.isValid();

    auto a = a0.decont();
    auto b = b0.decont();

    if (a.sameObject(b))
        return true;

    if (a.isPositional() && b.isPositional()) {
        auto & la = a.list();
        auto & lb = b.list();
        if (la->isLazy() || lb->isLazy())
            return false;
        auto & ea = la->reifiedElems();
        auto & eb = lb->reifiedElems();
        if (ea.size() != eb.size())
            return false;
        for (size_t i = 0; i < ea.size(); ++i)
            if (!valueEquals(ea[i], eb[i]))
                return false;
        return true;
    }

    if (a.type() != b.type())
        return false;

    switch (a.type()) {
    case nNothing:
        return true;
    case nBool:
        return a.boolean() == b.boolean();
    case nInt:
        return a.integer() == b.integer();
    case nFloat:
        return a.fpoint() == b.fpoint();
    case nString:
        return a.string_view() == b.string_view();
    default:
        return false;
    }
}

} // namespace seqrt
