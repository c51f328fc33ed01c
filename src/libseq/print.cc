#include <ostream>

#include "seqrt/seq/container.hh"
#include "seqrt/seq/hyper-seq.hh"
#include "seqrt/seq/list.hh"
#include "seqrt/seq/print.hh"
#include "seqrt/seq/sequence.hh"

namespace seqrt {

static constexpr size_t maxPrintDepth = 256;

static void printLiteralString(std::ostream & str, std::string_view s)
{
    str << '"';
    for (auto c : s) {
        if (c == '"' || c == '\\')
            str << '\\' << c;
        else if (c == '\n')
            str << "\\n";
        else
            str << c;
    }
    str << '"';
}

static void printElements(const List & list, std::ostream & str, std::set<const void *> * seen, size_t depth)
{
    bool first = true;
    for (auto & elem : list.reifiedElems()) {
        if (!first)
            str << ", ";
        first = false;
        printValue(elem, str, seen, depth + 1);
    }
    if (list.isLazy())
        str << (first ? "..." : ", ...");
}

void printValue(const Value & v, std::ostream & str, std::set<const void *> * seen, size_t depth)
{
    if (!v.isValid()) {
        str << "«uninitialized»";
        return;
    }

    if (depth > maxPrintDepth) {
        str << "«too deep»";
        return;
    }

    switch (v.type()) {
    case nNothing:
        str << "Nothing";
        break;
    case nBool:
        str << (v.boolean() ? "True" : "False");
        break;
    case nInt:
        str << v.integer();
        break;
    case nFloat:
        str << v.fpoint();
        break;
    case nString:
        printLiteralString(str, v.string_view());
        break;
    case nContainer:
        printValue(v.container()->get(), str, seen, depth + 1);
        break;
    case nList:
    case nArray:
    case nSlip: {
        auto & list = v.list();
        if (seen && list->reifiedCount() && !seen->insert(&*list).second) {
            str << "«repeated»";
            break;
        }
        const char * open = v.isa<tArray>() ? "[" : v.isa<tSlip>() ? "slip(" : "(";
        const char * close = v.isa<tArray>() ? "]" : ")";
        str << open;
        printElements(*list, str, seen, depth);
        str << close;
        break;
    }
    case nSeq:
        str << "Seq(" << showState(v.seq()->getState()) << ")";
        break;
    case nHyperSeq:
        str << "HyperSeq(" << showState(v.hyperSeq()->getState()) << ")";
        break;
    }
}

std::ostream & operator<<(std::ostream & str, const Value & v)
{
    std::set<const void *> seen;
    printValue(v, str, &seen);
    return str;
}

} // namespace seqrt
