#pragma once
///@file

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <initializer_list>
#include <sstream>

#include "seqrt/seq/array.hh"
#include "seqrt/seq/binder.hh"
#include "seqrt/seq/construct.hh"
#include "seqrt/seq/container.hh"
#include "seqrt/seq/list.hh"
#include "seqrt/seq/print.hh"
#include "seqrt/seq/seq-error.hh"
#include "seqrt/seq/sequence.hh"
#include "seqrt/seq/stats.hh"
#include "seqrt/util/fmt.hh"

namespace seqrt {

inline void PrintTo(const Value & v, std::ostream * os)
{
    *os << v;
}

class LibSeqTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        resetStatistics();
        Counter::enabled = true;
    }

    void TearDown() override
    {
        Counter::enabled = false;
    }

    static Value mkInt(SeqInt n)
    {
        return Value::fromInt(n);
    }

    static ValueVector ints(std::initializer_list<SeqInt> ns)
    {
        ValueVector res;
        for (auto n : ns)
            res.push_back(Value::fromInt(n));
        return res;
    }

    /**
     * A List of bare integers.
     */
    static Value intList(std::initializer_list<SeqInt> ns)
    {
        return makeList(Operands::comma(ints(ns)));
    }

    static Value intArray(std::initializer_list<SeqInt> ns)
    {
        return makeArray(Operands::comma(ints(ns)));
    }

    /**
     * The (deconted) elements of a finite positional.
     */
    static ValueVector elemsOf(const Value & v)
    {
        ValueVector res;
        for (auto & e : v.decont().list()->reifiedElems())
            res.push_back(e.decont());
        return res;
    }

    /**
     * Pull a Seq to the end.
     */
    static ValueVector drain(const Value & seq)
    {
        ValueVector res;
        while (auto v = seq.seq()->pull())
            res.push_back(v->decont());
        return res;
    }

    static std::string show(const Value & v)
    {
        std::ostringstream str;
        str << v;
        return str.str();
    }
};

MATCHER(IsContainer, "")
{
    return arg.isContainer();
}

MATCHER(IsArray, "")
{
    return arg.template isa<tArray>();
}

MATCHER(IsSlip, "")
{
    return arg.template isa<tSlip>();
}

MATCHER(IsSeq, "")
{
    return arg.template isa<tSeq>();
}

MATCHER(IsNothing, "")
{
    return arg.decont().type() == nNothing;
}

MATCHER_P(IsIntEq, v, fmt("The integer is equal to \"%1%\"", v))
{
    auto d = arg.decont();
    if (d.type() != nInt) {
        *result_listener << "Expected an Int got " << showType(d);
        return false;
    }
    return d.integer() == v;
}

MATCHER_P(IsStringEq, s, fmt("The string is equal to \"%1%\"", s))
{
    auto d = arg.decont();
    if (d.type() != nString)
        return false;
    return d.string_view() == s;
}

MATCHER_P(IsListOfSize, n, fmt("Is a positional of size [%1%]", n))
{
    auto d = arg.decont();
    if (!d.isPositional()) {
        *result_listener << "Expected a positional got " << showType(d);
        return false;
    } else if (d.list()->isLazy()) {
        *result_listener << "Expected a finite positional got a lazy " << showType(d);
        return false;
    } else if (d.list()->reifiedCount() != (size_t) n) {
        *result_listener << "Expected a positional of size " << n << " got " << d.list()->reifiedCount();
        return false;
    }
    return true;
}

/**
 * The deconted elements of a finite positional are the given integers.
 */
MATCHER_P(HasValues, ns, fmt("Has the values %1%", ::testing::PrintToString(ns)))
{
    auto d = arg.decont();
    if (!d.isPositional() || d.list()->isLazy()) {
        *result_listener << "Expected a finite positional got " << showType(d);
        return false;
    }
    auto & elems = d.list()->reifiedElems();
    std::vector<SeqInt> actual;
    for (auto & e : elems) {
        auto v = e.decont();
        if (v.type() != nInt) {
            *result_listener << "element of type " << showType(v);
            return false;
        }
        actual.push_back(v.integer());
    }
    std::vector<SeqInt> expected(ns.begin(), ns.end());
    if (actual != expected) {
        *result_listener << "got " << ::testing::PrintToString(actual);
        return false;
    }
    return true;
}

} // namespace seqrt
