#include <rapidcheck/gtest.h>

#include "seqrt/seq/tests/libseq.hh"
#include "seqrt/seq/flatten.hh"
#include "seqrt/seq/list-ops.hh"

namespace seqrt {

class PropertyTest : public LibSeqTest
{
protected:
    static Value listOfSize(int n)
    {
        ValueVector elems;
        for (int i = 0; i < n; ++i)
            elems.push_back(Value::fromInt(i));
        return makeList(Operands::comma(std::move(elems)));
    }
};

TEST_F(PropertyTest, force_init_for_rapidcheck) {}

// Property: a comma-built List has one element per operand, after
// exploding Slips.
RC_GTEST_FIXTURE_PROP(PropertyTest, prop_comma_count, ())
{
    auto operands = *rc::gen::inRange(0, 12);
    ValueVector items;
    size_t expected = 0;
    for (int i = 0; i < operands; i++) {
        auto size = *rc::gen::inRange(0, 6);
        switch (*rc::gen::inRange(0, 5)) {
        case 0:
            items.push_back(Value::fromInt(i));
            expected += 1;
            break;
        case 1:
            items.push_back(listOfSize(size));
            expected += 1;
            break;
        case 2:
            items.push_back(box(listOfSize(size)));
            expected += 1;
            break;
        case 3:
            items.push_back(makeArray(Operands::single(listOfSize(size))));
            expected += 1;
            break;
        default:
            items.push_back(toSlip(listOfSize(size)));
            expected += size;
            break;
        }
    }
    auto l = makeList(Operands::comma(std::move(items)));
    RC_ASSERT(l.list()->elems() == expected);
    for (auto & e : l.list()->reifiedElems())
        RC_ASSERT(!e.isa<tSlip>());
}

// Property: flattening an Array yields exactly its own Containers.
RC_GTEST_FIXTURE_PROP(PropertyTest, prop_flatten_array_identity, ())
{
    auto n = *rc::gen::inRange(0, 10);
    ValueVector items;
    for (int i = 0; i < n; i++)
        items.push_back(*rc::gen::inRange(0, 2) ? listOfSize(*rc::gen::inRange(0, 4)) : Value::fromInt(i));
    auto a = makeArray(Operands::comma(std::move(items)));

    auto s = flatten(a);
    size_t i = 0;
    while (auto v = s.seq()->pull()) {
        RC_ASSERT(v->isContainer());
        RC_ASSERT(v->sameObject(a.list()->at(i)));
        i++;
    }
    RC_ASSERT(i == a.list()->elems());
}

// Property: a Seq can be consumed once; its cache is stable.
RC_GTEST_FIXTURE_PROP(PropertyTest, prop_consume_once, ())
{
    auto n = *rc::gen::inRange(0, 50);
    if (*rc::gen::arbitrary<bool>()) {
        auto s = range(1, n);
        size_t pulled = 0;
        while (s.seq()->pull())
            pulled++;
        RC_ASSERT(pulled == (size_t) n);
        RC_ASSERT_THROWS_AS(s.seq()->pull(), AlreadyConsumed);
        RC_ASSERT_THROWS_AS(s.seq()->cache(), AlreadyConsumed);
    } else {
        auto s = range(1, n);
        auto first = s.seq()->cache();
        auto second = s.seq()->cache();
        RC_ASSERT(first == second);
        RC_ASSERT(first->elems() == (size_t) n);
        RC_ASSERT_THROWS_AS(s.seq()->pull(), AlreadyConsumed);
    }
}

// Property: a Slip operand is spliced in place, a List operand is not.
RC_GTEST_FIXTURE_PROP(PropertyTest, prop_slip_splice, (std::vector<int64_t> xs))
{
    ValueVector elems;
    for (auto x : xs)
        elems.push_back(Value::fromInt(x));
    auto inner = makeList(Operands::comma(elems));

    auto spliced = makeList({Value::fromInt(-1), toSlip(inner), Value::fromInt(-2)});
    RC_ASSERT(spliced.list()->elems() == xs.size() + 2);
    for (size_t i = 0; i < xs.size(); ++i)
        RC_ASSERT(spliced.list()->at(i + 1).integer() == xs[i]);

    auto nested = makeList({Value::fromInt(-1), inner, Value::fromInt(-2)});
    RC_ASSERT(nested.list()->elems() == 3u);
}

} // namespace seqrt
