#include "seqrt/seq/tests/libseq.hh"
#include "seqrt/seq/list-ops.hh"

namespace seqrt {

class PrintTest : public LibSeqTest
{};

TEST_F(PrintTest, scalars)
{
    EXPECT_EQ(show(mkInt(-3)), "-3");
    EXPECT_EQ(show(Value::fromBool(true)), "True");
    EXPECT_EQ(show(Value::vNothing), "Nothing");
    EXPECT_EQ(show(Value::fromString("a\"b")), "\"a\\\"b\"");
    EXPECT_EQ(show(Value::fromFloat(1.5)), "1.5");
}

TEST_F(PrintTest, positionals)
{
    EXPECT_EQ(show(intList({1, 2})), "(1, 2)");
    EXPECT_EQ(show(intArray({1, 2})), "[1, 2]");
    EXPECT_EQ(show(toSlip(intList({1}))), "slip(1)");
    EXPECT_EQ(show(intList({})), "()");
    EXPECT_EQ(show(makeList({mkInt(1), intArray({2})})), "(1, [2])");
}

TEST_F(PrintTest, containersAreTransparent)
{
    EXPECT_EQ(show(box(intList({1}))), "(1)");
}

TEST_F(PrintTest, lazyListPrintsOnlyReifiedPrefix)
{
    auto l = infiniteRange(1).seq()->cache();
    EXPECT_EQ(show(l->toValue()), "(...)");
    l->at(1);
    EXPECT_EQ(show(l->toValue()), "(1, 2, ...)");
    EXPECT_EQ(l->reifiedCount(), 2u);
}

TEST_F(PrintTest, sequencesAreNotConsumed)
{
    auto s = range(1, 3);
    EXPECT_EQ(show(s), "Seq(fresh)");
    EXPECT_EQ(s.seq()->getState(), Seq::State::Fresh);
    drain(s);
    EXPECT_EQ(show(s), "Seq(consumed)");
}

TEST_F(PrintTest, cycles)
{
    auto a = Array::make();
    a.push(box(a.toValue()));
    EXPECT_EQ(show(a.toValue()), "[«repeated»]");
}

} // namespace seqrt
