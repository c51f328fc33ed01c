#include "seqrt/seq/tests/libseq.hh"
#include "seqrt/seq/list-ops.hh"

namespace seqrt {

class ConstructTest : public LibSeqTest
{};

// =============================================================================
// makeList
// =============================================================================

TEST_F(ConstructTest, boxedListIsOneElement)
{
    EXPECT_THAT(makeList(Operands::single(box(intList({1, 2, 3})))), IsListOfSize(1));
}

TEST_F(ConstructTest, bareListIsItsElements)
{
    EXPECT_THAT(makeList(Operands::single(intList({1, 2, 3}))), IsListOfSize(3));
}

TEST_F(ConstructTest, elementCountIsOperandCount)
{
    auto a = intArray({1, 2, 3, 4});
    auto b = intArray({5});
    EXPECT_THAT(makeList({a, b}), IsListOfSize(2));
}

TEST_F(ConstructTest, slipIsSpliced)
{
    auto l = makeList({mkInt(1), toSlip(intList({2, 3})), mkInt(4)});
    EXPECT_THAT(l, HasValues(std::vector<SeqInt>{1, 2, 3, 4}));
}

TEST_F(ConstructTest, nestedListIsNotSpliced)
{
    auto inner = intList({2, 3});
    auto l = makeList({mkInt(1), inner, mkInt(4)});
    ASSERT_THAT(l, IsListOfSize(3));
    EXPECT_THAT(l.list()->at(0), IsIntEq(1));
    EXPECT_TRUE(l.list()->at(1).sameObject(inner));
    EXPECT_THAT(l.list()->at(2), IsIntEq(4));
}

TEST_F(ConstructTest, finishedListHoldsNoSlip)
{
    auto l = makeList({toSlip(intList({1})), toSlip(intList({}))});
    for (auto & e : l.list()->reifiedElems())
        EXPECT_FALSE(e.isa<tSlip>());
    EXPECT_THAT(l, IsListOfSize(1));
}

TEST_F(ConstructTest, listKeepsContainers)
{
    auto c = box(mkInt(1));
    auto l = makeList({c});
    EXPECT_TRUE(l.list()->at(0).sameObject(c));
}

TEST_F(ConstructTest, emptyOperands)
{
    EXPECT_THAT(makeList({}), IsListOfSize(0));
    EXPECT_THAT(makeArray({}), IsListOfSize(0));
}

// =============================================================================
// makeArray
// =============================================================================

TEST_F(ConstructTest, arrayOfNestedListHasOneElement)
{
    // [[1, 2, 3],] and [(1, 2, 3)] as one operand
    auto a = makeArray({makeList({mkInt(1), mkInt(2), mkInt(3)})});
    ASSERT_THAT(a, IsArray());
    ASSERT_THAT(a, IsListOfSize(1));
    EXPECT_THAT(a.list()->at(0).decont(), HasValues(std::vector<SeqInt>{1, 2, 3}));
}

TEST_F(ConstructTest, arrayOfSingleNestedList)
{
    // [[1]] and [[1],] are both one element
    auto inner = makeArray({mkInt(1)});
    EXPECT_THAT(makeArray(Operands::single(makeArray(Operands::single(mkInt(1))))), IsListOfSize(1));
    EXPECT_THAT(makeArray({inner}), IsListOfSize(1));
}

TEST_F(ConstructTest, singleBareListOperandIsFlattenedIntoArray)
{
    // [@a] where @a has three elements
    EXPECT_THAT(makeArray(Operands::single(intList({1, 2, 3}))), IsListOfSize(3));
}

TEST_F(ConstructTest, arrayElementsAreFreshContainers)
{
    auto c = box(mkInt(1));
    auto a = makeArray({c});
    EXPECT_THAT(a.list()->at(0), IsContainer());
    EXPECT_FALSE(a.list()->at(0).sameObject(c));
}

// =============================================================================
// toSlip
// =============================================================================

TEST_F(ConstructTest, toSlipOfSlipIsIdentity)
{
    auto s = toSlip(intList({1}));
    EXPECT_TRUE(toSlip(s).sameObject(s));
}

TEST_F(ConstructTest, toSlipOfScalar)
{
    auto s = toSlip(mkInt(3));
    EXPECT_THAT(s, IsSlip());
    EXPECT_THAT(s, HasValues(std::vector<SeqInt>{3}));
}

TEST_F(ConstructTest, toSlipConsumesSeq)
{
    auto seq = range(1, 3);
    auto l = makeList({mkInt(0), toSlip(seq)});
    EXPECT_THAT(l, HasValues(std::vector<SeqInt>{0, 1, 2, 3}));
    EXPECT_EQ(seq.seq()->getState(), Seq::State::Consumed);
}

TEST_F(ConstructTest, escapedSlipBehavesAsList)
{
    auto s = toSlip(intList({4, 5}));
    EXPECT_THAT(s.list()->at(1), IsIntEq(5));
    EXPECT_EQ(s.list()->elems(), 2u);
}

TEST_F(ConstructTest, toSlipLooksThroughContainers)
{
    auto l = makeList({mkInt(0), toSlip(box(intList({1, 2})))});
    EXPECT_THAT(l, HasValues(std::vector<SeqInt>{0, 1, 2}));
}

} // namespace seqrt
