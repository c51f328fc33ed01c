#include "seqrt/seq/tests/libseq.hh"
#include "seqrt/seq/list-ops.hh"

namespace seqrt {

class ArrayTest : public LibSeqTest
{
protected:
    static Array arrayOf(std::initializer_list<SeqInt> ns)
    {
        return Array::fromValue(intArray(ns));
    }

    static std::vector<SeqInt> v(std::initializer_list<SeqInt> ns)
    {
        return std::vector<SeqInt>(ns);
    }
};

// =============================================================================
// Boxing
// =============================================================================

TEST_F(ArrayTest, everyElementIsBoxed)
{
    auto a = arrayOf({1, 2, 3});
    for (size_t i = 0; i < 3; ++i)
        EXPECT_THAT(a.at(i), IsContainer());
    EXPECT_THAT(a.get(1), IsIntEq(2));
}

TEST_F(ArrayTest, elementsAreAssignable)
{
    auto a = arrayOf({1, 2});
    a.list()->assignAt(0, mkInt(7));
    EXPECT_THAT(a.toValue(), HasValues(v({7, 2})));
}

TEST_F(ArrayTest, fromValueRejectsList)
{
    EXPECT_THROW(Array::fromValue(intList({1})), TypeError);
    EXPECT_NO_THROW(Array::fromValue(box(intArray({1}))));
}

// =============================================================================
// Growth
// =============================================================================

TEST_F(ArrayTest, assignPastTheEndGrows)
{
    auto a = arrayOf({1});
    a.assignAt(3, mkInt(4));
    EXPECT_EQ(a.elems(), 4u);
    EXPECT_THAT(a.at(1), IsContainer());
    EXPECT_THAT(a.at(1), IsNothing());
    EXPECT_THAT(a.at(2), IsNothing());
    EXPECT_THAT(a.get(3), IsIntEq(4));
    EXPECT_FALSE(a.at(1).sameObject(a.at(2)));
}

TEST_F(ArrayTest, assignInRange)
{
    auto a = arrayOf({1, 2});
    auto slot = a.at(1);
    a.assignAt(1, mkInt(5));
    EXPECT_TRUE(a.at(1).sameObject(slot));
    EXPECT_THAT(slot, IsIntEq(5));
}

// =============================================================================
// push / pop / shift / unshift
// =============================================================================

TEST_F(ArrayTest, pushBareListPushesElements)
{
    auto a = arrayOf({1});
    a.push(intList({2, 3}));
    EXPECT_THAT(a.toValue(), HasValues(v({1, 2, 3})));
}

TEST_F(ArrayTest, pushBoxedListPushesOneElement)
{
    auto a = arrayOf({1});
    auto inner = intList({2, 3});
    a.push(box(inner));
    EXPECT_EQ(a.elems(), 2u);
    EXPECT_TRUE(a.get(1).sameObject(inner));
}

TEST_F(ArrayTest, pushCommaListPushesOnePerOperand)
{
    auto a = arrayOf({});
    a.push(Operands{intList({1, 2}), mkInt(3)});
    EXPECT_EQ(a.elems(), 2u);
    EXPECT_THAT(a.get(0), IsListOfSize(2));
    EXPECT_THAT(a.get(1), IsIntEq(3));
}

TEST_F(ArrayTest, pushedValuesGetFreshContainers)
{
    auto shared = box(mkInt(1));
    auto a = arrayOf({});
    a.push(Operands{shared});
    EXPECT_FALSE(a.at(0).sameObject(shared));
    assignElement(shared, mkInt(2));
    EXPECT_THAT(a.get(0), IsIntEq(1));
}

TEST_F(ArrayTest, unshift)
{
    auto a = arrayOf({3});
    a.unshift(Operands{mkInt(1), mkInt(2)});
    EXPECT_THAT(a.toValue(), HasValues(v({1, 2, 3})));
}

TEST_F(ArrayTest, popAndShift)
{
    auto a = arrayOf({1, 2, 3});
    EXPECT_THAT(a.pop(), IsIntEq(3));
    EXPECT_THAT(a.shift(), IsIntEq(1));
    EXPECT_THAT(a.toValue(), HasValues(v({2})));
}

TEST_F(ArrayTest, popReturnsPlainValue)
{
    auto a = arrayOf({1});
    EXPECT_FALSE(a.pop().isContainer());
}

TEST_F(ArrayTest, popOrShiftOnEmptyFails)
{
    auto a = arrayOf({});
    EXPECT_THROW(a.pop(), EmptyCollection);
    EXPECT_THROW(a.shift(), EmptyCollection);
}

// =============================================================================
// splice
// =============================================================================

TEST_F(ArrayTest, spliceRemovesAndInserts)
{
    auto a = arrayOf({1, 2, 3, 4});
    auto removed = a.splice(1, 2, Operands{mkInt(8), mkInt(9), mkInt(10)});
    EXPECT_THAT(removed, IsArray());
    EXPECT_THAT(removed, HasValues(v({2, 3})));
    EXPECT_THAT(a.toValue(), HasValues(v({1, 8, 9, 10, 4})));
}

TEST_F(ArrayTest, spliceClipsCount)
{
    auto a = arrayOf({1, 2, 3});
    auto removed = a.splice(1, 10);
    EXPECT_THAT(removed, HasValues(v({2, 3})));
    EXPECT_THAT(a.toValue(), HasValues(v({1})));
}

TEST_F(ArrayTest, spliceAtEndInserts)
{
    auto a = arrayOf({1});
    a.splice(1, 0, Operands{mkInt(2)});
    EXPECT_THAT(a.toValue(), HasValues(v({1, 2})));
}

TEST_F(ArrayTest, spliceStartPastEndFails)
{
    auto a = arrayOf({1});
    EXPECT_THROW(a.splice(2, 0), IndexOutOfRange);
}

TEST_F(ArrayTest, splicedOutValuesAreIndependent)
{
    auto a = arrayOf({1, 2});
    auto removed = Array::fromValue(a.splice(0, 1));
    EXPECT_FALSE(removed.at(0).sameObject(a.at(0)));
}

// =============================================================================
// Eager and lazy assignment
// =============================================================================

TEST_F(ArrayTest, assignDrainsSequenceEagerly)
{
    auto a = arrayOf({9});
    a.assign(Operands::single(range(2, 4)));
    EXPECT_FALSE(a.isLazy());
    EXPECT_THAT(a.toValue(), HasValues(v({2, 3, 4})));
}

TEST_F(ArrayTest, assignCopiesIntoFreshContainers)
{
    auto source = arrayOf({2, 3, 4});
    auto a = arrayOf({});
    a.assign(Operands::single(source.toValue()));
    EXPECT_EQ(a.elems(), 3u);
    for (size_t i = 0; i < 3; ++i)
        EXPECT_FALSE(a.at(i).sameObject(source.at(i)));

    source.assignAt(0, mkInt(100));
    EXPECT_THAT(a.toValue(), HasValues(v({2, 3, 4})));
}

TEST_F(ArrayTest, assignFromItself)
{
    auto a = arrayOf({1, 2});
    a.assign(Operands::single(a.toValue()));
    EXPECT_THAT(a.toValue(), HasValues(v({1, 2})));
}

TEST_F(ArrayTest, assignLazyProducerKeepsItLazy)
{
    auto a = arrayOf({});
    a.assign(Operands::single(infiniteRange(1)));
    EXPECT_TRUE(a.isLazy());
    EXPECT_EQ(a.list()->reifiedCount(), 0u);
    EXPECT_THAT(a.get(4), IsIntEq(5));
    EXPECT_THAT(a.at(4), IsContainer());
    EXPECT_EQ(a.list()->reifiedCount(), 5u);
    EXPECT_THROW(a.elems(), InfiniteLength);
}

TEST_F(ArrayTest, lazyArrayEndOperationsFail)
{
    auto a = arrayOf({});
    a.assign(Operands::single(infiniteRange(1)));
    EXPECT_THROW(a.push(mkInt(0)), InfiniteLength);
    EXPECT_THROW(a.pop(), InfiniteLength);
    EXPECT_THAT(a.shift(), IsIntEq(1));
    a.unshift(mkInt(0));
    EXPECT_THAT(a.get(0), IsIntEq(0));
    EXPECT_THAT(a.get(1), IsIntEq(2));
}

TEST_F(ArrayTest, assignSplicesSlips)
{
    auto a = arrayOf({});
    a.assign(Operands{mkInt(1), toSlip(intList({2, 3})), mkInt(4)});
    EXPECT_THAT(a.toValue(), HasValues(v({1, 2, 3, 4})));
}

TEST_F(ArrayTest, clear)
{
    auto a = arrayOf({1, 2});
    a.clear();
    EXPECT_EQ(a.elems(), 0u);
}

} // namespace seqrt
