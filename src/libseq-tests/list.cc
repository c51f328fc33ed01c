#include "seqrt/seq/tests/libseq.hh"

namespace seqrt {

class ListTest : public LibSeqTest
{
protected:
    static Value naturals()
    {
        return List::fromIterator(ListKind::List, std::make_unique<RangeIterator>(0, std::nullopt))->toValue();
    }
};

// =============================================================================
// Indexing
// =============================================================================

TEST_F(ListTest, indexIsZeroBased)
{
    auto l = intList({10, 20, 30});
    EXPECT_THAT(l.list()->at(0), IsIntEq(10));
    EXPECT_THAT(l.list()->at(2), IsIntEq(30));
    EXPECT_EQ(l.list()->elems(), 3u);
}

TEST_F(ListTest, outOfRangeIndexFails)
{
    auto l = intList({1, 2});
    EXPECT_THROW(l.list()->at(2), IndexOutOfRange);
    EXPECT_FALSE(l.list()->existsAt(2));
    EXPECT_TRUE(l.list()->existsAt(1));
}

TEST_F(ListTest, emptyListIndexFails)
{
    EXPECT_THROW(intList({}).list()->at(0), IndexOutOfRange);
}

// =============================================================================
// Immutability
// =============================================================================

TEST_F(ListTest, bareElementIsImmutable)
{
    auto l = intList({1, 2});
    EXPECT_THROW(l.list()->assignAt(0, mkInt(9)), ImmutableAssignment);
    EXPECT_THROW(assignElement(l.list()->at(0), mkInt(9)), ImmutableAssignment);
    EXPECT_THAT(l, HasValues(std::vector<SeqInt>{1, 2}));
}

TEST_F(ListTest, boxedElementIsAssignable)
{
    auto l = makeList({box(mkInt(1)), mkInt(2)});
    l.list()->assignAt(0, mkInt(9));
    EXPECT_THAT(l.list()->at(0), IsIntEq(9));
    EXPECT_THROW(l.list()->assignAt(1, mkInt(9)), ImmutableAssignment);
}

TEST_F(ListTest, readOnlyBoxedElementIsNotAssignable)
{
    auto l = makeList({box(mkInt(1), false)});
    EXPECT_THROW(l.list()->assignAt(0, mkInt(9)), ImmutableAssignment);
}

// =============================================================================
// Lazy Lists
// =============================================================================

TEST_F(ListTest, lazyListReifiesOnDemand)
{
    auto l = naturals();
    EXPECT_TRUE(l.list()->isLazy());
    EXPECT_EQ(l.list()->reifiedCount(), 0u);

    EXPECT_THAT(l.list()->at(5), IsIntEq(5));
    EXPECT_EQ(l.list()->reifiedCount(), 6u);

    EXPECT_THAT(l.list()->at(2), IsIntEq(2));
    EXPECT_EQ(l.list()->reifiedCount(), 6u);
}

TEST_F(ListTest, elemsOfLazyListFails)
{
    EXPECT_THROW(naturals().list()->elems(), InfiniteLength);
}

TEST_F(ListTest, lazyFiniteProducerBecomesFinite)
{
    auto l = List::fromIterator(
                 ListKind::List, std::make_unique<LazyIterator>(std::make_unique<RangeIterator>(1, 3)))
                 ->toValue();
    EXPECT_TRUE(l.list()->isLazy());
    EXPECT_FALSE(l.list()->existsAt(3));
    EXPECT_FALSE(l.list()->isLazy());
    EXPECT_EQ(l.list()->elems(), 3u);
}

TEST_F(ListTest, reifiedElementsKeepTheirIdentity)
{
    auto c = box(mkInt(1));
    auto l = List::fromIterator(
                 ListKind::List, std::make_unique<LazyIterator>(std::make_unique<ValuesIterator>(ValueVector{c})))
                 ->toValue();
    EXPECT_TRUE(l.list()->at(0).sameObject(c));
    EXPECT_TRUE(l.list()->at(0).sameObject(l.list()->at(0)));
}

TEST_F(ListTest, producerFailureAddsTrace)
{
    auto l = List::fromIterator(
                 ListKind::List,
                 std::make_unique<GeneratorIterator>(
                     []() -> std::optional<Value> { throw TypeError("producer failed"); }, true))
                 ->toValue();
    try {
        l.list()->at(0);
        FAIL() << "expected a TypeError";
    } catch (TypeError & e) {
        EXPECT_THAT(std::string(e.what()), ::testing::HasSubstr("while reifying element 0 of a List"));
    }
}

// =============================================================================
// reverse / rotate
// =============================================================================

TEST_F(ListTest, reverseReturnsNewList)
{
    auto l = intList({1, 2, 3});
    auto r = l.list()->reverse()->toValue();
    EXPECT_THAT(r, HasValues(std::vector<SeqInt>{3, 2, 1}));
    EXPECT_THAT(l, HasValues(std::vector<SeqInt>{1, 2, 3}));
}

TEST_F(ListTest, rotate)
{
    auto l = intList({1, 2, 3, 4});
    EXPECT_THAT(l.list()->rotate(1)->toValue(), HasValues(std::vector<SeqInt>{2, 3, 4, 1}));
    EXPECT_THAT(l.list()->rotate(-1)->toValue(), HasValues(std::vector<SeqInt>{4, 1, 2, 3}));
    EXPECT_THAT(l.list()->rotate(6)->toValue(), HasValues(std::vector<SeqInt>{3, 4, 1, 2}));
    EXPECT_THAT(l.list()->rotate(0)->toValue(), HasValues(std::vector<SeqInt>{1, 2, 3, 4}));
    EXPECT_THAT(intList({}).list()->rotate(3)->toValue(), IsListOfSize(0));
}

TEST_F(ListTest, reverseOfLazyListFails)
{
    EXPECT_THROW(naturals().list()->reverse(), InfiniteLength);
    EXPECT_THROW(naturals().list()->rotate(1), InfiniteLength);
}

TEST_F(ListTest, reverseOfArrayKeepsContainers)
{
    auto a = intArray({1, 2});
    auto r = a.list()->reverse()->toValue();
    EXPECT_EQ(r.type(), nList);
    EXPECT_TRUE(r.list()->at(0).sameObject(a.list()->at(1)));
}

// =============================================================================
// Statistics
// =============================================================================

TEST_F(ListTest, countsCreatedLists)
{
    intList({1});
    intArray({1});
    toSlip(intList({}));
    EXPECT_EQ(seqStats.nrLists.load(), 2u);
    EXPECT_EQ(seqStats.nrArrays.load(), 1u);
    EXPECT_EQ(seqStats.nrSlips.load(), 1u);
}

} // namespace seqrt
