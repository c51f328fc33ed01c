#include <limits>

#include "seqrt/seq/tests/libseq.hh"

namespace seqrt {

class IteratorTest : public LibSeqTest
{};

TEST_F(IteratorTest, exhaustionIsIdempotent)
{
    ValuesIterator it(ints({1}));
    EXPECT_TRUE(it.pull().has_value());
    EXPECT_FALSE(it.pull().has_value());
    EXPECT_FALSE(it.pull().has_value());
}

TEST_F(IteratorTest, generatorIsNotCalledAfterEnd)
{
    int calls = 0;
    GeneratorIterator it(
        [&]() -> std::optional<Value> {
            calls++;
            return std::nullopt;
        },
        false);
    EXPECT_FALSE(it.pull().has_value());
    EXPECT_FALSE(it.pull().has_value());
    EXPECT_EQ(calls, 1);
}

TEST_F(IteratorTest, pushExactly)
{
    RangeIterator it(1, 10);
    ValueVector out;
    EXPECT_EQ(it.pushExactly(out, 3), 3u);
    EXPECT_THAT(out, ::testing::ElementsAre(IsIntEq(1), IsIntEq(2), IsIntEq(3)));
    EXPECT_EQ(it.countOnly(), std::optional<size_t>(7));
}

TEST_F(IteratorTest, pushExactlyStopsAtEnd)
{
    RangeIterator it(1, 2);
    ValueVector out;
    EXPECT_EQ(it.pushExactly(out, 5), 2u);
}

TEST_F(IteratorTest, pushAllOfLazyFails)
{
    RangeIterator it(1, std::nullopt);
    ValueVector out;
    EXPECT_TRUE(it.isLazy());
    EXPECT_THROW(it.pushAll(out), InfiniteLength);
    EXPECT_THROW(it.sinkAll(), InfiniteLength);
}

TEST_F(IteratorTest, skip)
{
    RangeIterator it(1, 5);
    EXPECT_TRUE(it.skipOne());
    EXPECT_EQ(it.skipAtLeast(2), 2u);
    EXPECT_THAT(*it.pull(), IsIntEq(4));
    EXPECT_EQ(it.skipAtLeast(10), 1u);
    EXPECT_FALSE(it.skipOne());
}

TEST_F(IteratorTest, rangeStopsAtMaximum)
{
    auto max = std::numeric_limits<SeqInt>::max();
    RangeIterator it(max, std::nullopt);
    EXPECT_THAT(*it.pull(), IsIntEq(max));
    EXPECT_FALSE(it.pull().has_value());
}

TEST_F(IteratorTest, countOfWideRange)
{
    auto min = std::numeric_limits<SeqInt>::min();
    auto max = std::numeric_limits<SeqInt>::max();
    RangeIterator half(-1, max);
    EXPECT_EQ(half.countOnly(), std::optional<size_t>((size_t) max + 2));
    RangeIterator full(min, max);
    EXPECT_EQ(full.countOnly(), std::nullopt);
}

TEST_F(IteratorTest, emptyRange)
{
    RangeIterator it(3, 1);
    EXPECT_EQ(it.countOnly(), std::optional<size_t>(0));
    EXPECT_FALSE(it.pull().has_value());
}

TEST_F(IteratorTest, listIteratorYieldsStoredElements)
{
    auto a = intArray({1, 2});
    ListIterator it(a.list());
    EXPECT_EQ(it.countOnly(), std::optional<size_t>(2));
    auto v = it.pull();
    ASSERT_TRUE(v.has_value());
    EXPECT_THAT(*v, IsContainer());
    EXPECT_TRUE(v->sameObject(a.list()->at(0)));
}

TEST_F(IteratorTest, lazyIteratorMarksLazy)
{
    LazyIterator it(std::make_unique<ValuesIterator>(ints({1})));
    EXPECT_TRUE(it.isLazy());
    EXPECT_THAT(*it.pull(), IsIntEq(1));
}

TEST_F(IteratorTest, spliceLeavesBoxedSlipsAlone)
{
    auto boxed = box(toSlip(intList({1, 2})));
    SpliceIterator it(std::make_unique<ValuesIterator>(ValueVector{boxed, toSlip(intList({3}))}));
    ValueVector out;
    it.pushAll(out);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_THAT(out[0], IsContainer());
    EXPECT_THAT(out[1], IsIntEq(3));
}

} // namespace seqrt
