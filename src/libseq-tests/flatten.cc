#include "seqrt/seq/tests/libseq.hh"
#include "seqrt/seq/flatten.hh"
#include "seqrt/seq/list-ops.hh"

namespace seqrt {

class FlattenTest : public LibSeqTest
{};

TEST_F(FlattenTest, recursesIntoBareLists)
{
    auto l = makeList({mkInt(1), makeList({mkInt(2), makeList({mkInt(3)})}), mkInt(4)});
    EXPECT_THAT(drain(flatten(l)), ::testing::ElementsAre(IsIntEq(1), IsIntEq(2), IsIntEq(3), IsIntEq(4)));
}

TEST_F(FlattenTest, stopsAtContainers)
{
    auto boxed = box(intList({2, 3}));
    auto l = makeList({mkInt(1), boxed});
    auto s = flatten(l);
    auto first = s.seq()->pull();
    auto second = s.seq()->pull();
    ASSERT_TRUE(second.has_value());
    EXPECT_THAT(*first, IsIntEq(1));
    EXPECT_TRUE(second->sameObject(boxed));
    EXPECT_FALSE(s.seq()->pull().has_value());
}

TEST_F(FlattenTest, arrayIsIdentity)
{
    auto nested = intList({8, 9});
    auto a = makeArray({mkInt(1), nested, mkInt(3)});
    auto s = flatten(a);
    ValueVector out;
    while (auto v = s.seq()->pull())
        out.push_back(*v);
    ASSERT_EQ(out.size(), 3u);
    for (size_t i = 0; i < 3; ++i)
        EXPECT_TRUE(out[i].sameObject(a.list()->at(i)));
    EXPECT_TRUE(out[1].decont().sameObject(nested));
    EXPECT_EQ(seqStats.nrFlattenArrayFastPaths.load(), 1u);
}

TEST_F(FlattenTest, bareArrayInsideListYieldsItsContainers)
{
    auto a = makeArray({mkInt(2), intList({3, 4})});
    auto l = makeList({mkInt(1), a});
    auto out = drain(flatten(l));
    ASSERT_EQ(out.size(), 3u);
    EXPECT_THAT(out[0], IsIntEq(1));
    EXPECT_THAT(out[1], IsIntEq(2));
    EXPECT_THAT(out[2], IsListOfSize(2));
    EXPECT_EQ(seqStats.nrFlattenArrayFastPaths.load(), 1u);
}

TEST_F(FlattenTest, containerIsOneElement)
{
    auto boxed = box(intArray({1, 2}));
    auto out = drain(flatten(boxed));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_THAT(out[0], IsArray());
}

TEST_F(FlattenTest, scalarIsOneElement)
{
    EXPECT_THAT(drain(flatten(mkInt(5))), ::testing::ElementsAre(IsIntEq(5)));
}

TEST_F(FlattenTest, consumesNestedSequences)
{
    auto inner = range(2, 3);
    auto l = makeList({mkInt(1), inner});
    EXPECT_THAT(drain(flatten(l)), ::testing::ElementsAre(IsIntEq(1), IsIntEq(2), IsIntEq(3)));
    EXPECT_EQ(inner.seq()->getState(), Seq::State::Consumed);
}

TEST_F(FlattenTest, isLazyOverInfiniteSource)
{
    auto s = flatten(infiniteRange(0));
    EXPECT_TRUE(s.seq()->isLazy());
    EXPECT_THAT(*s.seq()->pull(), IsIntEq(0));
}

TEST_F(FlattenTest, counted)
{
    flatten(mkInt(1));
    flatten(intList({}));
    EXPECT_EQ(seqStats.nrFlattens.load(), 2u);
}

} // namespace seqrt
