#include "seqrt/seq/tests/libseq.hh"
#include "seqrt/seq/list-ops.hh"

namespace seqrt {

class SequenceTest : public LibSeqTest
{};

TEST_F(SequenceTest, startsFresh)
{
    auto s = range(1, 3);
    EXPECT_THAT(s, IsSeq());
    EXPECT_EQ(s.seq()->getState(), Seq::State::Fresh);
}

TEST_F(SequenceTest, pullMovesThroughConsumingToConsumed)
{
    auto s = range(1, 2);
    auto v = s.seq()->pull();
    ASSERT_TRUE(v.has_value());
    EXPECT_THAT(*v, IsIntEq(1));
    EXPECT_EQ(s.seq()->getState(), Seq::State::Consuming);

    EXPECT_THAT(*s.seq()->pull(), IsIntEq(2));
    EXPECT_EQ(s.seq()->getState(), Seq::State::Consuming);

    EXPECT_FALSE(s.seq()->pull().has_value());
    EXPECT_EQ(s.seq()->getState(), Seq::State::Consumed);
}

TEST_F(SequenceTest, pullAfterDrainFails)
{
    auto s = range(1, 3);
    drain(s);
    EXPECT_THROW(s.seq()->pull(), AlreadyConsumed);
    EXPECT_THROW(s.seq()->cache(), AlreadyConsumed);
}

TEST_F(SequenceTest, cacheAfterPartialPullFails)
{
    auto s = range(1, 3);
    s.seq()->pull();
    EXPECT_THROW(s.seq()->cache(), AlreadyConsumed);
}

TEST_F(SequenceTest, cacheIsIdempotent)
{
    auto s = range(1, 3);
    auto first = s.seq()->cache();
    auto second = s.seq()->toCachedList();
    EXPECT_EQ(first, second);
    EXPECT_THAT(first->toValue(), HasValues(std::vector<SeqInt>{1, 2, 3}));
    EXPECT_EQ(s.seq()->getState(), Seq::State::Cached);
    EXPECT_EQ(seqStats.nrSeqsCached.load(), 1u);
}

TEST_F(SequenceTest, pullAfterCacheFails)
{
    auto s = range(1, 3);
    s.seq()->cache();
    EXPECT_THROW(s.seq()->pull(), AlreadyConsumed);
}

TEST_F(SequenceTest, elemsCaches)
{
    auto s = range(1, 5);
    EXPECT_EQ(s.seq()->elems(), 5u);
    EXPECT_EQ(s.seq()->elems(), 5u);
}

TEST_F(SequenceTest, cacheOfLazySeqIsLazyList)
{
    auto s = infiniteRange(10);
    auto l = s.seq()->cache();
    EXPECT_TRUE(l->isLazy());
    EXPECT_THAT(l->at(3), IsIntEq(13));
    EXPECT_THROW(s.seq()->elems(), InfiniteLength);
}

TEST_F(SequenceTest, takeIteratorTransfersProducer)
{
    auto s = range(1, 2);
    auto it = s.seq()->takeIterator();
    EXPECT_EQ(s.seq()->getState(), Seq::State::Consumed);
    EXPECT_THROW(s.seq()->takeIterator(), AlreadyConsumed);
    EXPECT_THAT(*it->pull(), IsIntEq(1));
    EXPECT_EQ(seqStats.nrIteratorsTaken.load(), 1u);
}

TEST_F(SequenceTest, splicesSlips)
{
    auto s = toSequence(
        std::make_unique<ValuesIterator>(ValueVector{mkInt(1), toSlip(intList({2, 3})), emptySlip(), mkInt(4)}));
    EXPECT_THAT(drain(s), ::testing::ElementsAre(IsIntEq(1), IsIntEq(2), IsIntEq(3), IsIntEq(4)));
}

TEST_F(SequenceTest, isLazy)
{
    EXPECT_TRUE(infiniteRange(0).seq()->isLazy());
    EXPECT_FALSE(range(0, 1).seq()->isLazy());
    auto s = range(0, 1);
    drain(s);
    EXPECT_FALSE(s.seq()->isLazy());
}

TEST_F(SequenceTest, showState)
{
    EXPECT_EQ(showState(Seq::State::Fresh), "fresh");
    EXPECT_EQ(showState(Seq::State::Consumed), "consumed");
}

} // namespace seqrt
