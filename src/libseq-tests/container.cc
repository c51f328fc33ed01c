#include "seqrt/seq/tests/libseq.hh"

namespace seqrt {

class ContainerTest : public LibSeqTest
{};

TEST_F(ContainerTest, holdsNothingByDefault)
{
    Container c;
    EXPECT_THAT(c.get(), IsNothing());
    EXPECT_TRUE(c.isMutable());
}

TEST_F(ContainerTest, setReplacesValue)
{
    Container c(mkInt(1));
    c.set(mkInt(2));
    EXPECT_THAT(c.get(), IsIntEq(2));
}

TEST_F(ContainerTest, readOnlyRejectsAssignment)
{
    Container c(mkInt(1), false);
    EXPECT_THROW(c.set(mkInt(2)), ImmutableAssignment);
    EXPECT_THAT(c.get(), IsIntEq(1));
}

TEST_F(ContainerTest, neverHoldsAnotherContainer)
{
    auto inner = box(mkInt(3));
    Container c(inner);
    EXPECT_FALSE(c.get().isContainer());
    EXPECT_THAT(c.get(), IsIntEq(3));

    c.set(box(mkInt(4)));
    EXPECT_FALSE(c.get().isContainer());
    EXPECT_THAT(c.get(), IsIntEq(4));
}

TEST_F(ContainerTest, boxCountsContainers)
{
    auto v = box(mkInt(1));
    EXPECT_THAT(v, IsContainer());
    EXPECT_THAT(v.decont(), IsIntEq(1));
    EXPECT_EQ(seqStats.nrContainers.load(), 1u);
}

TEST_F(ContainerTest, assignElementThroughContainer)
{
    auto elem = box(mkInt(1));
    assignElement(elem, mkInt(5));
    EXPECT_THAT(elem, IsIntEq(5));
}

TEST_F(ContainerTest, assignElementRejectsBareValue)
{
    EXPECT_THROW(assignElement(mkInt(1), mkInt(5)), ImmutableAssignment);
}

TEST_F(ContainerTest, sharedContainerIsVisibleEverywhere)
{
    auto shared = box(mkInt(1));
    auto a = makeList({shared, mkInt(2)});
    auto b = makeList({mkInt(0), shared});

    assignElement(a.list()->at(0), mkInt(42));

    EXPECT_THAT(b.list()->at(1), IsIntEq(42));
    EXPECT_TRUE(a.list()->at(0).sameObject(b.list()->at(1)));
}

} // namespace seqrt
