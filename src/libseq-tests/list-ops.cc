#include "seqrt/seq/tests/libseq.hh"
#include "seqrt/seq/list-ops.hh"

namespace seqrt {

class ListOpsTest : public LibSeqTest
{};

TEST_F(ListOpsTest, mapReturnsSeq)
{
    auto s = map(Operands::single(intList({1, 2, 3})), [](const Value & v) { return Value::fromInt(v.decont().integer() * 2); });
    EXPECT_THAT(s, IsSeq());
    EXPECT_THAT(drain(s), ::testing::ElementsAre(IsIntEq(2), IsIntEq(4), IsIntEq(6)));
}

TEST_F(ListOpsTest, mapSplicesSlips)
{
    auto s = map(Operands::single(intList({1, 2, 3})), [](const Value & v) {
        auto n = v.decont().integer();
        if (n == 2)
            return emptySlip();
        if (n == 3)
            return toSlip(makeList({Value::fromInt(3), Value::fromInt(3)}));
        return v;
    });
    EXPECT_THAT(drain(s), ::testing::ElementsAre(IsIntEq(1), IsIntEq(3), IsIntEq(3)));
}

TEST_F(ListOpsTest, mapIsLazyUntilPulled)
{
    int calls = 0;
    auto s = map(Operands::single(infiniteRange(1)), [&](const Value & v) {
        calls++;
        return v;
    });
    EXPECT_EQ(calls, 0);
    EXPECT_TRUE(s.seq()->isLazy());
    s.seq()->pull();
    EXPECT_EQ(calls, 1);
}

TEST_F(ListOpsTest, grep)
{
    auto s = grep(Operands::single(range(1, 6)), [](const Value & v) { return v.decont().integer() % 2 == 0; });
    EXPECT_THAT(drain(s), ::testing::ElementsAre(IsIntEq(2), IsIntEq(4), IsIntEq(6)));
}

TEST_F(ListOpsTest, headOfInfiniteIsFinite)
{
    auto s = head(Operands::single(infiniteRange(5)), 3);
    EXPECT_FALSE(s.seq()->isLazy());
    EXPECT_THAT(s.seq()->cache()->toValue(), HasValues(std::vector<SeqInt>{5, 6, 7}));
}

TEST_F(ListOpsTest, skip)
{
    EXPECT_THAT(drain(skip(Operands::single(range(1, 5)), 3)), ::testing::ElementsAre(IsIntEq(4), IsIntEq(5)));
    EXPECT_TRUE(drain(skip(Operands::single(range(1, 2)), 5)).empty());
}

TEST_F(ListOpsTest, zipStopsAtShortest)
{
    auto s = zip({Operands::single(intList({1, 2, 3})), Operands::single(infiniteRange(10))});
    EXPECT_FALSE(s.seq()->isLazy());
    auto out = drain(s);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_THAT(out[2], HasValues(std::vector<SeqInt>{3, 12}));
}

TEST_F(ListOpsTest, zipOfInfiniteSourcesIsLazy)
{
    auto s = zip({Operands::single(infiniteRange(0)), Operands::single(infiniteRange(1))});
    EXPECT_TRUE(s.seq()->isLazy());
}

TEST_F(ListOpsTest, sourcesFollowSingleArgumentRule)
{
    auto boxed = box(intList({1, 2, 3}));
    EXPECT_EQ(drain(map(Operands::single(boxed), [](const Value & v) { return v; })).size(), 1u);
    EXPECT_EQ(drain(map(Operands::single(intList({1, 2, 3})), [](const Value & v) { return v; })).size(), 3u);
}

TEST_F(ListOpsTest, generate)
{
    SeqInt n = 0;
    auto s = generate(
        [&]() -> std::optional<Value> {
            if (n == 3)
                return std::nullopt;
            return Value::fromInt(n++);
        },
        false);
    EXPECT_THAT(drain(s), ::testing::ElementsAre(IsIntEq(0), IsIntEq(1), IsIntEq(2)));
}

TEST_F(ListOpsTest, lazyMarksProducerLazy)
{
    auto s = lazy(Operands::single(intList({1, 2})));
    EXPECT_TRUE(s.seq()->isLazy());

    auto a = Array::make();
    a.assign(Operands::single(lazy(Operands::single(intList({1, 2})))));
    EXPECT_TRUE(a.isLazy());
    EXPECT_THAT(a.get(1), IsIntEq(2));
    EXPECT_FALSE(a.list()->existsAt(2));
    EXPECT_FALSE(a.isLazy());
    EXPECT_EQ(a.elems(), 2u);
}

TEST_F(ListOpsTest, fromValues)
{
    EXPECT_THAT(drain(fromValues(ints({7}))), ::testing::ElementsAre(IsIntEq(7)));
}

} // namespace seqrt
