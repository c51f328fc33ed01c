#include "seqrt/seq/tests/libseq.hh"
#include "seqrt/seq/hyper-seq.hh"
#include "seqrt/seq/list-ops.hh"

namespace seqrt {

class BinderTest : public LibSeqTest
{};

// =============================================================================
// Single argument rule
// =============================================================================

TEST_F(BinderTest, singleContainerIsOneArgument)
{
    auto ops = Operands::single(box(intList({1, 2, 3})));
    EXPECT_EQ(classifyArguments(ops), ArgumentRule::Single);
    EXPECT_EQ(effectiveArgumentCount(ops), 1u);
}

TEST_F(BinderTest, singleBareListIsItsElements)
{
    auto ops = Operands::single(intList({1, 2, 3}));
    EXPECT_EQ(classifyArguments(ops), ArgumentRule::Elements);
    EXPECT_EQ(effectiveArgumentCount(ops), 3u);
}

TEST_F(BinderTest, singleBareArrayIsItsElements)
{
    EXPECT_EQ(effectiveArgumentCount(Operands::single(intArray({1, 2}))), 2u);
}

TEST_F(BinderTest, singleScalarIsOneArgument)
{
    auto ops = Operands::single(mkInt(5));
    EXPECT_EQ(classifyArguments(ops), ArgumentRule::Single);
    EXPECT_EQ(effectiveArgumentCount(ops), 1u);
}

TEST_F(BinderTest, commaListCountsOperands)
{
    Operands ops{intList({1, 2, 3}), intList({4}), box(intList({5, 6}))};
    EXPECT_EQ(classifyArguments(ops), ArgumentRule::CommaList);
    EXPECT_EQ(effectiveArgumentCount(ops), 3u);
}

TEST_F(BinderTest, trailingCommaKeepsOneOperand)
{
    // `(1, 2, 3),`
    Operands ops{intList({1, 2, 3})};
    EXPECT_EQ(effectiveArgumentCount(ops), 1u);
}

TEST_F(BinderTest, commaListExplodesSlips)
{
    Operands ops{mkInt(1), toSlip(intList({2, 3})), mkInt(4)};
    auto args = effectiveArguments(ops);
    ASSERT_EQ(args.size(), 4u);
    EXPECT_THAT(args[1], IsIntEq(2));
    EXPECT_THAT(args[2], IsIntEq(3));
}

TEST_F(BinderTest, boxedSlipIsNotExploded)
{
    Operands ops{mkInt(1), box(toSlip(intList({2, 3})))};
    EXPECT_EQ(effectiveArgumentCount(ops), 2u);
}

TEST_F(BinderTest, emptySlipContributesNothing)
{
    Operands ops{mkInt(1), emptySlip(), mkInt(2)};
    EXPECT_EQ(effectiveArgumentCount(ops), 2u);
}

TEST_F(BinderTest, singleSeqIsConsumed)
{
    auto seq = range(1, 4);
    EXPECT_EQ(effectiveArgumentCount(Operands::single(seq)), 4u);
    EXPECT_EQ(seq.seq()->getState(), Seq::State::Consumed);
    EXPECT_THROW(effectiveArgumentCount(Operands::single(seq)), AlreadyConsumed);
}

TEST_F(BinderTest, lazySourceHasNoCount)
{
    EXPECT_THROW(effectiveArgumentCount(Operands::single(infiniteRange(0))), InfiniteLength);
}

TEST_F(BinderTest, seqOperandOfCommaListIsOneArgument)
{
    auto seq = range(1, 2);
    auto it = iterationTarget(Operands{seq});
    auto v = it->pull();
    ASSERT_TRUE(v.has_value());
    EXPECT_THAT(*v, IsSeq());
    EXPECT_FALSE(it->pull().has_value());
    EXPECT_FALSE(it->pull().has_value());
}

// =============================================================================
// Binding to Array parameters
// =============================================================================

TEST_F(BinderTest, positionalsBindAsThemselves)
{
    auto l = intList({1, 2});
    auto a = intArray({1, 2});
    EXPECT_TRUE(bindToArrayParam(l).sameObject(l));
    EXPECT_TRUE(bindToArrayParam(a).sameObject(a));
    EXPECT_TRUE(bindToArrayParam(box(a)).sameObject(a));
}

TEST_F(BinderTest, seqDoesNotBind)
{
    auto seq = range(1, 3);
    EXPECT_THROW(bindToArrayParam(seq), NotPositional);
    EXPECT_EQ(seq.seq()->getState(), Seq::State::Fresh);
}

TEST_F(BinderTest, seqBindsCachedListWithFallback)
{
    auto seq = range(1, 3);
    auto bound = bindToArrayParam(seq, {.context = BindContext::Parameter, .cacheFallback = true});
    EXPECT_THAT(bound, HasValues(std::vector<SeqInt>{1, 2, 3}));
    EXPECT_EQ(seq.seq()->getState(), Seq::State::Cached);

    auto again = bindToArrayParam(seq, {.context = BindContext::Parameter, .cacheFallback = true});
    EXPECT_TRUE(again.sameObject(bound));
}

TEST_F(BinderTest, noFallbackForVariables)
{
    auto seq = range(1, 3);
    EXPECT_THROW(
        bindToArrayParam(seq, {.context = BindContext::Variable, .cacheFallback = true}), NotPositional);
}

TEST_F(BinderTest, hyperSeqBindsWithFallback)
{
    auto h = hyper(Operands::single(range(1, 5)), HyperConfig{.batch = 2, .degree = 2}, make_ref<InlineExecutor>());
    EXPECT_THROW(bindToArrayParam(h), NotPositional);
    auto bound = bindToArrayParam(h, {.cacheFallback = true});
    EXPECT_THAT(bound, HasValues(std::vector<SeqInt>{1, 2, 3, 4, 5}));
}

TEST_F(BinderTest, scalarsDoNotBind)
{
    EXPECT_THROW(bindToArrayParam(mkInt(1)), NotPositional);
    EXPECT_THROW(bindToArrayParam(box(mkInt(1)), {.cacheFallback = true}), NotPositional);
}

} // namespace seqrt
