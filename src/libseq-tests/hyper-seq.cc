#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

#include "seqrt/seq/tests/libseq.hh"
#include "seqrt/seq/construct.hh"
#include "seqrt/seq/hyper-seq.hh"
#include "seqrt/seq/list-ops.hh"
#include "seqrt/seq/settings.hh"

namespace seqrt {

class HyperSeqTest : public LibSeqTest
{
protected:
    ref<Executor> inline_ = make_ref<InlineExecutor>();
    ref<Executor> pool = make_ref<ThreadPool>(4);

    static std::vector<SeqInt> intsOf(const Value & v)
    {
        std::vector<SeqInt> res;
        for (auto & e : v.decont().list()->reifiedElems())
            res.push_back(e.decont().integer());
        return res;
    }

    static std::vector<SeqInt> iota(SeqInt from, SeqInt to)
    {
        std::vector<SeqInt> res;
        for (auto n = from; n <= to; ++n)
            res.push_back(n);
        return res;
    }

    static Value twice(const Value & v)
    {
        return Value::fromInt(v.integer() * 2);
    }

    static const ref<HyperSeq> & hs(const Value & v)
    {
        return v.hyperSeq();
    }
};

// =============================================================================
// Ordered collection
// =============================================================================

TEST_F(HyperSeqTest, toArrayInlineKeepsOrder)
{
    auto h = hyper(Operands::single(range(1, 10)), HyperConfig{.batch = 3, .degree = 2}, inline_);
    auto a = hs(h)->map(twice)->toArray();
    EXPECT_THAT(a, IsArray());
    EXPECT_THAT(a, HasValues(std::vector<SeqInt>{2, 4, 6, 8, 10, 12, 14, 16, 18, 20}));
}

TEST_F(HyperSeqTest, toArrayOnThreadPoolKeepsLogicalOrder)
{
    auto h = hyper(Operands::single(range(1, 200)), HyperConfig{.batch = 7, .degree = 4}, pool);
    auto a = hs(h)->map([](const Value & v) {
        // Later batches finish first.
        std::this_thread::sleep_for(std::chrono::microseconds(200 - v.integer()));
        return v;
    })->toArray();
    EXPECT_EQ(intsOf(a), iota(1, 200));
}

TEST_F(HyperSeqTest, raceToArrayStillKeepsLogicalOrder)
{
    auto h = race(Operands::single(range(1, 50)), HyperConfig{.batch = 4, .degree = 4}, pool);
    EXPECT_EQ(intsOf(hs(h)->toArray()), iota(1, 50));
}

TEST_F(HyperSeqTest, hyperForEachDeliversLogicalOrder)
{
    auto h = hyper(Operands::single(range(1, 100)), HyperConfig{.batch = 5, .degree = 4}, pool);
    std::vector<SeqInt> seen;
    hs(h)->map(twice)->forEach([&](const Value & v) { seen.push_back(v.integer() / 2); });
    EXPECT_EQ(seen, iota(1, 100));
}

TEST_F(HyperSeqTest, raceForEachProducesEveryElementOnce)
{
    auto h = race(Operands::single(range(1, 100)), HyperConfig{.batch = 3, .degree = 4}, pool);
    std::atomic<size_t> calls{0};
    std::vector<SeqInt> seen;
    hs(h)
        ->map([&](const Value & v) {
            calls++;
            return v;
        })
        ->forEach([&](const Value & v) { seen.push_back(v.integer()); });
    EXPECT_EQ(calls.load(), 100u);
    std::sort(seen.begin(), seen.end());
    EXPECT_EQ(seen, iota(1, 100));
}

TEST_F(HyperSeqTest, grepAndSlips)
{
    auto h = hyper(Operands::single(range(1, 10)), HyperConfig{.batch = 2, .degree = 3}, pool);
    auto a = hs(h)
                 ->grep([](const Value & v) { return v.integer() % 2 == 1; })
                 ->map([](const Value & v) { return toSlip(makeList({v, v})); })
                 ->toArray();
    EXPECT_EQ(intsOf(a), (std::vector<SeqInt>{1, 1, 3, 3, 5, 5, 7, 7, 9, 9}));
}

TEST_F(HyperSeqTest, sourceValuesAreDeconted)
{
    auto source = makeList({box(mkInt(1)), box(mkInt(2))});
    auto h = hyper(Operands::single(source), HyperConfig{}, inline_);
    hs(h)->forEach([](const Value & v) { EXPECT_FALSE(v.isContainer()); });
}

// =============================================================================
// State machine
// =============================================================================

TEST_F(HyperSeqTest, mapConsumesTheOriginal)
{
    auto h = hyper(Operands::single(range(1, 3)), HyperConfig{}, inline_);
    auto mapped = hs(h)->map(twice);
    EXPECT_EQ(hs(h)->getState(), Seq::State::Consumed);
    EXPECT_EQ(mapped->getState(), Seq::State::Fresh);
    EXPECT_THROW(hs(h)->map(twice), AlreadyConsumed);
    EXPECT_THROW(hs(h)->toArray(), AlreadyConsumed);
}

TEST_F(HyperSeqTest, cacheIsIdempotent)
{
    auto h = hyper(Operands::single(range(1, 3)), HyperConfig{}, pool);
    auto first = hs(h)->cache();
    auto second = hs(h)->toCachedList();
    EXPECT_EQ(first, second);
    EXPECT_EQ(intsOf(first->toValue()), iota(1, 3));
    EXPECT_THROW(hs(h)->pull(), AlreadyConsumed);
    EXPECT_THROW(hs(h)->toArray(), AlreadyConsumed);
}

TEST_F(HyperSeqTest, pullFollowsSeqStates)
{
    auto h = hyper(Operands::single(range(1, 2)), HyperConfig{.batch = 1, .degree = 1}, inline_);
    EXPECT_THAT(*hs(h)->pull(), IsIntEq(1));
    EXPECT_EQ(hs(h)->getState(), Seq::State::Consuming);
    EXPECT_THROW(hs(h)->cache(), AlreadyConsumed);
    EXPECT_THAT(*hs(h)->pull(), IsIntEq(2));
    EXPECT_FALSE(hs(h)->pull().has_value());
    EXPECT_EQ(hs(h)->getState(), Seq::State::Consumed);
    EXPECT_THROW(hs(h)->pull(), AlreadyConsumed);
}

TEST_F(HyperSeqTest, serialIsASeq)
{
    auto h = hyper(Operands::single(range(1, 4)), HyperConfig{.batch = 2, .degree = 2}, pool);
    auto s = hs(h)->map(twice)->serial();
    EXPECT_THAT(s->toValue(), IsSeq());
    EXPECT_EQ(intsOf(s->cache()->toValue()), (std::vector<SeqInt>{2, 4, 6, 8}));
}

// =============================================================================
// Lazy sources
// =============================================================================

TEST_F(HyperSeqTest, toArrayOfLazySourceFails)
{
    auto h = hyper(Operands::single(infiniteRange(0)), HyperConfig{}, inline_);
    EXPECT_TRUE(hs(h)->isLazy());
    EXPECT_THROW(hs(h)->toArray(), InfiniteLength);
    EXPECT_EQ(hs(h)->getState(), Seq::State::Fresh);
}

TEST_F(HyperSeqTest, lazySourceCanBePulled)
{
    auto h = hyper(Operands::single(infiniteRange(0)), HyperConfig{.batch = 4, .degree = 2}, pool);
    auto mapped = hs(h)->map(twice);
    for (SeqInt n = 0; n < 20; ++n)
        EXPECT_THAT(*mapped->pull(), IsIntEq(n * 2));
}

// =============================================================================
// Failures and cancellation
// =============================================================================

TEST_F(HyperSeqTest, failingUnitFailsMaterialization)
{
    auto h = hyper(Operands::single(range(1, 40)), HyperConfig{.batch = 4, .degree = 4}, pool);
    auto mapped = hs(h)->map([](const Value & v) -> Value {
        if (v.integer() == 10)
            throw TypeError("cannot process %d", v.integer());
        return v;
    });
    try {
        mapped->toArray();
        FAIL() << "expected a WorkUnitFailure";
    } catch (WorkUnitFailure & e) {
        EXPECT_EQ(e.getFailedUnits(), 1u);
        EXPECT_EQ(e.getMessages().size(), 1u);
        EXPECT_THAT(e.getMessages()[0], ::testing::HasSubstr("cannot process 10"));
        EXPECT_THROW(e.rethrowFirst(), TypeError);
    }
    EXPECT_EQ(seqStats.nrHyperFailures.load(), 1u);
}

TEST_F(HyperSeqTest, failureStopsDispatch)
{
    std::atomic<size_t> processed{0};
    auto h = hyper(Operands::single(range(1, 100)), HyperConfig{.batch = 1, .degree = 1}, inline_);
    auto mapped = hs(h)->map([&](const Value & v) -> Value {
        processed++;
        if (v.integer() == 3)
            throw TypeError("boom");
        return v;
    });
    EXPECT_THROW(mapped->toArray(), WorkUnitFailure);
    EXPECT_EQ(processed.load(), 3u);
}

TEST_F(HyperSeqTest, cancelBeforeMaterializationFails)
{
    auto h = hyper(Operands::single(range(1, 10)), HyperConfig{}, pool);
    hs(h)->cancel();
    EXPECT_TRUE(hs(h)->isCancelled());
    EXPECT_THROW(hs(h)->toArray(), Cancelled);
    EXPECT_EQ(seqStats.nrHyperCancellations.load(), 1u);
}

TEST_F(HyperSeqTest, cancelDuringForEachStopsQuietly)
{
    auto h = hyper(Operands::single(infiniteRange(0)), HyperConfig{.batch = 2, .degree = 2}, pool);
    auto seq = hs(h);
    std::vector<SeqInt> seen;
    seq->forEach([&](const Value & v) {
        seen.push_back(v.integer());
        if (seen.size() == 5)
            seq->cancel();
    });
    // The window in flight when cancelling is delivered in full.
    EXPECT_GE(seen.size(), 5u);
    EXPECT_LE(seen.size(), 8u);
    EXPECT_EQ(seen, iota(0, (SeqInt) seen.size() - 1));
}

TEST_F(HyperSeqTest, cancelledPullFails)
{
    auto h = hyper(Operands::single(range(1, 10)), HyperConfig{}, pool);
    hs(h)->cancel();
    EXPECT_THROW(hs(h)->pull(), Cancelled);
    EXPECT_EQ(hs(h)->getState(), Seq::State::Consumed);
    EXPECT_THROW(hs(h)->pull(), AlreadyConsumed);
}

TEST_F(HyperSeqTest, cancelledSourceFailsArrayAssignment)
{
    auto h = hyper(Operands::single(range(1, 10)), HyperConfig{}, pool);
    hs(h)->cancel();
    EXPECT_THROW(makeArray(Operands::single(h)), Cancelled);
}

TEST_F(HyperSeqTest, cancelMidwayFailsSerialCache)
{
    std::shared_ptr<HyperSeq> mapped;
    auto h = hyper(Operands::single(range(0, 9)), HyperConfig{.batch = 1, .degree = 1}, inline_);
    mapped = hs(h)
                 ->map([&](const Value & v) {
                     if (v.integer() == 2)
                         mapped->cancel();
                     return v;
                 })
                 .get_ptr();
    auto s = mapped->serial();
    EXPECT_THROW(s->cache(), Cancelled);
}

TEST_F(HyperSeqTest, cancelledPullsAfterReleasedResultsFail)
{
    auto h = hyper(Operands::single(range(1, 10)), HyperConfig{.batch = 2, .degree = 1}, inline_);
    EXPECT_THAT(*hs(h)->pull(), IsIntEq(1));
    hs(h)->cancel();
    // The batch released before cancelling is still delivered.
    EXPECT_THAT(*hs(h)->pull(), IsIntEq(2));
    EXPECT_THROW(hs(h)->pull(), Cancelled);
}

// =============================================================================
// Nesting
// =============================================================================

TEST_F(HyperSeqTest, nestedOnSingleWorkerPoolCompletes)
{
    ref<Executor> single = make_ref<ThreadPool>(1);
    auto h = hyper(Operands::single(range(1, 4)), HyperConfig{.batch = 1, .degree = 2}, single);
    auto a = hs(h)
                 ->map([single](const Value & v) {
                     auto inner = hyper(
                         Operands::single(range(1, v.integer())), HyperConfig{.batch = 1, .degree = 2}, single);
                     SeqInt sum = 0;
                     for (auto n : intsOf(hs(inner)->toArray()))
                         sum += n;
                     return Value::fromInt(sum);
                 })
                 ->toArray();
    EXPECT_EQ(intsOf(a), (std::vector<SeqInt>{1, 3, 6, 10}));
}

TEST_F(HyperSeqTest, unitsAreCounted)
{
    auto h = hyper(Operands::single(range(1, 10)), HyperConfig{.batch = 3, .degree = 2}, inline_);
    hs(h)->toArray();
    EXPECT_EQ(seqStats.nrHyperUnits.load(), 4u);
}

TEST_F(HyperSeqTest, configFromSettings)
{
    seqSettings.hyperBatch = 16;
    seqSettings.hyperDegree = 0;
    auto config = HyperConfig::fromSettings();
    EXPECT_EQ(config.batch, 16u);
    EXPECT_EQ(config.degree, 1u);
    seqSettings.hyperBatch = seqSettings.hyperBatch.getDefault();
    seqSettings.hyperDegree = seqSettings.hyperDegree.getDefault();
}

} // namespace seqrt
