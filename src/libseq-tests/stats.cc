#include <cstdlib>
#include <sstream>

#include <nlohmann/json.hpp>

#include "seqrt/seq/tests/libseq.hh"
#include "seqrt/seq/flatten.hh"
#include "seqrt/seq/list-ops.hh"
#include "seqrt/seq/settings.hh"
#include "seqrt/util/util.hh"

namespace seqrt {

class StatsTest : public LibSeqTest
{};

TEST_F(StatsTest, countersAreReportedAsJSON)
{
    intArray({1, 2, 3});
    range(1, 2).seq()->cache();
    flatten(intArray({}));

    auto json = statisticsToJSON();
    EXPECT_EQ(json["lists"]["arrays"], 2);
    EXPECT_EQ(json["lists"]["containers"], 3);
    EXPECT_EQ(json["sequences"]["created"], 2);
    EXPECT_EQ(json["sequences"]["cached"], 1);
    EXPECT_EQ(json["flatten"]["calls"], 1);
    EXPECT_EQ(json["flatten"]["arrayFastPaths"], 1);
}

TEST_F(StatsTest, reifiedSizesHistogram)
{
    intList({1, 2, 3});
    intList({4, 5, 6});
    intArray({1, 2});
    auto json = statisticsToJSON();
    EXPECT_EQ(json["lists"]["reifiedSizes"]["List"]["3"], 2);
    EXPECT_EQ(json["lists"]["reifiedSizes"]["Array"]["2"], 1);
    EXPECT_FALSE(json["lists"]["reifiedSizes"].contains("Slip"));
}

TEST_F(StatsTest, lazyListIsRecordedOnceFullyReified)
{
    auto list = List::fromIterator(ListKind::List, iterateValue(lazy(Operands::single(range(1, 4)))));
    EXPECT_FALSE(statisticsToJSON()["lists"]["reifiedSizes"].contains("List"));
    list->elems();
    EXPECT_EQ(statisticsToJSON()["lists"]["reifiedSizes"]["List"]["4"], 1);
}

TEST_F(StatsTest, disabledCountersStayZero)
{
    Counter::enabled = false;
    intList({1});
    EXPECT_EQ(seqStats.nrLists.load(), 0u);
}

TEST_F(StatsTest, resetStatistics)
{
    intList({1});
    resetStatistics();
    EXPECT_EQ(seqStats.nrLists.load(), 0u);
    EXPECT_EQ(statisticsToJSON()["lists"]["reifiedSizes"].size(), 0u);
}

TEST_F(StatsTest, printStatistics)
{
    std::ostringstream str;
    printStatistics(str);
    auto parsed = nlohmann::json::parse(str.str());
    EXPECT_TRUE(parsed.contains("hyper"));
}

TEST_F(StatsTest, initFromEnvironment)
{
    setenv("SEQRT_SHOW_STATS", "false", 1);
    setenv("SEQRT_HYPER_BATCH", "8", 1);
    initSeqRuntime();
    EXPECT_FALSE(Counter::enabled);
    EXPECT_EQ(seqSettings.hyperBatch.get(), 8u);
    EXPECT_TRUE(seqSettings.hyperBatch.overridden);

    unsetenv("SEQRT_SHOW_STATS");
    unsetenv("SEQRT_HYPER_BATCH");
    seqSettings.hyperBatch = seqSettings.hyperBatch.getDefault();
    seqSettings.resetOverridden();
}

TEST_F(StatsTest, badEnvironmentValue)
{
    setenv("SEQRT_HYPER_DEGREE", "many", 1);
    EXPECT_THROW(initSeqRuntime(), UsageError);
    unsetenv("SEQRT_HYPER_DEGREE");
}

TEST_F(StatsTest, settingsAsJSON)
{
    auto json = seqSettings.toJSON();
    EXPECT_EQ(json["hyper-batch"]["defaultValue"], 64);
    EXPECT_EQ(json["hyper-degree"]["defaultValue"], 4);
    EXPECT_EQ(json["show-stats"]["value"], false);
}

} // namespace seqrt
