#include <gtest/gtest.h>

#include <sstream>
#include <vector>

#include "seqrt/util/logging.hh"

namespace seqrt {

class CaptureLogger : public Logger
{
public:
    std::vector<std::pair<Verbosity, std::string>> lines;

    void log(Verbosity lvl, std::string_view s) override
    {
        lines.emplace_back(lvl, std::string(s));
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream str;
        showErrorInfo(str, ei, true);
        log(ei.level, str.str());
    }
};

class LoggingTest : public ::testing::Test
{
protected:
    CaptureLogger * capture = nullptr;
    std::unique_ptr<Logger> saved;
    Verbosity savedVerbosity = lvlInfo;

    void SetUp() override
    {
        auto l = std::make_unique<CaptureLogger>();
        capture = l.get();
        saved = std::move(logger);
        logger = std::move(l);
        savedVerbosity = verbosity;
    }

    void TearDown() override
    {
        logger = std::move(saved);
        verbosity = savedVerbosity;
    }
};

TEST_F(LoggingTest, messagesAboveVerbosityAreDropped)
{
    verbosity = lvlInfo;
    printInfo("shown %d", 1);
    debug("hidden %d", 2);
    ASSERT_EQ(capture->lines.size(), 1u);
    EXPECT_EQ(capture->lines[0].first, lvlInfo);
    EXPECT_EQ(capture->lines[0].second, "shown 1");
}

TEST_F(LoggingTest, debugIsShownAtDebugLevel)
{
    verbosity = lvlDebug;
    debug("visible");
    vomit("still hidden");
    ASSERT_EQ(capture->lines.size(), 1u);
    EXPECT_EQ(capture->lines[0].first, lvlDebug);
}

TEST_F(LoggingTest, argumentsAreNotEvaluatedWhenDropped)
{
    verbosity = lvlError;
    int evaluated = 0;
    auto count = [&]() { return ++evaluated; };
    debug("%d", count());
    EXPECT_EQ(evaluated, 0);
}

TEST_F(LoggingTest, warnIsPrefixed)
{
    warn("disk %s is full", "sda");
    ASSERT_EQ(capture->lines.size(), 1u);
    EXPECT_EQ(capture->lines[0].first, lvlWarn);
    EXPECT_EQ(filterANSIEscapes(capture->lines[0].second), "warning: disk sda is full");
}

TEST_F(LoggingTest, logErrorInfo)
{
    Error e("something broke");
    logError(e.info());
    ASSERT_EQ(capture->lines.size(), 1u);
    EXPECT_EQ(capture->lines[0].second, "error: something broke");
}

} // namespace seqrt
