#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "seqrt/util/error.hh"
#include "seqrt/util/fmt.hh"

namespace seqrt {

/* ----------------------------------------------------------------------------
 * fmt
 * --------------------------------------------------------------------------*/

TEST(fmt, positional)
{
    EXPECT_EQ(fmt("%1% and %2%", "a", 2), "a and 2");
    EXPECT_EQ(fmt("%s-%d", "x", 3), "x-3");
}

TEST(fmt, singleArgumentIsLiteral)
{
    EXPECT_EQ(fmt("100%"), "100%");
}

TEST(HintFmt, highlightsArguments)
{
    auto hint = HintFmt("value %1%", 42).str();
    EXPECT_NE(hint, "value 42");
    EXPECT_EQ(filterANSIEscapes(hint), "value 42");
}

TEST(HintFmt, literalIsNotInterpolated)
{
    EXPECT_EQ(filterANSIEscapes(HintFmt(std::string("50% off")).str()), "50% off");
}

TEST(filterANSIEscapes, removesColorCodes)
{
    EXPECT_EQ(filterANSIEscapes("\033[35;1mred\033[0m text"), "red text");
}

/* ----------------------------------------------------------------------------
 * BaseError
 * --------------------------------------------------------------------------*/

MakeError(TestError, Error);

TEST(BaseError, whatContainsMessage)
{
    TestError e("failed with %d", 3);
    EXPECT_EQ(std::string(e.what()), "error: failed with 3");
    EXPECT_EQ(filterANSIEscapes(e.message()), "failed with 3");
}

TEST(BaseError, tracesArePrinted)
{
    try {
        try {
            throw TestError("inner failure");
        } catch (Error & e) {
            e.addTrace("while doing %s", "something");
            throw;
        }
    } catch (TestError & e) {
        EXPECT_THAT(std::string(e.what()), ::testing::HasSubstr("inner failure"));
        EXPECT_THAT(std::string(e.what()), ::testing::HasSubstr("while doing something"));
        EXPECT_EQ(e.info().traces.size(), 1u);
    }
}

TEST(BaseError, subclassesAreCaughtAsError)
{
    EXPECT_THROW(throw UsageError("bad usage"), Error);
    EXPECT_THROW(throw TestError("x"), BaseError);
}

} // namespace seqrt
