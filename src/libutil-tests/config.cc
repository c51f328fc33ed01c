#include <gtest/gtest.h>

#include <cstdlib>

#include <nlohmann/json.hpp>

#include "seqrt/util/config.hh"

namespace seqrt {

struct TestConfig : Config
{
    Setting<size_t> workers{this, 4, "max-workers", "Number of workers."};
    Setting<bool> verbose{this, false, "verbose", "Be chatty."};
    Setting<int> offset{this, -1, "offset", "Signed value."};
    Setting<std::string> name{this, "default", "name", "A name."};
};

TEST(Config, defaults)
{
    TestConfig config;
    EXPECT_EQ(config.workers.get(), 4u);
    EXPECT_FALSE(config.verbose.get());
    EXPECT_EQ(config.name.get(), "default");
    EXPECT_FALSE(config.workers.overridden);
}

TEST(Config, setKnownSetting)
{
    TestConfig config;
    EXPECT_TRUE(config.set("max-workers", "16"));
    EXPECT_EQ(config.workers.get(), 16u);
    EXPECT_TRUE(config.workers.overridden);

    EXPECT_TRUE(config.set("verbose", "yes"));
    EXPECT_TRUE(config.verbose.get());

    EXPECT_TRUE(config.set("offset", "-7"));
    EXPECT_EQ(config.offset.get(), -7);
}

TEST(Config, setUnknownSetting)
{
    TestConfig config;
    EXPECT_FALSE(config.set("no-such-setting", "1"));
}

TEST(Config, setInvalidValue)
{
    TestConfig config;
    EXPECT_THROW(config.set("max-workers", "many"), UsageError);
    EXPECT_THROW(config.set("max-workers", "-1"), UsageError);
    EXPECT_THROW(config.set("verbose", "maybe"), UsageError);
    EXPECT_EQ(config.workers.get(), 4u);
}

TEST(Config, applyEnvironment)
{
    TestConfig config;
    setenv("SEQRT_TEST_MAX_WORKERS", "3", 1);
    config.applyEnvironment("SEQRT_TEST");
    unsetenv("SEQRT_TEST_MAX_WORKERS");
    EXPECT_EQ(config.workers.get(), 3u);
    EXPECT_TRUE(config.workers.overridden);
    EXPECT_FALSE(config.verbose.overridden);
}

TEST(Config, applyEnvironmentReportsVariable)
{
    TestConfig config;
    setenv("SEQRT_TEST_VERBOSE", "perhaps", 1);
    try {
        config.applyEnvironment("SEQRT_TEST");
        FAIL() << "expected a UsageError";
    } catch (UsageError & e) {
        EXPECT_NE(std::string(e.what()).find("SEQRT_TEST_VERBOSE"), std::string::npos);
    }
    unsetenv("SEQRT_TEST_VERBOSE");
}

TEST(Config, resetOverridden)
{
    TestConfig config;
    config.set("verbose", "true");
    config.resetOverridden();
    EXPECT_FALSE(config.verbose.overridden);
    EXPECT_TRUE(config.verbose.get());
}

TEST(Config, toJSON)
{
    TestConfig config;
    config.set("max-workers", "2");
    auto json = config.toJSON();
    EXPECT_EQ(json["max-workers"]["value"], 2);
    EXPECT_EQ(json["max-workers"]["defaultValue"], 4);
    EXPECT_EQ(json["name"]["value"], "default");
    EXPECT_EQ(json.size(), 4u);
}

} // namespace seqrt
