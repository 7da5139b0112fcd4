#include <gtest/gtest.h>
#include <cstdlib>
#include <string>
#include <vector>

#include "demo_config.hpp"
#include "environment.hpp"
#include "logging.hpp"
#include "repr.hpp"

using namespace allusions;

class DemoConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv(ENV_LOG_LEVEL);
        unsetenv(ENV_DEMO_INPUTS);
    }

    void TearDown() override {
        unsetenv(ENV_LOG_LEVEL);
        unsetenv(ENV_DEMO_INPUTS);
    }
};

TEST_F(DemoConfigTest, DefaultsWhenUnset) {
    const auto config = DemoConfig::LoadFromEnv();
    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.ok().unwrap().log_level, LogLevel::Info);
    EXPECT_EQ(config.ok().unwrap().inputs, (std::vector<std::string>{"1", "5", "0", "x"}));
}

TEST_F(DemoConfigTest, ReadsOverrides) {
    setenv(ENV_LOG_LEVEL, "DEBUG", 1);
    setenv(ENV_DEMO_INPUTS, " 4, 2 ,", 1);
    const auto config = DemoConfig::LoadFromEnv();
    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.ok().unwrap().log_level, LogLevel::Debug);
    EXPECT_EQ(config.ok().unwrap().inputs, (std::vector<std::string>{"4", "2"}));
}

TEST_F(DemoConfigTest, RejectsUnknownLogLevel) {
    setenv(ENV_LOG_LEVEL, "loud", 1);
    const auto config = DemoConfig::LoadFromEnv();
    ASSERT_FALSE(config.is_ok());
    EXPECT_EQ(config.err().unwrap(), (ConfigError{ENV_LOG_LEVEL, R"(unknown log level "loud")"}));
}

TEST_F(DemoConfigTest, RejectsEmptyInputList) {
    setenv(ENV_DEMO_INPUTS, " , ", 1);
    const auto config = DemoConfig::LoadFromEnv();
    ASSERT_FALSE(config.is_ok());
    EXPECT_EQ(config.err().unwrap().key, ENV_DEMO_INPUTS);
}

TEST(SplitListTest, TrimsAndDropsEmptyItems) {
    EXPECT_EQ(split_list("1,5,0,x"), (std::vector<std::string>{"1", "5", "0", "x"}));
    EXPECT_EQ(split_list("\t1 ,, 2\t"), (std::vector<std::string>{"1", "2"}));
    EXPECT_EQ(split_list("a;b", ';'), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(split_list("").empty());
    EXPECT_TRUE(split_list(",,").empty());
}
