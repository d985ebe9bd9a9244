#include "core/LoggingChannels.h"
#include <gtest/gtest.h>

using namespace StackEvo;

class LoggingChannelsTest : public ::testing::Test {
protected:
    void TearDown() override
    {
        for (const LogChannelInfo& info : kLogChannels) {
            LoggingChannels::setChannelLevel(info.channel, info.defaultLevel);
        }
    }

    static spdlog::level::level_enum levelOf(LogChannel channel)
    {
        return LoggingChannels::get(channel)->level();
    }
};

TEST_F(LoggingChannelsTest, EveryChannelIsRegisteredUnderItsName)
{
    for (const LogChannelInfo& info : kLogChannels) {
        auto logger = LoggingChannels::get(info.channel);
        ASSERT_NE(logger, nullptr);
        EXPECT_EQ(logger->name(), info.name);
    }
}

TEST_F(LoggingChannelsTest, VmChannelStartsQuieterThanTheOthers)
{
    EXPECT_EQ(levelOf(LogChannel::Vm), spdlog::level::warn);
    EXPECT_EQ(levelOf(LogChannel::Evolution), spdlog::level::info);
}

TEST_F(LoggingChannelsTest, ConfigureSetsNamedChannels)
{
    auto result = LoggingChannels::configureFromString("evolution:debug, vm:trace");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(levelOf(LogChannel::Evolution), spdlog::level::debug);
    EXPECT_EQ(levelOf(LogChannel::Vm), spdlog::level::trace);
    EXPECT_EQ(levelOf(LogChannel::Fitness), spdlog::level::info);
}

TEST_F(LoggingChannelsTest, WildcardThenOverrideAppliesInOrder)
{
    auto result = LoggingChannels::configureFromString("*:off,operators:WARN");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(levelOf(LogChannel::Cli), spdlog::level::off);
    EXPECT_EQ(levelOf(LogChannel::Vm), spdlog::level::off);
    EXPECT_EQ(levelOf(LogChannel::Operators), spdlog::level::warn);
}

TEST_F(LoggingChannelsTest, UnknownChannelIsReported)
{
    auto result = LoggingChannels::configureFromString("fitness:debug,network:debug");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("network"), std::string::npos);

    // Entries before the bad one stay applied.
    EXPECT_EQ(levelOf(LogChannel::Fitness), spdlog::level::debug);
}

TEST_F(LoggingChannelsTest, UnknownLevelAndMissingColonAreReported)
{
    EXPECT_TRUE(LoggingChannels::configureFromString("vm:loud").isError());
    EXPECT_TRUE(LoggingChannels::configureFromString("vm").isError());
    EXPECT_EQ(levelOf(LogChannel::Vm), spdlog::level::warn);
}

TEST_F(LoggingChannelsTest, EmptyEntriesAreIgnored)
{
    EXPECT_TRUE(LoggingChannels::configureFromString("").isValue());
    EXPECT_TRUE(LoggingChannels::configureFromString(" , cli:error ,").isValue());
    EXPECT_EQ(levelOf(LogChannel::Cli), spdlog::level::err);
}

TEST_F(LoggingChannelsTest, ParseLevelAcceptsSpdlogNamesAndAliases)
{
    EXPECT_EQ(LoggingChannels::parseLevel("warning"), spdlog::level::warn);
    EXPECT_EQ(LoggingChannels::parseLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(LoggingChannels::parseLevel("err"), spdlog::level::err);
    EXPECT_EQ(LoggingChannels::parseLevel("Critical"), spdlog::level::critical);
    EXPECT_EQ(LoggingChannels::parseLevel("off"), spdlog::level::off);
    EXPECT_FALSE(LoggingChannels::parseLevel("verbose").has_value());
}

TEST_F(LoggingChannelsTest, ChannelFromStringRoundTripsNames)
{
    EXPECT_EQ(LoggingChannels::channelFromString("operators"), LogChannel::Operators);
    EXPECT_FALSE(LoggingChannels::channelFromString("Operators").has_value());
}
