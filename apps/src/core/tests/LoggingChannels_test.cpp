#include "core/LoggingChannels.h"
#include <gtest/gtest.h>

using namespace BjornManager;

TEST(LoggingChannelsTest, ParseLevelStringAcceptsAliases)
{
    EXPECT_EQ(LoggingChannels::parseLevelString("WARNING"), spdlog::level::warn);
    EXPECT_EQ(LoggingChannels::parseLevelString("err"), spdlog::level::err);
    EXPECT_EQ(LoggingChannels::parseLevelString("nonsense"), spdlog::level::info);
}

TEST(LoggingChannelsTest, ConfigureFromStringSetsChannelLevels)
{
    LoggingChannels::get(LogChannel::Session);
    LoggingChannels::configureFromString("*:warn, session:trace");

    EXPECT_EQ(LoggingChannels::get(LogChannel::Session)->level(), spdlog::level::trace);
    EXPECT_EQ(LoggingChannels::get(LogChannel::Discovery)->level(), spdlog::level::warn);

    LoggingChannels::configureFromString("*:info");
}

TEST(LoggingChannelsTest, UnknownChannelNameIsReported)
{
    LoggingChannels::get(LogChannel::Install);
    EXPECT_FALSE(LoggingChannels::setChannelLevel("nosuchchannel", spdlog::level::debug));
    EXPECT_TRUE(LoggingChannels::setChannelLevel("install", spdlog::level::debug));
}
