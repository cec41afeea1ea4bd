#include "core/LoggingChannels.h"

#include <gtest/gtest.h>
#include <spdlog/sinks/ringbuffer_sink.h>

using namespace KnapEvo;

TEST(LoggingChannelsTest, ParseLevelStringIgnoresCase)
{
    EXPECT_EQ(LoggingChannels::parseLevelString("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(LoggingChannels::parseLevelString("Warning"), spdlog::level::warn);
    EXPECT_EQ(LoggingChannels::parseLevelString("off"), spdlog::level::off);
}

TEST(LoggingChannelsTest, NonAsciiLevelFallsBackToInfo)
{
    EXPECT_EQ(LoggingChannels::parseLevelString("d\xC3\xA9" "bug"), spdlog::level::info);
    EXPECT_EQ(LoggingChannels::parseLevelString("\xFF\x80"), spdlog::level::info);
}

TEST(LoggingChannelsTest, ConfigureFromStringSetsChannelLevel)
{
    auto logger = LoggingChannels::get(LogChannel::Instance);
    const auto previousLevel = logger->level();

    LoggingChannels::configureFromString("instance:TRACE");
    EXPECT_EQ(logger->level(), spdlog::level::trace);

    logger->set_level(previousLevel);
}

TEST(LoggingChannelsTest, TraceMacrosAreCompiledIn)
{
    auto logger = LoggingChannels::get(LogChannel::Engine);
    auto capture = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(8);
    capture->set_pattern("%v");
    const auto previousLevel = logger->level();
    logger->sinks().push_back(capture);
    logger->set_level(spdlog::level::trace);

    LOG_TRACE(Engine, "trace line {}", 1);

    logger->sinks().pop_back();
    logger->set_level(previousLevel);

    const auto lines = capture->last_formatted();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("trace line 1"), std::string::npos);
}
