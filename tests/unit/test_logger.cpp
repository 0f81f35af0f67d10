#include <gtest/gtest.h>

#include <termdeck/logger.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace termdeck;

class LoggerTest : public ::testing::Test
{
   protected:
    std::shared_ptr<std::vector<Logger::LogEntry>> entries =
        std::make_shared<std::vector<Logger::LogEntry>>();
    Logger::SinkId sink_id = 0;
    LogLevel       saved_level{};

    void SetUp() override
    {
        saved_level = Logger::instance().get_level();
        Logger::instance().set_level(LogLevel::Trace);
        sink_id = Logger::instance().add_sink(sinks::memory_sink(entries));
    }

    void TearDown() override
    {
        Logger::instance().remove_sink(sink_id);
        Logger::instance().set_level(saved_level);
    }
};

TEST_F(LoggerTest, FormatsPlaceholdersInOrder)
{
    TERMDECK_LOG_INFO("test", "panel {} has {} sessions, shared={}", std::string("p1"), 3, true);
    ASSERT_EQ(entries->size(), 1u);
    EXPECT_EQ(entries->back().message, "panel p1 has 3 sessions, shared=true");
    EXPECT_EQ(entries->back().category, "test");
    EXPECT_EQ(entries->back().level, LogLevel::Info);
}

TEST_F(LoggerTest, SubstitutedBracesNotReexpanded)
{
    TERMDECK_LOG_INFO("test", "title {} then {}", "a{}b", "c");
    ASSERT_EQ(entries->size(), 1u);
    EXPECT_EQ(entries->back().message, "title a{}b then c");
}

TEST_F(LoggerTest, ExtraPlaceholdersLeftAlone)
{
    TERMDECK_LOG_INFO("test", "{} and {}", "one");
    ASSERT_EQ(entries->size(), 1u);
    EXPECT_EQ(entries->back().message, "one and {}");
}

TEST_F(LoggerTest, NullCStringPrinted)
{
    const char* none = nullptr;
    TERMDECK_LOG_INFO("test", "value {}", none);
    ASSERT_EQ(entries->size(), 1u);
    EXPECT_EQ(entries->back().message, "value (null)");
}

TEST_F(LoggerTest, BelowMinimumLevelDropped)
{
    Logger::instance().set_level(LogLevel::Warning);
    TERMDECK_LOG_DEBUG("test", "hidden");
    TERMDECK_LOG_INFO("test", "hidden");
    TERMDECK_LOG_ERROR("test", "shown");
    ASSERT_EQ(entries->size(), 1u);
    EXPECT_EQ(entries->back().level, LogLevel::Error);
    EXPECT_FALSE(Logger::instance().is_enabled(LogLevel::Info));
}

TEST_F(LoggerTest, RemovedSinkStopsReceiving)
{
    Logger::instance().remove_sink(sink_id);
    TERMDECK_LOG_INFO("test", "after removal");
    EXPECT_TRUE(entries->empty());
}

TEST(LoggerStatic, LevelNames)
{
    EXPECT_EQ(Logger::level_to_string(LogLevel::Trace), "TRACE");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Warning), "WARN");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Critical), "CRITICAL");
}

TEST(LoggerStatic, TimestampHasMillisecondsAndLocalDate)
{
    using namespace std::chrono;
    const auto tp = system_clock::time_point(seconds(1700000000)) + milliseconds(42);
    const std::string text = Logger::timestamp_to_string(tp);

    // "YYYY-MM-DD HH:MM:SS.mmm"
    ASSERT_EQ(text.size(), 23u);
    EXPECT_EQ(text[4], '-');
    EXPECT_EQ(text[7], '-');
    EXPECT_EQ(text[10], ' ');
    EXPECT_EQ(text[13], ':');
    EXPECT_EQ(text[16], ':');
    EXPECT_EQ(text.substr(19), ".042");
    // 2023-11-14 or 2023-11-15 depending on the local zone.
    EXPECT_EQ(text.substr(0, 8), "2023-11-");
}
