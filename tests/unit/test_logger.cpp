#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <stagehand/actor.hpp>
#include <stagehand/error.hpp>
#include <stagehand/logger.hpp>
#include <string>
#include <vector>

using namespace stagehand;

class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        entries_ = std::make_shared<std::vector<Logger::LogEntry>>();
        Logger::instance().clear_sinks();
        Logger::instance().add_sink(sinks::memory_sink(entries_));
        Logger::instance().set_level(LogLevel::Trace);
    }

    void TearDown() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(LogLevel::Info);
    }

    std::shared_ptr<std::vector<Logger::LogEntry>> entries_;
};

TEST_F(LoggerTest, FormatsPlaceholders)
{
    STAGEHAND_LOG_INFO("test", "{} + {} = {}", 1, 2, 3);

    ASSERT_EQ(entries_->size(), 1u);
    EXPECT_EQ(entries_->front().message, "1 + 2 = 3");
    EXPECT_EQ(entries_->front().category, "test");
    EXPECT_EQ(entries_->front().level, LogLevel::Info);
}

TEST_F(LoggerTest, PlaceholderInArgumentIsNotExpanded)
{
    STAGEHAND_LOG_INFO("test", "{} and {}", std::string("{}"), true);

    ASSERT_EQ(entries_->size(), 1u);
    EXPECT_EQ(entries_->front().message, "{} and true");
}

TEST_F(LoggerTest, LevelFilters)
{
    Logger::instance().set_level(LogLevel::Warning);
    STAGEHAND_LOG_DEBUG("test", "hidden");
    STAGEHAND_LOG_INFO("test", "hidden");
    STAGEHAND_LOG_WARN("test", "shown");
    STAGEHAND_LOG_ERROR("test", "shown");
    STAGEHAND_LOG_CRITICAL("test", "shown");

    EXPECT_EQ(entries_->size(), 3u);
    EXPECT_FALSE(Logger::instance().is_enabled(LogLevel::Info));
    EXPECT_TRUE(Logger::instance().is_enabled(LogLevel::Critical));
}

TEST_F(LoggerTest, FileSinkWritesEachEntry)
{
    const std::string path = ::testing::TempDir() + "stagehand_file_sink.log";
    std::remove(path.c_str());

    Logger::instance().add_sink(sinks::file_sink(path));
    STAGEHAND_LOG_INFO("scene", "frame {}", 7);

    // Readable without clearing the sink: every entry is flushed.
    std::ifstream in(path);
    std::string   line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_NE(line.find("INFO [scene] frame 7"), std::string::npos);
    EXPECT_FALSE(std::getline(in, line));

    Logger::instance().clear_sinks();
    std::remove(path.c_str());
}

TEST_F(LoggerTest, LevelNames)
{
    EXPECT_EQ(Logger::level_to_string(LogLevel::Trace), "TRACE");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Warning), "WARN");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Critical), "CRITICAL");
}

TEST_F(LoggerTest, RejectedActionIsLogged)
{
    Actor actor;
    EXPECT_THROW(actor.act(ActionKind::Stop, -2.0f), InvalidDurationError);

    ASSERT_FALSE(entries_->empty());
    const auto& last = entries_->back();
    EXPECT_EQ(last.level, LogLevel::Warning);
    EXPECT_EQ(last.category, "timeline");
}
