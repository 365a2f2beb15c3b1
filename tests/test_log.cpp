#include <gtest/gtest.h>

#include "log.hpp"

#include <string>
#include <vector>

using namespace tabmux;

namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().clear_sinks();
        Logger::instance().add_sink([this](const Logger::LogEntry &e) { entries.push_back(e); });
        Logger::instance().set_level(LogLevel::Info);
    }
    void TearDown() override {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(LogLevel::Info);
    }

    std::vector<Logger::LogEntry> entries;
};

}  // namespace

TEST_F(LoggerTest, FiltersBelowLevel) {
    TABMUX_LOG_DEBUG("test", "hidden");
    TABMUX_LOG_INFO("test", "shown");
    TABMUX_LOG_ERROR("test", "also shown");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].message, "shown");
    EXPECT_EQ(entries[1].level, LogLevel::Error);
    EXPECT_EQ(entries[1].category, "test");

    Logger::instance().set_level(LogLevel::Debug);
    TABMUX_LOG_DEBUG("test", "now visible");
    EXPECT_EQ(entries.size(), 3u);
}

TEST_F(LoggerTest, FillsPlaceholdersInOrder) {
    std::string name = "st";
    TABMUX_LOG_INFO("supervisor", "spawned {} pid={} ok={}", name, 42, true);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "spawned st pid=42 ok=true");
}

TEST_F(LoggerTest, ExtraPlaceholdersStay) {
    const char *missing = nullptr;
    TABMUX_LOG_WARN("test", "{} and {} and {}", "one", missing);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "one and (null) and {}");
}

TEST(LogLevels, ParseNames) {
    LogLevel lvl = LogLevel::Info;
    EXPECT_TRUE(Logger::parse_level("DEBUG", lvl));
    EXPECT_EQ(lvl, LogLevel::Debug);
    EXPECT_TRUE(Logger::parse_level("warn", lvl));
    EXPECT_EQ(lvl, LogLevel::Warning);
    EXPECT_FALSE(Logger::parse_level("loud", lvl));
    EXPECT_EQ(lvl, LogLevel::Warning);
    EXPECT_STREQ(Logger::level_name(LogLevel::Critical), "CRITICAL");
}
