// QUORUM - Util Module Tests
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include <gtest/gtest.h>
#include <quorum/util/logging.h>
#include <quorum/util/time.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace quorum;
using namespace quorum::util;

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Trace);
        Logger::Instance().EnableAllCategories();
        sink_ = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { entries_.push_back(entry); });
        Logger::Instance().AddSink(sink_);
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
        Logger::Instance().EnableAllCategories();
    }

    std::shared_ptr<CallbackSink> sink_;
    std::vector<LogEntry> entries_;
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Off), "OFF");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("WARNING"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("none"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("bogus"), LogLevel::Info);
}

TEST_F(LoggingTest, StreamMacroReachesSink) {
    LOG_INFO(LogCategory::GOVERNANCE) << "round " << 3 << " opened";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].category, "governance");
    EXPECT_EQ(entries_[0].message, "round 3 opened");
}

TEST_F(LoggingTest, LevelFiltering) {
    Logger::Instance().SetLevel(LogLevel::Warn);
    LOG_DEBUG(LogCategory::LEDGER) << "hidden";
    LOG_WARN(LogCategory::LEDGER) << "shown";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "shown");
    EXPECT_FALSE(Logger::Instance().WillLog(LogLevel::Info, LogCategory::LEDGER));
}

TEST_F(LoggingTest, DisabledLevelSkipsArgumentEvaluation) {
    Logger::Instance().SetLevel(LogLevel::Error);
    int evaluated = 0;
    auto touch = [&evaluated]() { return ++evaluated; };
    LOG_DEBUG(LogCategory::DEFAULT) << touch();
    EXPECT_EQ(evaluated, 0);
}

TEST_F(LoggingTest, CategoryFiltering) {
    Logger::Instance().EnableCategory(LogCategory::DB);
    LOG_INFO(LogCategory::DB) << "db";
    LOG_INFO(LogCategory::TOKEN) << "token";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].category, "db");
    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled(LogCategory::DB));
    EXPECT_FALSE(Logger::Instance().IsCategoryEnabled(LogCategory::TOKEN));
}

TEST_F(LoggingTest, FormattedLogging) {
    LogInfoF(LogCategory::CLI, "%d merchants, %s", 2, "ok");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "2 merchants, ok");
}

TEST_F(LoggingTest, SinkLevelAppliesPerSink) {
    sink_->SetLevel(LogLevel::Error);
    LOG_WARN(LogCategory::DEFAULT) << "dropped by sink";
    EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggingTest, AddRemoveSink) {
    auto other = std::make_shared<CallbackSink>([](const LogEntry&) {});
    Logger::Instance().AddSink(other);
    EXPECT_EQ(Logger::Instance().SinkCount(), 2u);
    Logger::Instance().RemoveSink(other);
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
}

TEST_F(LoggingTest, InitLoggingWritesFile) {
    std::string path = ::testing::TempDir() + "quorum_logging_test.log";
    std::remove(path.c_str());

    ASSERT_TRUE(InitLogging(LogLevel::Debug, false, path));
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
    LOG_INFO(LogCategory::LEDGER) << "merchant added";
    Logger::Instance().Flush();
    Logger::Instance().ClearSinks();

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("merchant added"), std::string::npos);
    EXPECT_NE(content.str().find("[ledger]"), std::string::npos);
    std::remove(path.c_str());
}

TEST_F(LoggingTest, InitLoggingReportsBadPath) {
    EXPECT_FALSE(InitLogging(LogLevel::Info, false, "/nonexistent-dir/quorum.log"));
}

// ============================================================================
// Time Tests
// ============================================================================

class TimeTest : public ::testing::Test {
protected:
    void TearDown() override {
        DisableMockTime();
    }
};

TEST_F(TimeTest, GetTimeIsPlausible) {
    int64_t now = GetTime();
    EXPECT_GT(now, 1600000000);
}

TEST_F(TimeTest, MockTime) {
    EXPECT_FALSE(IsMockTimeEnabled());
    SetMockTime(1000);
    EXPECT_TRUE(IsMockTimeEnabled());
    EXPECT_EQ(GetTime(), 1000);

    AdvanceMockTime(604800);
    EXPECT_EQ(GetTime(), 605800);
    EXPECT_EQ(GetMockTime(), 605800);

    DisableMockTime();
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_GT(GetTime(), 1600000000);
}

TEST_F(TimeTest, EnableMockTimeFreezesClock) {
    EnableMockTime();
    int64_t frozen = GetTime();
    EXPECT_GT(frozen, 1600000000);
    SetMockTime(frozen + 10);
    // Enabling again keeps the current mock value
    EnableMockTime();
    EXPECT_EQ(GetTime(), frozen + 10);
}

TEST_F(TimeTest, ScopedMockTime) {
    {
        ScopedMockTime scoped(42);
        EXPECT_EQ(GetTime(), 42);
    }
    EXPECT_FALSE(IsMockTimeEnabled());
}

TEST_F(TimeTest, UnixTimeConversion) {
    EXPECT_EQ(ToUnixTime(FromUnixTime(1700000000)), 1700000000);
}

TEST_F(TimeTest, FormatISO8601) {
    EXPECT_EQ(FormatISO8601(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(FormatISO8601(1700000000), "2023-11-14T22:13:20Z");
}

TEST_F(TimeTest, FormatDuration) {
    EXPECT_EQ(FormatDuration(0), "0s");
    EXPECT_EQ(FormatDuration(59), "59s");
    EXPECT_EQ(FormatDuration(SECONDS_PER_HOUR + 5), "1h 5s");
    EXPECT_EQ(FormatDuration(SECONDS_PER_WEEK - 1), "6d 23h 59m 59s");
    EXPECT_EQ(FormatDuration(-60), "-1m");
}
