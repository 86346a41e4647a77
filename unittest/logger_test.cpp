#include <gtest/gtest.h>
#include "common/logger.hpp"
#include "test_helpers.hpp"
#include <chrono>
#include <ctime>

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logPath_ = (tempDir_.path() / "logs" / "session.log").string();
    }

    void TearDown() override {
        Logger::shutdown();
    }

    TempDir tempDir_;
    std::string logPath_;
};

TEST_F(LoggerTest, InitializeCreatesLogFileAndDirectory) {
    EXPECT_TRUE(Logger::initialize(logPath_));
    EXPECT_TRUE(Logger::isInitialized());
    EXPECT_TRUE(fs::exists(logPath_));
    EXPECT_EQ(Logger::getLogPath(), logPath_);
}

TEST_F(LoggerTest, SecondInitializeIsRejected) {
    ASSERT_TRUE(Logger::initialize(logPath_));
    EXPECT_FALSE(Logger::initialize((tempDir_.path() / "other.log").string()));
    EXPECT_EQ(Logger::getLogPath(), logPath_);
}

TEST_F(LoggerTest, InitializeFailsWhenFileCannotBeCreated) {
    // A regular file where the parent directory should be
    writeFile(tempDir_.path() / "blocker", "x");
    EXPECT_FALSE(Logger::initialize((tempDir_.path() / "blocker" / "session.log").string()));
    EXPECT_FALSE(Logger::isInitialized());
}

TEST_F(LoggerTest, FileRecordsArePlainText) {
    ASSERT_TRUE(Logger::initialize(logPath_));
    Logger::info("hello");
    Logger::warning("careful");
    Logger::error("broken");

    std::string contents = readFile(logPath_);
    EXPECT_NE(contents.find("[INFO] hello\n"), std::string::npos);
    EXPECT_NE(contents.find("[WARN] careful\n"), std::string::npos);
    EXPECT_NE(contents.find("[ERROR] broken\n"), std::string::npos);
    EXPECT_EQ(contents.find("\033["), std::string::npos);
}

TEST_F(LoggerTest, DebugIsEmittedByDefault) {
    ASSERT_TRUE(Logger::initialize(logPath_));
    Logger::debug("diagnostic");
    EXPECT_NE(readFile(logPath_).find("[DEBUG] diagnostic"), std::string::npos);
}

TEST_F(LoggerTest, LevelFilterDropsLowerRecords) {
    ASSERT_TRUE(Logger::initialize(logPath_));
    Logger::setLogLevel(LogLevel::WARN);
    Logger::info("hidden");
    Logger::warning("shown");

    std::string contents = readFile(logPath_);
    EXPECT_EQ(contents.find("hidden"), std::string::npos);
    EXPECT_NE(contents.find("shown"), std::string::npos);
}

TEST_F(LoggerTest, ConsoleCopyIsColorizedOnStderr) {
    ASSERT_TRUE(Logger::initialize(logPath_));
    testing::internal::CaptureStderr();
    Logger::error("red alert");
    std::string console = testing::internal::GetCapturedStderr();

    EXPECT_NE(console.find("\033[0;31m"), std::string::npos);
    EXPECT_NE(console.find("[ERROR] red alert\033[0m"), std::string::npos);
}

TEST_F(LoggerTest, NothingIsWrittenBeforeInitialize) {
    Logger::info("dropped");
    EXPECT_FALSE(fs::exists(logPath_));
}

TEST_F(LoggerTest, SessionLogPathCombinesStemAndStartTime) {
    std::tm tm{};
    tm.tm_year = 2025 - 1900;
    tm.tm_mon = 6;
    tm.tm_mday = 13;
    tm.tm_hour = 9;
    tm.tm_min = 5;
    tm.tm_sec = 7;
    tm.tm_isdst = -1;
    auto start = std::chrono::system_clock::from_time_t(std::mktime(&tm));

    std::string path = Logger::sessionLogPath("/opt/backup", "user-profile-backup.sh", start);
    EXPECT_EQ(path, "/opt/backup/user-profile-backup_2025-07-13_09-05-07.log");
}

TEST_F(LoggerTest, LevelNames) {
    EXPECT_EQ(Logger::levelToString(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(Logger::levelToString(LogLevel::INFO), "INFO");
    EXPECT_EQ(Logger::levelToString(LogLevel::WARN), "WARN");
    EXPECT_EQ(Logger::levelToString(LogLevel::ERROR), "ERROR");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
