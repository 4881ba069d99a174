/**
 * @file LoggerTest.cpp
 * @brief Unit tests for the logger
 */

#include "util/Logger.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>

using util::LogLevel;
using util::Logger;

class LoggerTest : public TempDirTestFixture {
protected:
    void SetUp() override {
        TempDirTestFixture::SetUp();
        Logger::instance().set_console_output(false);
        Logger::instance().set_min_level(LogLevel::INFO);
    }

    void TearDown() override {
        Logger::instance().shutdown();
        Logger::instance().set_min_level(LogLevel::INFO);
        TempDirTestFixture::TearDown();
    }

    static auto ReadAll(const std::filesystem::path& path) -> std::string {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }
};

TEST_F(LoggerTest, FormatLine_ContainsLevelComponentAndMessage) {
    EXPECT_EQ(Logger::format_line("2026-01-22T14:32:45.123Z", LogLevel::WARNING, "Collector",
                                  "Skipping disk 'flash'"),
              "2026-01-22T14:32:45.123Z [WARN ] [Collector] Skipping disk 'flash'");
}

TEST_F(LoggerTest, Initialize_WritesToLogFile) {
    ASSERT_TRUE(Logger::instance().initialize(temp_dir / "logs", "disktemp-test"));
    EXPECT_EQ(Logger::instance().get_log_file_path().string(),
              (temp_dir / "logs" / "disktemp-test.log").string());

    LOG_INFO("Collector", "Processed and sent metrics for 2 disks");
    Logger::instance().shutdown();

    auto content = ReadAll(temp_dir / "logs" / "disktemp-test.log");
    EXPECT_NE(content.find("[INFO ] [Collector] Processed and sent metrics for 2 disks"),
              std::string::npos);
}

TEST_F(LoggerTest, BelowMinLevel_NotWritten) {
    ASSERT_TRUE(Logger::instance().initialize(temp_dir, "disktemp-test"));

    LOG_DEBUG("MetricEmitter", "Sent metric: a:1|g");
    Logger::instance().set_min_level(LogLevel::DEBUG);
    LOG_DEBUG("MetricEmitter", "Sent metric: b:2|g");
    Logger::instance().shutdown();

    auto content = ReadAll(temp_dir / "disktemp-test.log");
    EXPECT_EQ(content.find("a:1|g"), std::string::npos);
    EXPECT_NE(content.find("b:2|g"), std::string::npos);
}

TEST_F(LoggerTest, Rotation_KeepsRotatedFile) {
    ASSERT_TRUE(Logger::instance().initialize(
        temp_dir, "disktemp-test",
        util::LogRotationPolicy{.max_file_size_bytes = 64, .max_files = 2}));

    for (int i = 0; i < 10; ++i) {
        LOG_INFO("Collector", "Processing: Slot='disk1', ID='WD-1', Type='Data', Temp='38'");
    }
    Logger::instance().shutdown();

    EXPECT_TRUE(std::filesystem::exists(temp_dir / "disktemp-test.log"));
    EXPECT_TRUE(std::filesystem::exists(temp_dir / "disktemp-test.1.log"));
    EXPECT_FALSE(std::filesystem::exists(temp_dir / "disktemp-test.3.log"));
}

TEST_F(LoggerTest, NotInitialized_NoFilePath) {
    EXPECT_TRUE(Logger::instance().get_log_file_path().empty());
}
