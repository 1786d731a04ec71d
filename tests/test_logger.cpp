#include <gtest/gtest.h>
#include "utils/logger.h"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace docsan::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path_ = (std::filesystem::temp_directory_path() / "docsan_test_logger.log").string();
        std::filesystem::remove(log_path_);
    }

    void TearDown() override {
        Logger::shutdown();
        std::filesystem::remove(log_path_);
    }

    std::string readLog() const {
        std::ifstream in(log_path_);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::string log_path_;
};

TEST_F(LoggerTest, MacrosAreSilentBeforeInit) {
    ASSERT_FALSE(Logger::isInitialized());
    DOCSAN_INFO("not initialized {}", 1);
    EXPECT_FALSE(Logger::isInitialized());
}

TEST_F(LoggerTest, WritesToFileAtConfiguredLevel) {
    Logger::init(log_path_, Logger::Level::WARN);
    ASSERT_TRUE(Logger::isInitialized());

    DOCSAN_INFO("dropped {}", "info");
    DOCSAN_WARN("kept {} of {}", 3, 4);
    Logger::shutdown();

    std::string content = readLog();
    EXPECT_NE(content.find("kept 3 of 4"), std::string::npos);
    EXPECT_EQ(content.find("dropped info"), std::string::npos);
    EXPECT_NE(content.find("[docsan]"), std::string::npos);
    EXPECT_FALSE(Logger::isInitialized());
}

TEST_F(LoggerTest, EachMacroLogsAtItsOwnLevel) {
    Logger::init(log_path_, Logger::Level::DEBUG);

    DOCSAN_DEBUG("debug line {}", 1);
    DOCSAN_INFO("info line {}", 2);
    DOCSAN_WARN("warn line {}", 3);
    DOCSAN_ERROR("error line {}", 4);
    Logger::shutdown();

    std::string content = readLog();
    EXPECT_NE(content.find("[debug] debug line 1"), std::string::npos);
    EXPECT_NE(content.find("[info] info line 2"), std::string::npos);
    EXPECT_NE(content.find("[warning] warn line 3"), std::string::npos);
    EXPECT_NE(content.find("[error] error line 4"), std::string::npos);
}

TEST(LoggerLevelTest, LevelFromString) {
    EXPECT_EQ(Logger::levelFromString("DEBUG"), Logger::Level::DEBUG);
    EXPECT_EQ(Logger::levelFromString("warning"), Logger::Level::WARN);
    EXPECT_EQ(Logger::levelFromString("err"), Logger::Level::ERROR);
    EXPECT_EQ(Logger::levelFromString("nonsense"), Logger::Level::INFO);
    EXPECT_STREQ(Logger::levelToString(Logger::Level::CRITICAL), "critical");
}
