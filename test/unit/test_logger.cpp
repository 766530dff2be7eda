#include <gtest/gtest.h>
#include "excelpic/utils/FileWrapper.hpp"
#include "excelpic/utils/Logger.hpp"
#include "excelpic/utils/ModuleLoggers.hpp"
#include "../support/TempDirectory.hpp"
#include <regex>

using excelpic::Logger;
using excelpic::core::Path;
using excelpic::utils::FileWrapper;

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::getInstance().shutdown();
    }

    std::string readLog() {
        Logger::getInstance().flush();
        return FileWrapper::readFile(Path(log_path));
    }

    excelpic::test::TempDirectory temp;
    std::string log_path = temp.file("logs/excelpic.log");
};

TEST_F(LoggerTest, DiscardsUntilInitialized) {
    EXPECT_FALSE(Logger::getInstance().isInitialized());
    EXPORT_INFO("dropped {}", 1);
    EXPECT_FALSE(Path(log_path).exists());
}

// 日志行格式：[时间] [名称] [等级] 消息
TEST_F(LoggerTest, WritesFormattedLines) {
    ASSERT_TRUE(Logger::getInstance().initialize(log_path, Logger::Level::INFO, false, Logger::kDefaultMaxFileSize,
                                                 Logger::kDefaultMaxFiles, Logger::WriteMode::TRUNCATE));
    PUBLISH_INFO("Published {} to {}", "Sheet1!A1", "out.html");
    RENDER_DEBUG("filtered out");

    std::string content = readLog();
    std::regex line(R"(\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\] \[excelpic\.publish\] \[INFO \] Published Sheet1!A1 to out\.html\n)");
    EXPECT_TRUE(std::regex_match(content, line)) << content;
}

TEST_F(LoggerTest, RotatesWhenFileIsFull) {
    ASSERT_TRUE(Logger::getInstance().initialize(log_path, Logger::Level::INFO, false, 64, 2,
                                                 Logger::WriteMode::TRUNCATE));
    for (int i = 0; i < 10; ++i) {
        EXPORT_WARN("message number {}", i);
    }
    Logger::getInstance().flush();

    EXPECT_TRUE(Path(log_path + ".1").exists());
    EXPECT_FALSE(Path(log_path + ".3").exists());
}

TEST(LoggerLevelTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("debug"), Logger::Level::DEBUG);
    EXPECT_EQ(Logger::parseLevel("WARNING"), Logger::Level::WARN);
    EXPECT_EQ(Logger::parseLevel("off"), Logger::Level::OFF);
    EXPECT_EQ(Logger::parseLevel("bogus", Logger::Level::ERROR), Logger::Level::ERROR);
}
