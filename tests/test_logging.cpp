#include <gtest/gtest.h>
#include "../src/core/Logging.h"
#include <iostream>
#include <sstream>
#include <thread>
#include <vector>

namespace lan_scan {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Info);
        old_ = std::cerr.rdbuf(captured_.rdbuf());
    }
    void TearDown() override {
        std::cerr.rdbuf(old_);
        Logger::instance().set_level(LogLevel::Info);
    }
    std::stringstream captured_;
    std::streambuf* old_ = nullptr;
};

TEST_F(LoggingTest, SingletonInstance) {
    EXPECT_EQ(&Logger::instance(), &Logger::instance());
}

TEST_F(LoggingTest, DefaultLevelIsInfo) {
    EXPECT_EQ(Logger::instance().level(), LogLevel::Info);
}

TEST_F(LoggingTest, MessagesBelowLevelAreDropped) {
    Logger::instance().debug("hidden");
    Logger::instance().info("shown");
    std::string out = captured_.str();
    EXPECT_EQ(out.find("hidden"), std::string::npos);
    EXPECT_NE(out.find("[INFO] shown"), std::string::npos);
}

TEST_F(LoggingTest, LevelPrefixes) {
    Logger::instance().set_level(LogLevel::Trace);
    Logger::instance().error("e");
    Logger::instance().warn("w");
    Logger::instance().trace("t");
    std::string out = captured_.str();
    EXPECT_NE(out.find("[ERROR] e\n"), std::string::npos);
    EXPECT_NE(out.find("[WARN] w\n"), std::string::npos);
    EXPECT_NE(out.find("[TRACE] t\n"), std::string::npos);
}

TEST_F(LoggingTest, ErrorLevelSilencesWarnings) {
    Logger::instance().set_level(LogLevel::Error);
    Logger::instance().warn("quiet please");
    EXPECT_TRUE(captured_.str().empty());
}

TEST_F(LoggingTest, ConcurrentLinesStayWhole) {
    std::vector<std::thread> threads;
    for(int t=0; t<8; ++t){
        threads.emplace_back([t]{
            for(int i=0;i<50;++i) Logger::instance().info("worker-" + std::to_string(t) + "-line");
        });
    }
    for(auto& th : threads) th.join();
    std::string line;
    int count = 0;
    while(std::getline(captured_, line)){
        ++count;
        EXPECT_EQ(line.rfind("[INFO] worker-", 0), 0u) << line;
        EXPECT_EQ(line.substr(line.size() - 5), "-line");
    }
    EXPECT_EQ(count, 400);
}

TEST(ParseLogLevelTest, AcceptsNamesCaseInsensitively) {
    LogLevel lvl = LogLevel::Info;
    EXPECT_TRUE(parse_log_level("DEBUG", lvl));
    EXPECT_EQ(lvl, LogLevel::Debug);
    EXPECT_TRUE(parse_log_level("warning", lvl));
    EXPECT_EQ(lvl, LogLevel::Warn);
    EXPECT_FALSE(parse_log_level("loud", lvl));
    EXPECT_EQ(lvl, LogLevel::Warn);
}

}
