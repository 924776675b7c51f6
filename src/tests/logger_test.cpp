#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace bsync::logger;

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path log_dir;
    std::filesystem::path log_file;

    void SetUp() override {
        log_dir = make_temp_dir("logger_test");
        log_file = log_dir / "nested" / "bucketsync.log";

        init_logging(log_file.string(), severity_level::trace);
    }

    void TearDown() override {
        // Ensure all logs are written
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        ::init_logging();

        std::filesystem::remove_all(log_dir);
    }

    bool log_contains(const std::string& text) {
        boost::log::core::get()->flush();
        std::ifstream file(log_file, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            return false;
        }
        std::stringstream content;
        content << file.rdbuf();
        return content.str().find(text) != std::string::npos;
    }
};

TEST_F(LoggerTest, BasicLogging) {
    BOOST_LOG_TRIVIAL(info) << "Test info message";
    BOOST_LOG_TRIVIAL(error) << "Test error message";

    EXPECT_TRUE(std::filesystem::exists(log_file));
    EXPECT_TRUE(log_contains("Test info message"));
    EXPECT_TRUE(log_contains("[error] Test error message"));
}

TEST_F(LoggerTest, ThreadLogging) {
    std::thread t([]() {
        BOOST_LOG_TRIVIAL(info) << "Message from thread";
    });
    t.join();

    EXPECT_TRUE(log_contains("Message from thread"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    set_log_level(severity_level::warning);

    BOOST_LOG_TRIVIAL(debug) << "Should not appear";
    BOOST_LOG_TRIVIAL(warning) << "Should appear";

    EXPECT_FALSE(log_contains("Should not appear"));
    EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, AppendsAcrossInitialization) {
    BOOST_LOG_TRIVIAL(info) << "First run";
    init_logging(log_file.string(), severity_level::info);
    BOOST_LOG_TRIVIAL(info) << "Second run";

    EXPECT_TRUE(log_contains("First run"));
    EXPECT_TRUE(log_contains("Second run"));
}

TEST(LoggerSeverityTest, ParsesNames) {
    EXPECT_EQ(parse_severity("trace"), severity_level::trace);
    EXPECT_EQ(parse_severity("DEBUG"), severity_level::debug);
    EXPECT_EQ(parse_severity("Info"), severity_level::info);
    EXPECT_EQ(parse_severity("warn"), severity_level::warning);
    EXPECT_EQ(parse_severity("warning"), severity_level::warning);
    EXPECT_EQ(parse_severity("error"), severity_level::error);
    EXPECT_EQ(parse_severity("fatal"), severity_level::fatal);
    EXPECT_THROW(parse_severity("loud"), std::invalid_argument);
}
