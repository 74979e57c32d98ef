#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include <thread>
#include <filesystem>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace flux::logger;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_file = log_dir / "flux-test.log";
        init_logging(log_file.string(), severity_level::trace);
    }

    void TearDown() override {
        // Ensure all logs are written
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        init_test_logging(boost::log::trivial::warning);
    }

    bool log_contains(const std::string& text) {
        boost::log::core::get()->flush();
        return read_file(log_file).find(text) != std::string::npos;
    }

    TempDir log_dir{"flux-logs"};
    std::filesystem::path log_file;
};

TEST_F(LoggerTest, BasicLogging) {
    BOOST_LOG_TRIVIAL(info) << "Test info message";
    BOOST_LOG_TRIVIAL(error) << "Test error message";

    EXPECT_TRUE(log_contains("Test info message"));
    EXPECT_TRUE(log_contains("Test error message"));
    EXPECT_TRUE(log_contains("[error]"));
}

TEST_F(LoggerTest, ThreadLogging) {
    std::thread t([]() {
        BOOST_LOG_TRIVIAL(info) << "Message from thread";
    });
    t.join();

    EXPECT_TRUE(log_contains("Message from thread"));
}

TEST_F(LoggerTest, SeverityLevels) {
    BOOST_LOG_TRIVIAL(trace) << "Trace message";
    BOOST_LOG_TRIVIAL(debug) << "Debug message";
    BOOST_LOG_TRIVIAL(info) << "Info message";
    BOOST_LOG_TRIVIAL(warning) << "Warning message";
    BOOST_LOG_TRIVIAL(error) << "Error message";
    BOOST_LOG_TRIVIAL(fatal) << "Fatal message";

    EXPECT_TRUE(log_contains("Trace message"));
    EXPECT_TRUE(log_contains("Debug message"));
    EXPECT_TRUE(log_contains("Info message"));
    EXPECT_TRUE(log_contains("Warning message"));
    EXPECT_TRUE(log_contains("Error message"));
    EXPECT_TRUE(log_contains("Fatal message"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    set_log_level(severity_level::warning);

    BOOST_LOG_TRIVIAL(debug) << "Should not appear";
    BOOST_LOG_TRIVIAL(warning) << "Should appear";

    EXPECT_FALSE(log_contains("Should not appear"));
    EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, ReinitializeAppends) {
    BOOST_LOG_TRIVIAL(info) << "First session";
    init_logging(log_file.string(), severity_level::info);
    BOOST_LOG_TRIVIAL(info) << "Second session";

    EXPECT_TRUE(log_contains("First session"));
    EXPECT_TRUE(log_contains("Second session"));
}

TEST_F(LoggerTest, ParseSeverity) {
    EXPECT_EQ(parse_severity("trace"), severity_level::trace);
    EXPECT_EQ(parse_severity("warning"), severity_level::warning);
    EXPECT_EQ(parse_severity("fatal"), severity_level::fatal);
    EXPECT_THROW(parse_severity("verbose"), std::invalid_argument);
}
