#include <gtest/gtest.h>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include "desktop_logger/desktop_logger.hpp"
#include "zf_log.h"

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path = "/tmp/mavtrack_test_log_" + std::to_string(
            std::chrono::high_resolution_clock::now().time_since_epoch().count()) + ".log";
        auto ret = mavtrack::start_logging();
        ASSERT_TRUE(ret == mavtrack::LOGGER_SUCCESS || ret == mavtrack::LOGGER_ALREADY_STARTED);
        mavtrack::set_log_level(mavtrack::LOG_INFO);
    }

    void TearDown() override {
        mavtrack::disable_log_rotation();
        mavtrack::close_log_file();
        std::remove(log_path.c_str());
        for (int i = 1; i <= 3; ++i) {
            std::remove((log_path + "." + std::to_string(i)).c_str());
        }
    }

    std::string read_file(const std::string& path) {
        std::ifstream f(path);
        std::stringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }

    std::string log_path;
};

// -v count selects the level
TEST_F(LoggerTest, VerbosityToLevel) {
    EXPECT_EQ(mavtrack::log_level_from_verbosity(0), mavtrack::LOG_WARN);
    EXPECT_EQ(mavtrack::log_level_from_verbosity(1), mavtrack::LOG_INFO);
    EXPECT_EQ(mavtrack::log_level_from_verbosity(2), mavtrack::LOG_DEBUG);
    EXPECT_EQ(mavtrack::log_level_from_verbosity(5), mavtrack::LOG_DEBUG);
}

// Lines go to the file with level name and program tag; filtered levels do not
TEST_F(LoggerTest, WritesToLogFile) {
    ASSERT_EQ(mavtrack::reset_logfile(log_path.c_str()), mavtrack::LOGGER_SUCCESS);
    ZF_LOGI("tracking %d", 42);
    ZF_LOGD("hidden debug line");
    ZF_LOGW("a warning");
    EXPECT_EQ(mavtrack::verify_logfile(), mavtrack::LOGGER_SUCCESS);

    std::string contents = read_file(log_path);
    EXPECT_NE(contents.find("INFO:mavtrack: tracking 42"), std::string::npos);
    EXPECT_NE(contents.find("WARNING:mavtrack: a warning"), std::string::npos);
    EXPECT_EQ(contents.find("hidden debug line"), std::string::npos);
}

// Rotation moves the full file aside and starts a new one
TEST_F(LoggerTest, RotatesBySize) {
    ASSERT_EQ(mavtrack::reset_logfile(log_path.c_str()), mavtrack::LOGGER_SUCCESS);
    mavtrack::enable_log_rotation(1024, 2);

    const std::string filler(200, 'x');
    for (int i = 0; i < 20; ++i) {
        ZF_LOGI("%s", filler.c_str());
    }

    std::ifstream rotated(log_path + ".1");
    EXPECT_TRUE(rotated.good());
    std::ifstream beyond(log_path + ".3");
    EXPECT_FALSE(beyond.good());
}

// Error paths report distinct codes
TEST_F(LoggerTest, ErrorCodes) {
    EXPECT_EQ(mavtrack::reset_logfile(""), mavtrack::LOGGER_FILEPATH_EMPTY);
    EXPECT_EQ(mavtrack::reset_logfile("/nonexistent/dir/bridge.log"), mavtrack::LOGGER_COULD_NOT_OPEN_FILE);
    EXPECT_EQ(mavtrack::verify_logfile(), mavtrack::LOGGER_FILE_PTR_IS_NULL);
    EXPECT_EQ(mavtrack::start_logging(), mavtrack::LOGGER_ALREADY_STARTED);
    EXPECT_STREQ(mavtrack::logger_retval_to_cstr(mavtrack::LOGGER_COULD_NOT_OPEN_FILE), "LOGGER_COULD_NOT_OPEN_FILE");
}
