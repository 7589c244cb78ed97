#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"

using namespace shardroot::logging;

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path log_dir_;
    std::filesystem::path log_file_;

    void SetUp() override {
        log_dir_ = std::filesystem::temp_directory_path() / "shardroot_logger_test";
        if (std::filesystem::exists(log_dir_)) {
            std::filesystem::remove_all(log_dir_);
        }
        log_file_ = log_dir_ / "shardroot.log";

        // The parent directory is created on demand
        init_logging(log_file_.string(), boost::log::trivial::trace);
    }

    void TearDown() override {
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        enable_logging();
        std::filesystem::remove_all(log_dir_);
    }

    bool log_contains(const std::string& text) {
        boost::log::core::get()->flush();
        std::ifstream file(log_file_, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            return false;
        }
        std::stringstream content;
        content << file.rdbuf();
        return content.str().find(text) != std::string::npos;
    }
};

TEST_F(LoggerTest, BasicLogging) {
    LOG_INFO << "Test info message";
    BOOST_LOG_TRIVIAL(error) << "Segmenter: Test error message";

    EXPECT_TRUE(std::filesystem::exists(log_file_));
    EXPECT_TRUE(log_contains("[info] Test info message"));
    EXPECT_TRUE(log_contains("[error] Segmenter: Test error message"));
}

TEST_F(LoggerTest, ThreadLogging) {
    std::thread t([]() {
        LOG_INFO << "Message from thread";
    });
    t.join();

    EXPECT_TRUE(log_contains("Message from thread"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    set_log_level(boost::log::trivial::warning);

    LOG_DEBUG << "Should not appear";
    LOG_WARN << "Should appear";

    EXPECT_FALSE(log_contains("Should not appear"));
    EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, EnableDisableLogging) {
    disable_logging();
    LOG_INFO << "Hidden while disabled";

    enable_logging();
    LOG_INFO << "Visible after enable";

    EXPECT_FALSE(log_contains("Hidden while disabled"));
    EXPECT_TRUE(log_contains("Visible after enable"));
}

TEST_F(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("trace"), boost::log::trivial::trace);
    EXPECT_EQ(parse_log_level("warning"), boost::log::trivial::warning);
    EXPECT_EQ(parse_log_level("fatal"), boost::log::trivial::fatal);
    EXPECT_THROW(parse_log_level("verbose"), std::invalid_argument);
}

TEST_F(LoggerTest, ConsoleSinkMirrorsRecords) {
    std::stringstream captured;
    std::streambuf* original = std::clog.rdbuf(captured.rdbuf());

    init_logging(log_file_.string(), boost::log::trivial::info, true);
    LOG_WARN << "Mirrored to console";
    boost::log::core::get()->flush();
    boost::log::core::get()->remove_all_sinks();

    std::clog.rdbuf(original);

    EXPECT_NE(captured.str().find("[warning] Mirrored to console"), std::string::npos);
    EXPECT_TRUE(log_contains("Mirrored to console"));
}
