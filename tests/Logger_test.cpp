#include <gtest/gtest.h>
#include "test_utils.hpp"

#include <fstream>
#include <sstream>
#include <spdlog/sinks/ostream_sink.h>

class LoggerTest : public ::testing::Test {
protected:
    std::ostringstream console;
    std::shared_ptr<spdlog::logger> sp_logger;
    std::unique_ptr<Logger> log;

    void SetUp() override {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_st>(console);
        sp_logger = std::make_shared<spdlog::logger>("test", sink);
        sp_logger->set_pattern("%l %v");
        log = std::make_unique<Logger>(sp_logger);
        log->set_verbosity(0);
    }

    std::vector<std::string> lines() const {
        std::vector<std::string> result;
        std::istringstream is(console.str());
        std::string line;
        while( std::getline(is, line) ){
            result.push_back(line);
        }
        return result;
    }
};

TEST_F(LoggerTest, default_verbosity) {
    log->debug("hidden {}", 1);
    log->info("shown {}", 2);
    EXPECT_EQ(lines(), std::vector<std::string>{"info shown 2"});
}

TEST_F(LoggerTest, quiet) {
    log->set_verbosity(-1);
    log->info("hidden");
    log->warn("shown");
    EXPECT_EQ(lines(), std::vector<std::string>{"warning shown"});

    log->set_verbosity(-4);
    log->critical("hidden too");
    EXPECT_EQ(lines().size(), 1);
}

TEST_F(LoggerTest, verbose) {
    log->set_verbosity(1);
    log->debug("debug");
    log->trace("trace");
    EXPECT_EQ(lines(), std::vector<std::string>{"debug debug"});

    log->set_verbosity(2);
    log->trace("trace");
    EXPECT_EQ(lines().back(), "trace trace");
}

TEST_F(LoggerTest, verbosity_out_of_range) {
    log->set_verbosity(-10);
    log->critical("hidden");
    EXPECT_TRUE(lines().empty());

    log->set_verbosity(9);
    log->trace("shown");
    EXPECT_EQ(lines(), std::vector<std::string>{"trace shown"});
}

TEST_F(LoggerTest, add_file) {
    TempFile tmp("Logger_test.log", "");

    EXPECT_TRUE(log->add_file(tmp.path()));
    EXPECT_FALSE(log->add_file(tmp.path()));
    EXPECT_EQ(log->file(), tmp.path());
    EXPECT_EQ(log->console_level(), spdlog::level::info);

    log->debug("file only");
    log->info("both");
    log->flush();

    EXPECT_EQ(lines(), std::vector<std::string>{"info both"});

    std::ifstream f(tmp.path());
    std::stringstream ss;
    ss << f.rdbuf();
    EXPECT_THAT(ss.str(), HasSubstr("file only"));
    EXPECT_THAT(ss.str(), HasSubstr("both"));
}

TEST_F(LoggerTest, start) {
    log->set_banner("readmeter");
    log->start();
    std::vector<std::string> expected = {"info readmeter", "info logging to console only"};
    EXPECT_EQ(lines(), expected);
}

TEST(init_log, attaches_file_to_global_logger) {
    TempFile tmp("init_log_test.log", "");
    init_log(tmp.path());
    EXPECT_EQ(logger->file(), tmp.path());

    // later calls keep the first file
    init_log(tmp.path().string() + ".other");
    EXPECT_EQ(logger->file(), tmp.path());
}
