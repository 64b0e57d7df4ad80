/**
 * @file test_logger.cpp
 * @brief Level filtering and per-probe context tags
 */

#include <gtest/gtest.h>
#include "sniax_logger.hpp"

#include <fstream>
#include <sstream>
#include <string>

using namespace sniax;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = ::testing::TempDir() + "sniax_logger_test.log";
        std::ofstream(path, std::ios::trunc).close();
        auto& log = Logger::instance();
        log.setConsoleOutput(false);
        ASSERT_TRUE(log.setFileOutput(path));
        log.setLevel(LogLevel::DEBUG);
    }

    void TearDown() override {
        auto& log = Logger::instance();
        log.setLevel(LogLevel::INFO);
        log.setConsoleOutput(true);
    }

    std::string contents() const {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::string path;
};

TEST(LogContextTest, TagCarriesOperationDomainAndNameServer) {
    LogContext ctx("AXFR", "example.com");
    EXPECT_EQ(ctx.tag(), "[AXFR example.com]");
    EXPECT_EQ(ctx.via("ns1.example.com").tag(), "[AXFR example.com @ns1.example.com]");
    EXPECT_EQ(ctx.via("ns1.example.com").nameserver(), "ns1.example.com");
    EXPECT_TRUE(ctx.nameserver().empty());
}

TEST_F(LoggerTest, ContextLinesReachTheFile) {
    LogContext("AXFR", "example.com", "ns2.example.com").warn("connect failed: refused");
    std::string out = contents();
    EXPECT_NE(out.find("[WARN ] [AXFR example.com @ns2.example.com] connect failed: refused"),
              std::string::npos);
}

TEST_F(LoggerTest, LevelFiltersBeforeWriting) {
    Logger::instance().setLevel(LogLevel::WARN);
    EXPECT_FALSE(Logger::instance().enabled(LogLevel::INFO));
    EXPECT_TRUE(Logger::instance().enabled(LogLevel::ERROR));

    LogContext("SNI", "example.com").debug("handshake accepted for www.example.com");
    LogContext("CNAME", "example.com").error("resolver unavailable");

    std::string out = contents();
    EXPECT_EQ(out.find("handshake accepted"), std::string::npos);
    EXPECT_NE(out.find("[CNAME example.com] resolver unavailable"), std::string::npos);
}

TEST(LoggerLevelTest, LevelFromString) {
    EXPECT_EQ(Logger::levelFromString("warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::levelFromString("none"), LogLevel::NONE);
    EXPECT_EQ(Logger::levelFromString("bogus"), LogLevel::INFO);
}
