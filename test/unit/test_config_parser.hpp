#ifndef REDACTOR_TEST_UNIT_TEST_CONFIG_PARSER_HPP
#define REDACTOR_TEST_UNIT_TEST_CONFIG_PARSER_HPP

#include <stdexcept>
#include <gtest/gtest.h>
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "test_helpers.hpp"

namespace {

using redactor::config::RunConfig;
using redactor::config::ValidatorFailurePolicy;
using redactor::util::ConfigParser;

TEST(ConfigParserTest, Defaults) {
    RunConfig cfg;
    EXPECT_EQ(cfg.validatorTimeoutSeconds, 30u);
    EXPECT_EQ(cfg.validatorFailurePolicy, ValidatorFailurePolicy::Disable);
    EXPECT_EQ(cfg.scanThreads, 0u);
    EXPECT_EQ(cfg.maxLineLength, 8192u);
    EXPECT_EQ(cfg.logLevel, "warn");
    EXPECT_TRUE(cfg.logFile.empty());
}

TEST(ConfigParserTest, LoadsKnownKeys) {
    redactor::test::TempDir dir;
    std::string path = dir.write("redact.conf",
        "# run settings\n"
        "\n"
        "validatorTimeoutSeconds = 5\n"
        "  validatorFailurePolicy=fatal  \n"
        "scanThreads = 2\n"
        "maxLineLength = 0\n"
        "logLevel = debug\n"
        "someFutureKey = ignored\n");

    RunConfig cfg;
    ConfigParser parser(cfg);
    parser.loadFromFile(path);

    EXPECT_EQ(cfg.validatorTimeoutSeconds, 5u);
    EXPECT_EQ(cfg.validatorFailurePolicy, ValidatorFailurePolicy::Fatal);
    EXPECT_EQ(cfg.scanThreads, 2u);
    EXPECT_EQ(cfg.maxLineLength, 0u);
    EXPECT_EQ(cfg.logLevel, "debug");
}

TEST(ConfigParserTest, MalformedInputThrows) {
    redactor::test::TempDir dir;
    RunConfig cfg;
    ConfigParser parser(cfg);

    EXPECT_THROW(parser.loadFromFile(dir.write("a.conf", "validatorTimeoutSeconds\n")), std::runtime_error);
    EXPECT_THROW(parser.applyKeyValue("validatorTimeoutSeconds", "10s"), std::runtime_error);
    EXPECT_THROW(parser.applyKeyValue("validatorTimeoutSeconds", "-1"), std::runtime_error);
    EXPECT_THROW(parser.applyKeyValue("validatorFailurePolicy", "maybe"), std::runtime_error);
    EXPECT_THROW(parser.applyKeyValue("logLevel", "loud"), std::runtime_error);
    EXPECT_THROW(parser.loadFromFile(dir.sub("missing.conf")), std::runtime_error);
}

TEST(ConfigParserTest, ReadUncommentedLinesKeepsLineNumbers) {
    redactor::test::TempDir dir;
    auto lines = redactor::util::readUncommentedLines(dir.write("p", "# head\n\n  first  \n#x\nsecond\n"));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].number, 3u);
    EXPECT_EQ(lines[0].text, "first");
    EXPECT_EQ(lines[1].number, 5u);
    EXPECT_EQ(lines[1].text, "second");
}

TEST(LoggerTest, ParsesLevelNames) {
    using redactor::util::logger::LogLevel;
    using redactor::util::logger::parseLogLevel;
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("Critical"), LogLevel::CRITICAL);
    EXPECT_THROW(parseLogLevel("verbose"), std::invalid_argument);
}

TEST(LoggerTest, CountsMessagesBelowTheThreshold) {
    namespace logger = redactor::util::logger;
    logger::LogLevel previous = logger::Logger::getInstance().getLogLevel();
    logger::setLogLevel(logger::LogLevel::ERROR);
    size_t debugs = logger::messageCount(logger::LogLevel::DEBUG);
    size_t warnings = logger::messageCount(logger::LogLevel::WARN);

    logger::debug("LoggerTest: hidden");
    logger::warn("LoggerTest: hidden too");
    logger::warn("LoggerTest: and this one");

    EXPECT_EQ(logger::messageCount(logger::LogLevel::DEBUG), debugs + 1);
    EXPECT_EQ(logger::messageCount(logger::LogLevel::WARN), warnings + 2);
    EXPECT_STREQ(logger::levelName(logger::LogLevel::CRITICAL), "CRITICAL");
    logger::setLogLevel(previous);
}

} // anonymous namespace

#endif // REDACTOR_TEST_UNIT_TEST_CONFIG_PARSER_HPP
