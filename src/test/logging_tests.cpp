// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

/**
 * Logging tests: level and category parsing, filtering and file rotation
 */

#include <boost/test/unit_test.hpp>

#include <test/test_helpers.h>
#include <util/logging.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace {

/** Restores the process-wide logging state the test suite runs with */
struct LoggingSetup {
    LogLevel savedLevel;
    uint32_t savedCategories;

    LoggingSetup()
        : savedLevel(CLoggingConfig::GetInstance().GetLogLevel()),
          savedCategories(CLoggingConfig::GetInstance().GetCategories()) {
        CLoggingConfig::GetInstance().SetConsoleLogging(false);
    }

    ~LoggingSetup() {
        CLogger::GetInstance().Shutdown();
        CLoggingConfig& config = CLoggingConfig::GetInstance();
        config.SetLogFile("");
        config.SetRotation(10 * 1024 * 1024, 5);
        config.SetLogLevel(savedLevel);
        config.SetCategories(savedCategories);
        config.SetConsoleLogging(true);
    }
};

std::string ReadFile(const std::string& path) {
    std::ifstream file(path);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(logging_tests)

BOOST_AUTO_TEST_CASE(parse_log_level) {
    LogLevel level = LogLevel::LVL_INFO;
    BOOST_CHECK(ParseLogLevel("DEBUG", level));
    BOOST_CHECK(level == LogLevel::LVL_DEBUG);
    BOOST_CHECK(ParseLogLevel("warning", level));
    BOOST_CHECK(level == LogLevel::LVL_WARN);
    BOOST_CHECK(!ParseLogLevel("chatty", level));
    BOOST_CHECK(level == LogLevel::LVL_WARN);
}

BOOST_AUTO_TEST_CASE(parse_log_categories) {
    uint32_t mask = 0;
    BOOST_CHECK(ParseLogCategories("net, Plot", mask));
    BOOST_CHECK_EQUAL(mask, static_cast<uint32_t>(LogCategory::NET) | static_cast<uint32_t>(LogCategory::PLOT));

    BOOST_CHECK(ParseLogCategories("all", mask));
    BOOST_CHECK_EQUAL(mask, static_cast<uint32_t>(LogCategory::ALL));

    BOOST_CHECK(ParseLogCategories("none", mask));
    BOOST_CHECK_EQUAL(mask, 0u);

    mask = 7;
    BOOST_CHECK(!ParseLogCategories("consensus,wallet", mask));
    BOOST_CHECK_EQUAL(mask, 7u);

    BOOST_CHECK_EQUAL(std::string(GetLogCategoryName(LogCategory::FARMING)), "FARMING");
    BOOST_CHECK_EQUAL(std::string(GetLogCategoryName(LogCategory::ALL)), "");
}

BOOST_AUTO_TEST_CASE(log_line_format) {
    std::string line = FormatLogLine(LogCategory::CONSENSUS, LogLevel::LVL_WARN, "reorg");
    BOOST_CHECK(line.find(" [WARN] [CONSENSUS] reorg") != std::string::npos);
    BOOST_CHECK_EQUAL(line.find(" [WARN]"), 19u);

    line = FormatLogLine(LogCategory::ALL, LogLevel::LVL_INFO, "started");
    BOOST_CHECK(line.find(" [INFO] started") != std::string::npos);
}

BOOST_FIXTURE_TEST_CASE(filters_by_level_and_category, LoggingSetup) {
    TestDirectory dir("logging");
    CLoggingConfig& config = CLoggingConfig::GetInstance();
    config.SetLogLevel(LogLevel::LVL_INFO);
    config.SetCategories(static_cast<uint32_t>(LogCategory::NET));
    config.SetLogFile("debug.log");
    BOOST_REQUIRE(CLogger::GetInstance().Initialize(dir.Path()));

    LogPrintNet(INFO, "relay %d", 1);
    LogPrintNet(DEBUG, "relay %d", 2);
    LogPrintPlot(INFO, "plotted %d", 3);
    LogPrintf(ALL, INFO, "node %d", 4);
    CLogger::GetInstance().Shutdown();

    std::string contents = ReadFile(dir.Sub("debug.log"));
    BOOST_CHECK(contents.find("[NET] relay 1") != std::string::npos);
    BOOST_CHECK(contents.find("relay 2") == std::string::npos);
    BOOST_CHECK(contents.find("plotted 3") == std::string::npos);
    BOOST_CHECK(contents.find("node 4") != std::string::npos);
}

BOOST_FIXTURE_TEST_CASE(log_file_rotates, LoggingSetup) {
    TestDirectory dir("logging");
    CLoggingConfig& config = CLoggingConfig::GetInstance();
    config.SetLogLevel(LogLevel::LVL_INFO);
    config.SetCategories(static_cast<uint32_t>(LogCategory::ALL));
    config.SetRotation(200, 2);
    config.SetLogFile(dir.Sub("debug.log"));
    BOOST_REQUIRE(CLogger::GetInstance().Initialize(""));

    for (int i = 0; i < 20; i++) {
        LogPrintPlot(INFO, "piece %d encoded", i);
    }
    CLogger::GetInstance().Shutdown();

    BOOST_CHECK(std::filesystem::exists(dir.Sub("debug.log")));
    BOOST_CHECK(std::filesystem::exists(dir.Sub("debug.log.1")));
    BOOST_CHECK(std::filesystem::exists(dir.Sub("debug.log.2")));
    BOOST_CHECK(!std::filesystem::exists(dir.Sub("debug.log.3")));
    BOOST_CHECK(std::filesystem::file_size(dir.Sub("debug.log")) < 400u);

    // The newest line is always in the live file
    BOOST_CHECK(ReadFile(dir.Sub("debug.log")).find("piece 19 encoded") != std::string::npos);
}

BOOST_FIXTURE_TEST_CASE(unwritable_log_file, LoggingSetup) {
    TestDirectory dir("logging");
    CLoggingConfig::GetInstance().SetLogFile(dir.Sub("missing/debug.log"));
    BOOST_CHECK(!CLogger::GetInstance().Initialize(""));

    // Console-only logging keeps working
    LogPrintConsensus(ERROR, "still alive");
}

BOOST_AUTO_TEST_SUITE_END()
