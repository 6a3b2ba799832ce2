#include "mdview/common/Logger.hpp"

#include "MdviewTestHelpers.hpp"

#include <gtest/gtest.h>

namespace mdview::common {
namespace {

TEST(LoggerTest, WritesTaggedLinesToLogFile) {
    test_helpers::ScopedTempDir dir("mdview-logger");
    const auto logPath = dir.path() / "debug.log";

    Logger::init({.verbose = false, .logFile = logPath});
    Logger::log("read 4 bytes");
    Logger::logError("render: sink closed");
    Logger::shutdown();

    const auto text = test_helpers::readFile(logPath);
    EXPECT_NE(text.find("=== mdview startup"), std::string::npos);
    EXPECT_NE(text.find("[INFO ]"), std::string::npos);
    EXPECT_NE(text.find("read 4 bytes"), std::string::npos);
    EXPECT_NE(text.find("[ERROR]"), std::string::npos);
    EXPECT_NE(text.find("render: sink closed"), std::string::npos);
    EXPECT_NE(text.find("=== mdview shutdown"), std::string::npos);
}

TEST(LoggerTest, AppendsAcrossRuns) {
    test_helpers::ScopedTempDir dir("mdview-logger-append");
    const auto logPath = dir.path() / "debug.log";

    Logger::init({.logFile = logPath});
    Logger::log("first run");
    Logger::shutdown();
    Logger::init({.logFile = logPath});
    Logger::log("second run");
    Logger::shutdown();

    const auto text = test_helpers::readFile(logPath);
    EXPECT_LT(text.find("first run"), text.find("second run"));
}

}  // namespace
}  // namespace mdview::common
