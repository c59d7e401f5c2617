//===----------------------------------------------------------------------===//
//
// Part of the Pixart project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_log.cpp
// Purpose: Verify logger level filtering, line format and level parsing.
// Key invariants: Lines look like "[LEVEL] HH:MM:SS message".
// Ownership/Lifetime: Test installs a local stream and restores stderr.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "support/log.hpp"

#include <regex>
#include <sstream>

using pixart::support::Logger;
using pixart::support::LogLevel;
using pixart::support::parseLogLevel;

namespace
{
/// @brief Redirects the shared logger for the lifetime of a test.
class CapturedLog
{
  public:
    explicit CapturedLog(LogLevel level)
    {
        Logger::instance().setStream(&buffer_);
        Logger::instance().setLevel(level);
    }

    ~CapturedLog()
    {
        Logger::instance().setStream(nullptr);
        Logger::instance().setLevel(LogLevel::Info);
    }

    std::string text() const
    {
        return buffer_.str();
    }

  private:
    std::ostringstream buffer_;
};
} // namespace

TEST(Logger, FiltersBelowThreshold)
{
    CapturedLog log(LogLevel::Warn);
    Logger::instance().debug("hidden debug");
    Logger::instance().info("hidden info");
    Logger::instance().warn("shown warn");
    Logger::instance().error("shown error");

    const std::string text = log.text();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("shown warn"), std::string::npos);
    EXPECT_NE(text.find("shown error"), std::string::npos);
}

TEST(Logger, FormatsLevelAndTimestamp)
{
    CapturedLog log(LogLevel::Debug);
    Logger::instance().debug("glyph lookup");
    const std::regex line(R"(\[DEBUG\] \d{2}:\d{2}:\d{2} glyph lookup\n)");
    EXPECT_TRUE(std::regex_match(log.text(), line)) << log.text();
}

TEST(Logger, OffSilencesEverything)
{
    CapturedLog log(LogLevel::Off);
    Logger::instance().error("nothing");
    EXPECT_TRUE(log.text().empty());
    EXPECT_FALSE(Logger::instance().enabled(LogLevel::Error));
    EXPECT_FALSE(Logger::instance().enabled(LogLevel::Off));
}

TEST(Logger, ParsesLevelNames)
{
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
