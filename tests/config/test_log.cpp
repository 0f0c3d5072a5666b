/**
 * @file test_log.cpp
 * @brief Log level filtering and sink replacement tests
 */

#include "linkdiff/log.hpp"

#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

namespace linkdiff::log::test {

namespace {

class LogTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        set_level(Level::kWarn);
        set_sink([this](Level level, std::string_view message) { m_lines.emplace_back(level, std::string(message)); });
    }

    void TearDown() override
    {
        set_sink({});
        set_level(Level::kWarn);
    }

    std::vector<std::pair<Level, std::string>> m_lines;
};

}  // namespace

TEST(LogLevel, Names)
{
    EXPECT_EQ(level_name(Level::kDebug), "debug");
    EXPECT_EQ(level_name(Level::kOff), "off");
    EXPECT_EQ(parse_level("info"), Level::kInfo);
    EXPECT_EQ(parse_level("error"), Level::kError);
    EXPECT_FALSE(parse_level("INFO").has_value());
    EXPECT_FALSE(parse_level("trace").has_value());
}

TEST(LogFormat, StderrLineCarriesProgramAndLevel)
{
    EXPECT_EQ(format_line(Level::kWarn, "cache disabled"), "[linkdiff][warn] cache disabled");
    EXPECT_EQ(format_line(Level::kDebug, "x = {}"), "[linkdiff][debug] x = {}");
    EXPECT_EQ(format_line(Level::kError, ""), "[linkdiff][error] ");
}

TEST_F(LogTest, FiltersBelowLevel)
{
    debug("hidden");
    info("hidden");
    warn("shown");
    error("also shown");

    ASSERT_EQ(m_lines.size(), 2U);
    EXPECT_EQ(m_lines[0].first, Level::kWarn);
    EXPECT_EQ(m_lines[0].second, "shown");
    EXPECT_EQ(m_lines[1].first, Level::kError);
}

TEST_F(LogTest, DebugLevelShowsEverything)
{
    set_level(Level::kDebug);
    EXPECT_TRUE(enabled(Level::kDebug));
    debug("one");
    info("two");
    EXPECT_EQ(m_lines.size(), 2U);
}

TEST_F(LogTest, OffSilencesEverything)
{
    set_level(Level::kOff);
    EXPECT_EQ(level(), Level::kOff);
    EXPECT_FALSE(enabled(Level::kError));
    error("dropped");
    EXPECT_TRUE(m_lines.empty());
}

TEST_F(LogTest, OffIsNotAMessageLevel)
{
    set_level(Level::kDebug);
    write(Level::kOff, "never");
    EXPECT_TRUE(m_lines.empty());
}

}  // namespace linkdiff::log::test
