#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "TimeFormatter.hpp"
#include <stdexcept>

using namespace uptime;
using namespace std::chrono_literals;
using ::testing::MatchesRegex;

class TimeFormatterTest : public ::testing::Test {
protected:
    TimeFormatter time_;
};

TEST_F(TimeFormatterTest, DefaultFormats) {
    EXPECT_EQ(time_.datetimeFormat(), "%Y-%m-%d %H:%M:%S");
    EXPECT_EQ(time_.dateFormat(), "%Y-%m-%d");
}

TEST_F(TimeFormatterTest, ParseAndFormatDatetime) {
    auto tp = time_.fromString("2026-10-18 09:15:30");

    EXPECT_EQ(time_.toString(tp), "2026-10-18 09:15:30");
    EXPECT_EQ(time_.toString(tp, true), "2026-10-18");
}

TEST_F(TimeFormatterTest, SqlModeAppendsMilliseconds) {
    auto tp = time_.fromString("2026-10-18 09:15:30") + 42ms;

    EXPECT_EQ(time_.toString(tp, false, true), "2026-10-18 09:15:30.042");
    EXPECT_EQ(time_.toString(tp, true, true), "2026-10-18");
}

TEST_F(TimeFormatterTest, ParseFractionalSeconds) {
    auto base = time_.fromString("2026-10-18 09:15:30");

    EXPECT_EQ(time_.fromString("2026-10-18 09:15:30.250") - base, 250ms);
    EXPECT_EQ(time_.fromString("2026-10-18 09:15:30.5") - base, 500ms);
}

TEST_F(TimeFormatterTest, ParseDateOnly) {
    auto day = time_.fromString("2026-10-18", true);
    auto morning = time_.fromString("2026-10-18 00:00:00");

    EXPECT_EQ(day, morning);
}

TEST_F(TimeFormatterTest, RejectsMalformedInput) {
    EXPECT_THROW(time_.fromString("yesterday"), std::invalid_argument);
    EXPECT_THROW(time_.fromString("2026-10-18"), std::invalid_argument);
    EXPECT_THROW(time_.fromString("2026-10-18 09:15:30 UTC"), std::invalid_argument);
    EXPECT_THROW(time_.fromString("2026-10-18 09:15:30.1234"), std::invalid_argument);
    EXPECT_THROW(time_.fromString("2026-10-18 09:15:30."), std::invalid_argument);
}

TEST_F(TimeFormatterTest, CustomFormats) {
    TimeFormatter time("%d/%m/%Y %H:%M", "%d/%m/%Y");
    auto tp = time.fromString("18/10/2026 07:05");

    EXPECT_EQ(time.toString(tp), "18/10/2026 07:05");
    EXPECT_EQ(time.toString(tp, true), "18/10/2026");
    EXPECT_EQ(time_.toString(tp), "2026-10-18 07:05:00");
}

TEST_F(TimeFormatterTest, CurrentValues) {
    EXPECT_THAT(time_.nowValue(),
                MatchesRegex("[0-9]{4}-[0-9]{2}-[0-9]{2} [0-9]{2}:[0-9]{2}:[0-9]{2}"));
    EXPECT_THAT(time_.currentDateValue(), MatchesRegex("[0-9]{4}-[0-9]{2}-[0-9]{2}"));
    EXPECT_NO_THROW(time_.fromString(time_.nowValue()));
}
