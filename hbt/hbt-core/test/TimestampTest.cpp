// Test: timestamp, date and clock time parsing

#include <gtest/gtest.h>

#include <chrono>

#include "hbt-core/src/Timestamp.hpp"

namespace hbt_core
{
namespace test
{

using namespace std::chrono_literals;

static Timestamp const kTenPm{
  Timestamp{std::chrono::sys_days{std::chrono::year{2024} / 3 / 10}} + 22h};

// ========== parseTimestamp ==========

TEST(Timestamp, Parse_UtcDesignator)
{
  EXPECT_EQ(parseTimestamp("2024-03-10T22:00:00Z"), kTenPm);
  EXPECT_EQ(parseTimestamp("2024-03-10t22:00:00z"), kTenPm);
}

TEST(Timestamp, Parse_NumericOffsets)
{
  EXPECT_EQ(parseTimestamp("2024-03-10T23:00:00+01:00"), kTenPm);
  EXPECT_EQ(parseTimestamp("2024-03-10T23:00:00+0100"), kTenPm);
  EXPECT_EQ(parseTimestamp("2024-03-10T23:00:00+01"), kTenPm);
  EXPECT_EQ(parseTimestamp("2024-03-10T16:30:00-05:30"), kTenPm);
}

TEST(Timestamp, Parse_SpaceSeparatorAndMissingSeconds)
{
  EXPECT_EQ(parseTimestamp("2024-03-10 22:00Z"), kTenPm);
}

TEST(Timestamp, Parse_FractionalSecondsTruncatedToMilliseconds)
{
  EXPECT_EQ(parseTimestamp("2024-03-10T22:00:00.5Z"), kTenPm + 500ms);
  EXPECT_EQ(parseTimestamp("2024-03-10T22:00:00.123456Z"), kTenPm + 123ms);
}

TEST(Timestamp, Parse_OffsetCrossesMidnight)
{
  EXPECT_EQ(parseTimestamp("2024-03-11T01:00:00+03:00"), kTenPm);
}

TEST(Timestamp, Parse_RejectsMalformedText)
{
  EXPECT_FALSE(parseTimestamp("2024-03-10T22:00:00").has_value());
  EXPECT_FALSE(parseTimestamp("").has_value());
  EXPECT_FALSE(parseTimestamp("last night").has_value());
  EXPECT_FALSE(parseTimestamp("2024-02-30T22:00:00Z").has_value());
  EXPECT_FALSE(parseTimestamp("2024-03-10T24:00:00Z").has_value());
  EXPECT_FALSE(parseTimestamp("2024-03-10T22:60:00Z").has_value());
  EXPECT_FALSE(parseTimestamp("2024-03-10T22:00:00Zextra").has_value());
  EXPECT_FALSE(parseTimestamp("2024-03-10T22:00:00.Z").has_value());
  EXPECT_FALSE(parseTimestamp("2024-03-10T22:00:00+1").has_value());
}

// ========== formatTimestamp ==========

TEST(Timestamp, Format_IsUtcWithMilliseconds)
{
  EXPECT_EQ(formatTimestamp(kTenPm), "2024-03-10T22:00:00.000Z");
  EXPECT_EQ(formatTimestamp(parseTimestamp("2024-03-10T23:05:09.250+01:00")
                              .value()),
            "2024-03-10T22:05:09.250Z");
}

// ========== Dates and clock times ==========

TEST(Timestamp, ParseDate_AcceptsCalendarDates)
{
  auto const date = parseDate("2024-02-29");
  ASSERT_TRUE(date.has_value());
  EXPECT_EQ(*date, std::chrono::year{2024} / 2 / 29);
  EXPECT_EQ(formatDate(*date), "2024-02-29");
}

TEST(Timestamp, ParseDate_RejectsInvalidDates)
{
  EXPECT_FALSE(parseDate("2023-02-29").has_value());
  EXPECT_FALSE(parseDate("2024-3-1").has_value());
  EXPECT_FALSE(parseDate("2024-03-01T00:00Z").has_value());
}

TEST(Timestamp, ParseClockTime_HoursMinutesSeconds)
{
  EXPECT_EQ(parseClockTime("07:05"), 7h + 5min);
  EXPECT_EQ(parseClockTime("23:59:59"), 23h + 59min + 59s);
  EXPECT_EQ(parseClockTime("00:00"), 0s);
}

TEST(Timestamp, ParseClockTime_RejectsOutOfRange)
{
  EXPECT_FALSE(parseClockTime("24:00").has_value());
  EXPECT_FALSE(parseClockTime("23:60").has_value());
  EXPECT_FALSE(parseClockTime("7:05").has_value());
  EXPECT_FALSE(parseClockTime("07:05:").has_value());
}

// ========== Arithmetic ==========

TEST(Timestamp, HoursBetween_IsSigned)
{
  EXPECT_DOUBLE_EQ(hoursBetween(kTenPm, kTenPm + 90min), 1.5);
  EXPECT_DOUBLE_EQ(hoursBetween(kTenPm + 90min, kTenPm), -1.5);
}

TEST(Timestamp, LocalDateOf_AppliesOffset)
{
  Timestamp const lateEvening = kTenPm + 90min;  // 23:30Z

  EXPECT_EQ(localDateOf(lateEvening, 0min), std::chrono::year{2024} / 3 / 10);
  EXPECT_EQ(localDateOf(lateEvening, 60min), std::chrono::year{2024} / 3 / 11);
  EXPECT_EQ(localDateOf(lateEvening, -60min),
            std::chrono::year{2024} / 3 / 10);
}

}  // namespace test
}  // namespace hbt_core
