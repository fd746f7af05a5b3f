// Test: level bands and display formatting

#include <gtest/gtest.h>

#include <limits>
#include <vector>

#include "hbt-core/src/ConsumptionEvent.hpp"
#include "hbt-core/src/LevelClassification.hpp"
#include "hbt-core/src/Timestamp.hpp"

namespace hbt_core
{
namespace test
{

TEST(LevelClassification, NothingLeft_IsLow)
{
  EXPECT_EQ(classifyLevel(0.0, 100.0), LevelBand::Low);
  EXPECT_EQ(classifyLevel(-1.0, 100.0), LevelBand::Low);
}

TEST(LevelClassification, UpToThirtyPercentOfTypicalDose_IsModerate)
{
  EXPECT_EQ(classifyLevel(0.01, 100.0), LevelBand::Moderate);
  EXPECT_EQ(classifyLevel(30.0, 100.0), LevelBand::Moderate);
}

TEST(LevelClassification, AboveThirtyPercentOfTypicalDose_IsHigh)
{
  EXPECT_EQ(classifyLevel(30.5, 100.0), LevelBand::High);
  // Without a typical dose any residue counts as high
  EXPECT_EQ(classifyLevel(1.0, 0.0), LevelBand::High);
}

TEST(LevelClassification, TypicalDose_IsMeanOfValidEvents)
{
  Timestamp const t = parseTimestamp("2024-03-10T08:00:00Z").value();
  std::vector<ConsumptionEvent> const events{
    ConsumptionEvent{"a", "caffeine", t, 100.0},
    ConsumptionEvent{"b", "caffeine", t, 50.0},
    ConsumptionEvent{"c", "caffeine", t, -20.0},
    ConsumptionEvent{"d", "caffeine", t, 0.0}};

  EXPECT_DOUBLE_EQ(typicalDose(events), 50.0);
}

TEST(LevelClassification, TypicalDose_NoEventsIsZero)
{
  std::vector<ConsumptionEvent> const events;
  EXPECT_DOUBLE_EQ(typicalDose(events), 0.0);
}

TEST(LevelClassification, FormatLevel_RoundsToDecimals)
{
  EXPECT_EQ(formatLevel(62.8929, "mg"), "62.9 mg");
  EXPECT_EQ(formatLevel(62.8929, "mg", 0), "63 mg");
  EXPECT_EQ(formatLevel(1.5, "drinks", 2), "1.50 drinks");
}

TEST(LevelClassification, FormatLevel_NonFiniteShowsZero)
{
  EXPECT_EQ(formatLevel(std::numeric_limits<double>::quiet_NaN(), "mg"),
            "0 mg");
}

TEST(LevelClassification, BandNames)
{
  EXPECT_STREQ(toString(LevelBand::Low), "Low");
  EXPECT_STREQ(toString(LevelBand::Moderate), "Moderate");
  EXPECT_STREQ(toString(LevelBand::High), "High");
}

}  // namespace test
}  // namespace hbt_core
