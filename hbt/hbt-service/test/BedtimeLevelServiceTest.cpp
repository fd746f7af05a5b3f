// Test: BedtimeLevelService against a temporary database

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>
#include <spdlog/sinks/null_sink.h>

#include "hbt-core/src/EstimatorErrors.hpp"
#include "hbt-core/src/Timestamp.hpp"
#include "hbt-db/src/ConsumptionEventStore.hpp"
#include "hbt-db/src/HabitStore.hpp"
#include "hbt-db/src/LevelStore.hpp"
#include "hbt-service/src/BedtimeLevelService.hpp"

namespace hbt_service
{
namespace test
{

using namespace std::chrono_literals;

static hbt_core::Timestamp at(std::string_view iso)
{
  return hbt_core::parseTimestamp(iso).value();
}

static hbt_core::LocalDate const kLoggedDate{std::chrono::year{2024} / 3 / 10};

class BedtimeLevelServiceTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    auto nullSink = std::make_shared<spdlog::sinks::null_sink_mt>();
    logger = std::make_shared<spdlog::logger>("test_service", nullSink);

    dbPath = "test_service_" +
             std::to_string(
               std::chrono::steady_clock::now().time_since_epoch().count()) +
             ".db";
    db = std::make_unique<cpp_sqlite::Database>(dbPath, true);

    hbt_db::HabitStore habits{*db, logger};
    habits.insert(habit("caffeine", "drug", "mg", 5.0));
    habits.insert(habit("alcohol", "quick_consumption", "drinks", 1.0));
    habits.insert(habit("sleep", "time", "h", 0.0));
    habits.insert(habit("unset", "drug", "mg", 0.0));
  }

  void TearDown() override
  {
    db.reset();
    for (const char* suffix : {"", "-wal", "-shm", "-journal"})
    {
      std::filesystem::remove(dbPath + suffix);
    }
  }

  static hbt_transfer::HabitRecord habit(const char* id,
                                         const char* type,
                                         const char* unit,
                                         double halfLife)
  {
    hbt_transfer::HabitRecord record{};
    record.habit_id = id;
    record.user_id = "user-1";
    record.name = id;
    record.type = type;
    record.unit = unit;
    record.half_life_hours = halfLife;
    return record;
  }

  void logEvent(const char* id,
                const char* consumedAt,
                double amount,
                const char* habitId = "caffeine")
  {
    hbt_transfer::ConsumptionEventRecord record{};
    record.event_id = id;
    record.user_id = "user-1";
    record.habit_id = habitId;
    record.consumed_at = consumedAt;
    record.amount = amount;
    hbt_db::ConsumptionEventStore{*db, logger}.insert(record);
  }

  std::shared_ptr<spdlog::logger> logger;
  std::string dbPath;
  std::unique_ptr<cpp_sqlite::Database> db;
};

// ========== computeForDate ==========

TEST_F(BedtimeLevelServiceTest, DefaultBedtime_MatchesHandComputedLevel)
{
  logEvent("morning", "2024-03-10T12:00:00Z", 100.0);
  logEvent("evening", "2024-03-10T20:00:00Z", 50.0);

  BedtimeLevelService service{*db, logger};
  auto const daily = service.computeForDate(
    "user-1", "caffeine", kLoggedDate, std::nullopt, at("2024-03-11T09:00:00Z"));

  EXPECT_EQ(daily.habitId, "caffeine");
  EXPECT_EQ(daily.referenceInstant, at("2024-03-10T22:00:00Z"));
  EXPECT_NEAR(daily.level, 62.8929, 1e-3);
  EXPECT_EQ(daily.unit, "mg");
  EXPECT_TRUE(daily.usedDefaultClockTime);
  EXPECT_FALSE(daily.projected);
  EXPECT_TRUE(daily.hasLoggedEvents);
  EXPECT_EQ(daily.includedEvents.size(), 2u);
  EXPECT_TRUE(daily.rejectedEvents.empty());
}

TEST_F(BedtimeLevelServiceTest, HabitualClockTime_MovesReferenceInstant)
{
  logEvent("evening", "2024-03-10T20:00:00Z", 50.0);

  BedtimeLevelService service{*db, logger};
  auto const daily = service.computeForDate("user-1",
                                            "caffeine",
                                            kLoggedDate,
                                            std::string_view{"01:00"},
                                            at("2024-03-11T09:00:00Z"));

  // 01:00 belongs to the night of the logged date: five hours after 20:00
  EXPECT_EQ(daily.referenceInstant, at("2024-03-11T01:00:00Z"));
  EXPECT_NEAR(daily.level, 25.0, 1e-9);
  EXPECT_FALSE(daily.usedDefaultClockTime);
}

TEST_F(BedtimeLevelServiceTest, EventsBeforeLookbackWindow_AreIgnored)
{
  // Lookback for h = 5 h is three days before 2024-03-10T22:00Z
  logEvent("ancient", "2024-03-07T21:59:00Z", 10000.0);
  logEvent("recent", "2024-03-10T17:00:00Z", 80.0);

  BedtimeLevelService service{*db, logger};
  auto const daily = service.computeForDate(
    "user-1", "caffeine", kLoggedDate, std::nullopt, at("2024-03-11T09:00:00Z"));

  EXPECT_NEAR(daily.level, 40.0, 1e-9);
  EXPECT_EQ(daily.includedEvents.size(), 1u);
}

TEST_F(BedtimeLevelServiceTest, EventsAfterReferenceInstant_AreIgnored)
{
  logEvent("dose", "2024-03-10T17:00:00Z", 80.0);
  logEvent("night", "2024-03-10T23:00:00Z", 200.0);

  BedtimeLevelService service{*db, logger};
  auto const daily = service.computeForDate(
    "user-1", "caffeine", kLoggedDate, std::nullopt, at("2024-03-11T09:00:00Z"));

  EXPECT_NEAR(daily.level, 40.0, 1e-9);
}

TEST_F(BedtimeLevelServiceTest, LaterBedtimeToday_IsProjected)
{
  logEvent("dose", "2024-03-10T08:00:00Z", 80.0);

  BedtimeLevelService service{*db, logger};
  auto const daily = service.computeForDate(
    "user-1", "caffeine", kLoggedDate, std::nullopt, at("2024-03-10T09:00:00Z"));

  EXPECT_TRUE(daily.projected);
  // 14 h after the dose
  EXPECT_NEAR(daily.level, 80.0 * std::exp2(-14.0 / 5.0), 1e-9);
}

TEST_F(BedtimeLevelServiceTest, ZeroLog_IsDistinguishableFromNoLog)
{
  BedtimeLevelService service{*db, logger};
  auto const now = at("2024-03-12T09:00:00Z");

  auto const nothing = service.computeForDate(
    "user-1", "caffeine", kLoggedDate, std::nullopt, now);
  EXPECT_DOUBLE_EQ(nothing.level, 0.0);
  EXPECT_FALSE(nothing.hasLoggedEvents);

  logEvent("none", "2024-03-10T12:00:00Z", 0.0);
  auto const explicitZero = service.computeForDate(
    "user-1", "caffeine", kLoggedDate, std::nullopt, now);
  EXPECT_DOUBLE_EQ(explicitZero.level, 0.0);
  EXPECT_TRUE(explicitZero.hasLoggedEvents);
}

TEST_F(BedtimeLevelServiceTest, UnparsableStoredEvent_IsReportedNotFatal)
{
  hbt_transfer::ConsumptionEventRecord legacy{};
  legacy.event_id = "legacy";
  legacy.user_id = "user-1";
  legacy.habit_id = "caffeine";
  legacy.consumed_at = "the other day";
  legacy.amount = 100.0;
  hbt_db::ConsumptionEventStore{*db, logger}.importRecord(legacy);
  logEvent("dose", "2024-03-10T17:00:00Z", 80.0);

  BedtimeLevelService service{*db, logger};
  auto const daily = service.computeForDate(
    "user-1", "caffeine", kLoggedDate, std::nullopt, at("2024-03-11T09:00:00Z"));

  EXPECT_NEAR(daily.level, 40.0, 1e-9);
  ASSERT_EQ(daily.rejectedEvents.size(), 1u);
  EXPECT_EQ(daily.rejectedEvents[0].eventId, "legacy");
  EXPECT_EQ(daily.rejectedEvents[0].reason,
            hbt_core::EventRejection::UnparsableTimestamp);
}

TEST_F(BedtimeLevelServiceTest, UtcOffset_DefinesLoggedDay)
{
  BedtimeLevelService::Config config;
  config.resolver.utcOffset = 120min;
  BedtimeLevelService service{*db, logger, config};

  // 23:30Z on the 9th is already the 10th at +02:00
  logEvent("late", "2024-03-09T23:30:00Z", 50.0);

  auto const daily = service.computeForDate(
    "user-1", "caffeine", kLoggedDate, std::nullopt, at("2024-03-12T09:00:00Z"));

  EXPECT_EQ(daily.referenceInstant, at("2024-03-10T22:00:00+02:00"));
  EXPECT_TRUE(daily.hasLoggedEvents);
}

// ========== Configuration errors ==========

TEST_F(BedtimeLevelServiceTest, UnknownHabit_Throws)
{
  BedtimeLevelService service{*db, logger};
  EXPECT_THROW((void)service.computeForDate("user-1",
                                            "nicotine",
                                            kLoggedDate,
                                            std::nullopt,
                                            at("2024-03-11T09:00:00Z")),
               std::runtime_error);
}

TEST_F(BedtimeLevelServiceTest, OtherUsersHabit_Throws)
{
  BedtimeLevelService service{*db, logger};
  EXPECT_THROW((void)service.computeForDate("user-2",
                                            "caffeine",
                                            kLoggedDate,
                                            std::nullopt,
                                            at("2024-03-11T09:00:00Z")),
               std::runtime_error);
}

TEST_F(BedtimeLevelServiceTest, HabitWithoutDecay_Throws)
{
  BedtimeLevelService service{*db, logger};
  EXPECT_THROW((void)service.computeForDate("user-1",
                                            "sleep",
                                            kLoggedDate,
                                            std::nullopt,
                                            at("2024-03-11T09:00:00Z")),
               hbt_core::InvalidConfiguration);
}

TEST_F(BedtimeLevelServiceTest, MissingHalfLife_ThrowsEvenWithoutEvents)
{
  BedtimeLevelService service{*db, logger};
  EXPECT_THROW((void)service.computeForDate("user-1",
                                            "unset",
                                            kLoggedDate,
                                            std::nullopt,
                                            at("2024-03-11T09:00:00Z")),
               hbt_core::InvalidConfiguration);
}

TEST_F(BedtimeLevelServiceTest, HalfLifeChange_AppliesToNextCall)
{
  logEvent("dose", "2024-03-10T17:00:00Z", 80.0);
  BedtimeLevelService service{*db, logger};
  auto const now = at("2024-03-11T09:00:00Z");

  auto const before =
    service.computeForDate("user-1", "caffeine", kLoggedDate, std::nullopt, now);

  auto changed = habit("caffeine", "drug", "mg", 2.5);
  ASSERT_TRUE(hbt_db::HabitStore{*db, logger}.update(changed));

  auto const after =
    service.computeForDate("user-1", "caffeine", kLoggedDate, std::nullopt, now);

  EXPECT_NEAR(before.level, 40.0, 1e-9);
  EXPECT_NEAR(after.level, 20.0, 1e-9);
}

TEST_F(BedtimeLevelServiceTest, NullLogger_Throws)
{
  EXPECT_THROW((void)BedtimeLevelService(*db, nullptr), std::invalid_argument);
}

// ========== persist ==========

TEST_F(BedtimeLevelServiceTest, Persist_WritesDailyLevel)
{
  logEvent("dose", "2024-03-10T17:00:00Z", 80.0);
  BedtimeLevelService service{*db, logger};
  auto const now = at("2024-03-11T09:00:00Z");

  auto const daily =
    service.computeForDate("user-1", "caffeine", kLoggedDate, std::nullopt, now);
  service.persist("user-1", daily, now);

  auto const stored =
    hbt_db::LevelStore{*db, logger}.find("user-1", "caffeine", "2024-03-10");
  ASSERT_TRUE(stored.has_value());
  EXPECT_NEAR(stored->level_value, 40.0, 1e-9);
  EXPECT_EQ(stored->unit, "mg");
  EXPECT_EQ(stored->calculated_at, "2024-03-11T09:00:00.000Z");
}

// ========== timeline ==========

TEST_F(BedtimeLevelServiceTest, Timeline_IncludesDosesBeforeStart)
{
  logEvent("dose", "2024-03-10T06:00:00Z", 100.0);
  BedtimeLevelService service{*db, logger};

  auto const samples = service.timeline("user-1",
                                        "caffeine",
                                        at("2024-03-10T11:00:00Z"),
                                        at("2024-03-10T16:00:00Z"),
                                        60min);

  ASSERT_EQ(samples.size(), 6u);
  EXPECT_NEAR(samples.front().level, 50.0, 1e-9);
  EXPECT_NEAR(samples.back().level, 25.0, 1e-9);
}

TEST_F(BedtimeLevelServiceTest, Timeline_EndBeforeStartIsEmpty)
{
  BedtimeLevelService service{*db, logger};
  EXPECT_TRUE(service
                .timeline("user-1",
                          "caffeine",
                          at("2024-03-10T16:00:00Z"),
                          at("2024-03-10T11:00:00Z"))
                .empty());
}

}  // namespace test
}  // namespace hbt_service
