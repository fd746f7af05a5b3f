#include "hbt-service/src/BedtimeLevelService.hpp"

#include <stdexcept>
#include <utility>

#include "hbt-core/src/LevelEstimator.hpp"
#include "hbt-transfer/src/DrugLevelRecord.hpp"

namespace hbt_service
{

namespace
{

std::shared_ptr<spdlog::logger> requireLogger(
  std::shared_ptr<spdlog::logger> logger)
{
  if (!logger)
  {
    throw std::invalid_argument("BedtimeLevelService requires a logger");
  }
  return logger;
}

}  // namespace

BedtimeLevelService::BedtimeLevelService(
  cpp_sqlite::Database& db,
  std::shared_ptr<spdlog::logger> logger)
  : BedtimeLevelService{db, std::move(logger), Config{}}
{
}

BedtimeLevelService::BedtimeLevelService(
  cpp_sqlite::Database& db,
  std::shared_ptr<spdlog::logger> logger,
  const Config& config)
  : config_{config},
    logger_{requireLogger(std::move(logger))},
    resolver_{config.resolver},
    habits_{db, logger_},
    events_{db, logger_},
    levels_{db, logger_}
{
}

BedtimeLevelService::LoadedHabit BedtimeLevelService::loadHabit(
  const std::string& userId,
  const std::string& habitId)
{
  auto const habit = habits_.findById(habitId);
  if (!habit || habit->user_id != userId)
  {
    throw std::runtime_error("Habit '" + habitId + "' not found for user '" +
                             userId + "'");
  }

  auto const type = hbt_db::parseHabitType(habit->type);
  if (!type || !hbt_db::tracksDecay(*type))
  {
    throw hbt_core::InvalidConfiguration("Habit '" + habitId + "' of type '" +
                                         habit->type +
                                         "' does not track decay");
  }

  // A stored half-life of 0 means none has been configured
  std::optional<double> halfLifeHours;
  if (habit->half_life_hours != 0.0)
  {
    halfLifeHours = habit->half_life_hours;
  }

  return LoadedHabit{hbt_core::HabitDecayProfile::fromConfiguration(
                       halfLifeHours, habit->drug_threshold_percent),
                     habit->unit};
}

void BedtimeLevelService::reportRejections(
  const std::string& habitId,
  const std::vector<hbt_core::RejectedEvent>& rejected)
{
  for (const auto& rejection : rejected)
  {
    logger_->warn("Habit {}: skipped event {} ({}: {})",
                  habitId,
                  rejection.eventId,
                  hbt_core::toString(rejection.reason),
                  rejection.detail);
  }
}

DailyLevel BedtimeLevelService::computeForDate(
  const std::string& userId,
  const std::string& habitId,
  hbt_core::LocalDate loggedDate,
  std::optional<std::string_view> habitualClockTime,
  hbt_core::Timestamp now)
{
  LoadedHabit const habit = loadHabit(userId, habitId);

  auto const resolution =
    resolver_.resolve(loggedDate, habitualClockTime, now);
  if (resolution.usedDefaultClockTime)
  {
    logger_->info("Habit {}: no usable clock time for {}, using default",
                  habitId,
                  hbt_core::formatDate(loggedDate));
  }

  int const days =
    hbt_core::LookbackWindowPolicy::lookbackDays(habit.profile,
                                                 config_.lookbackMode);
  auto const window =
    hbt_core::LookbackWindowPolicy::window(resolution.instant, days);

  auto const records =
    events_.findInRange(userId, habitId, window.from, window.to);
  auto estimate = hbt_core::LevelEstimator::estimateFromRecords(
    records, resolution.instant, habit.profile.halfLifeHours());
  reportRejections(habitId, estimate.rejectedEvents);

  // The logged date as a local calendar day
  auto const dayStart =
    hbt_core::Timestamp{std::chrono::sys_days{loggedDate}} -
    config_.resolver.utcOffset;
  auto const dayEnd =
    dayStart + std::chrono::days{1} - std::chrono::milliseconds{1};

  DailyLevel result{};
  result.habitId = habitId;
  result.date = loggedDate;
  result.level = estimate.level;
  result.unit = habit.unit;
  result.referenceInstant = resolution.instant;
  result.usedDefaultClockTime = resolution.usedDefaultClockTime;
  result.projected = resolution.projected;
  result.hasLoggedEvents =
    events_.hasEventsInRange(userId, habitId, dayStart, dayEnd);
  result.includedEvents = std::move(estimate.includedEvents);
  result.rejectedEvents = std::move(estimate.rejectedEvents);

  logger_->debug("Habit {}: level {} {} at {} from {} events over {} days",
                 habitId,
                 result.level,
                 result.unit,
                 hbt_core::formatTimestamp(result.referenceInstant),
                 result.includedEvents.size(),
                 days);
  return result;
}

void BedtimeLevelService::persist(const std::string& userId,
                                  const DailyLevel& level,
                                  hbt_core::Timestamp calculatedAt)
{
  hbt_transfer::DrugLevelRecord record{};
  record.user_id = userId;
  record.habit_id = level.habitId;
  record.date = hbt_core::formatDate(level.date);
  record.level_value = level.level;
  record.unit = level.unit;
  record.calculated_at = hbt_core::formatTimestamp(calculatedAt);
  levels_.upsert(record);
}

std::vector<hbt_core::LevelSample> BedtimeLevelService::timeline(
  const std::string& userId,
  const std::string& habitId,
  hbt_core::Timestamp start,
  hbt_core::Timestamp end,
  std::chrono::minutes interval)
{
  LoadedHabit const habit = loadHabit(userId, habitId);
  if (end < start)
  {
    return {};
  }

  int const days =
    hbt_core::LookbackWindowPolicy::lookbackDays(habit.profile,
                                                 config_.lookbackMode);
  auto const records = events_.findInRange(
    userId, habitId, start - std::chrono::days{days}, end);

  auto const batch = hbt_core::ConsumptionEvent::fromRecords(records);
  reportRejections(habitId, batch.rejected);

  return hbt_core::LevelTimeline::generate(
    batch.events, start, end, habit.profile.halfLifeHours(), interval);
}

}  // namespace hbt_service
