#include "hbt-core/src/LevelTimeline.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include "hbt-core/src/DecayFunction.hpp"
#include "hbt-core/src/HabitDecayProfile.hpp"

namespace hbt_core
{

namespace
{

// Levels at the given instants, one per entry of `times`
Eigen::VectorXd evaluateLevels(std::span<const ConsumptionEvent> events,
                               const std::vector<Timestamp>& times,
                               double halfLifeHours)
{
  std::vector<const ConsumptionEvent*> valid;
  valid.reserve(events.size());
  for (const auto& event : events)
  {
    if (!event.validate())
    {
      valid.push_back(&event);
    }
  }

  auto const rows = static_cast<Eigen::Index>(times.size());
  auto const cols = static_cast<Eigen::Index>(valid.size());
  if (cols == 0)
  {
    return Eigen::VectorXd::Zero(rows);
  }

  Eigen::VectorXd amounts(cols);
  for (Eigen::Index j = 0; j < cols; ++j)
  {
    amounts(j) = valid[static_cast<std::size_t>(j)]->amount();
  }

  Eigen::MatrixXd fractions = Eigen::MatrixXd::Zero(rows, cols);
  for (Eigen::Index i = 0; i < rows; ++i)
  {
    Timestamp const t = times[static_cast<std::size_t>(i)];
    for (Eigen::Index j = 0; j < cols; ++j)
    {
      Timestamp const consumedAt =
        valid[static_cast<std::size_t>(j)]->consumedAt();
      if (consumedAt <= t)
      {
        fractions(i, j) =
          remainingFraction(hoursBetween(consumedAt, t), halfLifeHours);
      }
    }
  }

  return fractions * amounts;
}

std::vector<Timestamp> sampleTimes(Timestamp start,
                                   Timestamp end,
                                   std::chrono::minutes interval)
{
  std::vector<Timestamp> times;
  for (Timestamp t = start; t <= end; t += interval)
  {
    times.push_back(t);
  }
  return times;
}

void requirePositive(std::chrono::minutes interval)
{
  if (interval <= std::chrono::minutes{0})
  {
    throw std::invalid_argument("Timeline interval must be positive");
  }
}

}  // namespace

std::vector<LevelSample> LevelTimeline::generate(
  std::span<const ConsumptionEvent> events,
  Timestamp start,
  Timestamp end,
  double halfLifeHours,
  std::chrono::minutes interval)
{
  HabitDecayProfile::validateHalfLife(halfLifeHours);
  requirePositive(interval);

  std::vector<Timestamp> const times = sampleTimes(start, end, interval);
  Eigen::VectorXd const levels = evaluateLevels(events, times, halfLifeHours);

  std::vector<LevelSample> samples;
  samples.reserve(times.size());
  for (std::size_t i = 0; i < times.size(); ++i)
  {
    samples.push_back(
      LevelSample{times[i], levels(static_cast<Eigen::Index>(i))});
  }
  return samples;
}

std::optional<std::chrono::minutes> LevelTimeline::parseInterval(
  std::string_view text)
{
  std::string const owned{text};
  char* end = nullptr;
  double const value = std::strtod(owned.c_str(), &end);
  if (owned.empty() || end != owned.c_str() + owned.size() ||
      !std::isfinite(value))
  {
    return std::nullopt;
  }

  if (value < 1.0 || value > static_cast<double>(kMaxInterval.count()))
  {
    return std::nullopt;
  }
  return std::chrono::minutes{static_cast<std::chrono::minutes::rep>(value)};
}

double LevelTimeline::maxLevel(std::span<const LevelSample> samples)
{
  if (samples.empty())
  {
    return 0.0;
  }

  auto const it = std::max_element(
    samples.begin(),
    samples.end(),
    [](const LevelSample& a, const LevelSample& b)
    { return a.level < b.level; });
  return it->level;
}

std::vector<LevelSample> LevelTimeline::averageDailyPattern(
  std::span<const std::vector<ConsumptionEvent>> dailyEvents,
  std::span<const Timestamp> dayStarts,
  std::chrono::minutes window,
  double halfLifeHours,
  std::chrono::minutes interval)
{
  HabitDecayProfile::validateHalfLife(halfLifeHours);
  requirePositive(interval);

  if (dailyEvents.size() != dayStarts.size())
  {
    throw std::invalid_argument(
      "Each day of events needs exactly one day start");
  }
  if (window < std::chrono::minutes{0})
  {
    throw std::invalid_argument("Daily pattern window must be non-negative");
  }
  if (dailyEvents.empty())
  {
    return {};
  }

  auto const samplesPerDay = static_cast<Eigen::Index>(window / interval) + 1;
  auto const days = static_cast<Eigen::Index>(dailyEvents.size());

  // One row per day, one column per offset from the day start
  Eigen::MatrixXd dayLevels(days, samplesPerDay);
  for (Eigen::Index d = 0; d < days; ++d)
  {
    auto const index = static_cast<std::size_t>(d);
    Timestamp const dayStart = dayStarts[index];
    std::vector<Timestamp> const times = sampleTimes(
      dayStart, dayStart + interval * (samplesPerDay - 1), interval);
    dayLevels.row(d) =
      evaluateLevels(dailyEvents[index], times, halfLifeHours).transpose();
  }

  Eigen::RowVectorXd const mean = dayLevels.colwise().mean();

  std::vector<LevelSample> pattern;
  pattern.reserve(static_cast<std::size_t>(samplesPerDay));
  for (Eigen::Index k = 0; k < samplesPerDay; ++k)
  {
    pattern.push_back(
      LevelSample{dayStarts.front() + interval * k, mean(k)});
  }
  return pattern;
}

}  // namespace hbt_core
