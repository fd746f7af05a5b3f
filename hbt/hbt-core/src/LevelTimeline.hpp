#ifndef HBT_CORE_LEVEL_TIMELINE_HPP
#define HBT_CORE_LEVEL_TIMELINE_HPP

#include <chrono>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "hbt-core/src/ConsumptionEvent.hpp"
#include "hbt-core/src/Timestamp.hpp"

namespace hbt_core
{

/**
 * @brief Estimated level at one instant of a timeline
 */
struct LevelSample
{
  Timestamp time{};
  double level{0.0};
};

/**
 * @brief Level curves over time for charting and daily patterns
 *
 * Each sample equals LevelEstimator::estimateLevel() at the sample instant.
 * The whole timeline is evaluated at once as a fraction matrix
 * F(i, j) = 2^(-(t_i - c_j) / h) (zero for c_j > t_i) times the amount vector.
 *
 * Events failing validation are left out; use LevelEstimator to obtain the
 * rejection report.
 */
class LevelTimeline
{
public:
  /// Longest sampling interval parseInterval() accepts
  static constexpr std::chrono::minutes kMaxInterval{std::chrono::days{7}};

  /**
   * @brief Sample the level from @p start to @p end
   *
   * Samples at start, start + interval, ... up to and including end.
   *
   * @return Samples in time order, empty when end < start
   * @throws InvalidConfiguration if halfLifeHours is not positive
   * @throws std::invalid_argument if interval is not positive
   */
  static std::vector<LevelSample> generate(
    std::span<const ConsumptionEvent> events,
    Timestamp start,
    Timestamp end,
    double halfLifeHours,
    std::chrono::minutes interval = std::chrono::minutes{30});

  /**
   * @brief Parse a sampling interval given in minutes
   *
   * Fractional minutes are truncated.
   *
   * @return std::nullopt unless the text is a number in [1, kMaxInterval]
   */
  [[nodiscard]] static std::optional<std::chrono::minutes> parseInterval(
    std::string_view text);

  /**
   * @brief Largest level in a timeline, 0 for an empty one
   */
  [[nodiscard]] static double maxLevel(std::span<const LevelSample> samples);

  /**
   * @brief Mean level curve across several days
   *
   * Day d is sampled over [dayStarts[d], dayStarts[d] + window] using only
   * dailyEvents[d]. The result holds the per-offset mean across days, stamped
   * with the first day's instants.
   *
   * @return Averaged samples, empty when no days are given
   * @throws std::invalid_argument if the two spans differ in length, or the
   *         window is negative, or the interval is not positive
   */
  static std::vector<LevelSample> averageDailyPattern(
    std::span<const std::vector<ConsumptionEvent>> dailyEvents,
    std::span<const Timestamp> dayStarts,
    std::chrono::minutes window,
    double halfLifeHours,
    std::chrono::minutes interval = std::chrono::minutes{60});
};

}  // namespace hbt_core

#endif  // HBT_CORE_LEVEL_TIMELINE_HPP
