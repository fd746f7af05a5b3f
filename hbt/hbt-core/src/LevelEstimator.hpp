#ifndef HBT_CORE_LEVEL_ESTIMATOR_HPP
#define HBT_CORE_LEVEL_ESTIMATOR_HPP

#include <cstddef>
#include <span>
#include <vector>

#include "hbt-core/src/ConsumptionEvent.hpp"
#include "hbt-core/src/EstimatorErrors.hpp"
#include "hbt-core/src/HabitDecayProfile.hpp"
#include "hbt-core/src/Timestamp.hpp"
#include "hbt-transfer/src/ConsumptionEventRecord.hpp"

namespace hbt_core
{

/**
 * @brief Outcome of one level estimation
 *
 * Ephemeral: nothing in hbt-core persists it.
 */
struct EstimationResult
{
  double level{0.0};               // Estimated residual level, >= 0
  Timestamp referenceInstant{};    // Instant the level is evaluated at
  std::vector<ConsumptionEvent> includedEvents;  // Events summed
  std::vector<RejectedEvent> rejectedEvents;     // Invalid events skipped
  std::size_t futureEventCount{0};  // Valid events after referenceInstant
};

/**
 * @brief Superposes exponential decay contributions of consumption events
 *
 *   level(T) = sum_i amount_i * 2^(-(T - t_i) / h)   over all t_i <= T
 *
 * Properties:
 * - Events after T are excluded outright, they never contribute.
 * - An event exactly at T contributes its full amount.
 * - No events (or only future ones) give a level of 0, not an error.
 * - The sum is linear and independent of event order.
 * - Pure: identical inputs give identical output.
 *
 * Invalid events (negative or non-finite amount, unparsable timestamp) are
 * reported in EstimationResult::rejectedEvents and the remaining events are
 * still summed. An invalid half-life aborts the call.
 *
 * The estimator knows nothing about lookback windows; callers choose which
 * events to pass (see LookbackWindowPolicy).
 */
class LevelEstimator
{
public:
  /**
   * @brief Estimate the level at @p referenceInstant
   *
   * @param events Events of a single habit, in any order
   * @param referenceInstant Evaluation instant
   * @param halfLifeHours Half-life [h]
   * @return Level, included events and rejected events
   * @throws InvalidConfiguration if halfLifeHours is not finite and positive
   */
  static EstimationResult estimateLevel(
    std::span<const ConsumptionEvent> events,
    Timestamp referenceInstant,
    double halfLifeHours);

  /**
   * @brief Estimate the level using a validated habit profile
   */
  static EstimationResult estimateLevel(
    std::span<const ConsumptionEvent> events,
    Timestamp referenceInstant,
    const HabitDecayProfile& profile);

  /**
   * @brief Estimate the level from stored records
   *
   * Records with an unparsable timestamp or invalid amount are rejected and
   * reported alongside any rejections made during estimation.
   *
   * @throws InvalidConfiguration if halfLifeHours is not finite and positive
   */
  static EstimationResult estimateFromRecords(
    std::span<const hbt_transfer::ConsumptionEventRecord> records,
    Timestamp referenceInstant,
    double halfLifeHours);

  /**
   * @brief Remaining amount of a single event at @p referenceInstant
   *
   * Zero for an event after the reference instant. Does not validate the
   * amount.
   */
  [[nodiscard]] static double contribution(const ConsumptionEvent& event,
                                           Timestamp referenceInstant,
                                           double halfLifeHours);
};

}  // namespace hbt_core

#endif  // HBT_CORE_LEVEL_ESTIMATOR_HPP
