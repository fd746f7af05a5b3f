#ifndef HBT_CORE_HABIT_DECAY_PROFILE_HPP
#define HBT_CORE_HABIT_DECAY_PROFILE_HPP

#include <optional>

namespace hbt_core
{

/**
 * @brief Per-habit decay configuration
 *
 * Holds the elimination half-life and the "negligible" threshold of a
 * substance habit. Instances are always valid: construction rejects a
 * non-positive or non-finite half-life and a threshold outside (0, 100].
 *
 * The profile is a value passed into each estimation call. Editing a habit's
 * configuration therefore takes effect on the next call without any cache to
 * invalidate.
 *
 * The threshold only sizes the lookback window (see LookbackWindowPolicy).
 * It never removes a contribution from the decay sum.
 */
class HabitDecayProfile
{
public:
  static constexpr double kDefaultThresholdPercent{5.0};

  /**
   * @brief Construct a validated profile
   *
   * @param halfLifeHours Half-life [h], must be finite and > 0
   * @param thresholdPercent Negligible threshold [%], must be in (0, 100]
   * @throws InvalidConfiguration on an invalid value
   */
  explicit HabitDecayProfile(double halfLifeHours,
                             double thresholdPercent = kDefaultThresholdPercent);

  /**
   * @brief Build a profile from stored, possibly absent, configuration
   *
   * A missing half-life is a configuration error, not a reason to fall back
   * to a typical value. A missing threshold takes the documented default.
   *
   * @throws InvalidConfiguration if @p halfLifeHours is empty or invalid
   */
  static HabitDecayProfile fromConfiguration(
    std::optional<double> halfLifeHours,
    std::optional<double> thresholdPercent);

  [[nodiscard]] double halfLifeHours() const
  {
    return halfLifeHours_;
  }

  [[nodiscard]] double thresholdPercent() const
  {
    return thresholdPercent_;
  }

  /**
   * @brief Hours for a single dose to fall to the threshold fraction
   *
   * h * log2(100 / thresholdPercent). Zero when the threshold is 100%.
   */
  [[nodiscard]] double hoursToNegligible() const;

  /**
   * @brief Check a half-life value
   * @throws InvalidConfiguration unless finite and > 0
   */
  static void validateHalfLife(double halfLifeHours);

private:
  double halfLifeHours_;
  double thresholdPercent_;
};

}  // namespace hbt_core

#endif  // HBT_CORE_HABIT_DECAY_PROFILE_HPP
