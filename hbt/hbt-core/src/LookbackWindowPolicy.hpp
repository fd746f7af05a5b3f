#ifndef HBT_CORE_LOOKBACK_WINDOW_POLICY_HPP
#define HBT_CORE_LOOKBACK_WINDOW_POLICY_HPP

#include "hbt-core/src/HabitDecayProfile.hpp"
#include "hbt-core/src/Timestamp.hpp"

namespace hbt_core
{

/**
 * @brief How the lookback window is sized
 */
enum class LookbackMode
{
  ThreeHalfLives,  // max(3, ceil(3h / 24)) days, 12.5% of a dose remains
  Threshold        // Until a dose falls to the habit's threshold percent
};

/**
 * @brief Time range of events to query for one estimation
 */
struct LookbackWindow
{
  Timestamp from{};  // Inclusive
  Timestamp to{};    // Inclusive, the reference instant
};

/**
 * @brief Bounds how far back events must be fetched for an estimation
 *
 * Every past event has a nonzero analytic contribution, so any window is a
 * tolerance choice. The default covers three half-lives and never less than
 * three calendar days. This sizes the query only; the estimator sums
 * whatever it is given.
 */
class LookbackWindowPolicy
{
public:
  static constexpr int kMinimumDays{3};
  /// One hundred years; longer windows are a configuration error
  static constexpr int kMaximumDays{36500};
  static constexpr double kHalfLivesCovered{3.0};

  /**
   * @brief Days to look back for a half-life
   *
   *   max(3, ceil(3 * halfLifeHours / 24))
   *
   * @throws InvalidConfiguration if halfLifeHours is not positive or the
   *         window would exceed kMaximumDays
   */
  [[nodiscard]] static int lookbackDays(double halfLifeHours);

  /**
   * @brief Days to look back until a single dose is below the threshold
   *
   *   max(3, ceil(halfLife * log2(100 / thresholdPercent) / 24))
   *
   * Wider than lookbackDays() whenever the threshold is under 12.5%.
   *
   * @throws InvalidConfiguration if the window would exceed kMaximumDays
   */
  [[nodiscard]] static int thresholdLookbackDays(
    const HabitDecayProfile& profile);

  /**
   * @brief Days to look back for a profile under the given mode
   */
  [[nodiscard]] static int lookbackDays(const HabitDecayProfile& profile,
                                        LookbackMode mode);

  /**
   * @brief Query range ending at the reference instant
   * @param referenceInstant Upper bound of the window
   * @param days Window length in days
   * @throws std::invalid_argument if days is outside [0, kMaximumDays]
   */
  [[nodiscard]] static LookbackWindow window(Timestamp referenceInstant,
                                             int days);
};

}  // namespace hbt_core

#endif  // HBT_CORE_LOOKBACK_WINDOW_POLICY_HPP
