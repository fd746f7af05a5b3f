#ifndef HBT_CORE_LEVEL_CLASSIFICATION_HPP
#define HBT_CORE_LEVEL_CLASSIFICATION_HPP

#include <span>
#include <string>

#include "hbt-core/src/ConsumptionEvent.hpp"

namespace hbt_core
{

/**
 * @brief Coarse band of a level relative to the user's typical dose
 */
enum class LevelBand
{
  Low,       // Nothing left
  Moderate,  // Up to 30% of a typical dose
  High
};

[[nodiscard]] const char* toString(LevelBand band);

/// Fraction of a typical dose up to which a level counts as moderate
inline constexpr double kModerateFractionOfTypicalDose{0.3};

/**
 * @brief Classify a level against a typical dose
 *
 * level <= 0 is Low, level <= 0.3 * typicalDose is Moderate, anything else
 * High.
 */
[[nodiscard]] LevelBand classifyLevel(double level, double typicalDose);

/**
 * @brief Mean amount of the valid events, 0 when there are none
 *
 * Explicit zero logs count toward the mean.
 */
[[nodiscard]] double typicalDose(std::span<const ConsumptionEvent> events);

/**
 * @brief Format a level for display, e.g. "62.9 mg"
 *
 * Non-finite levels are shown as "0 <unit>".
 */
[[nodiscard]] std::string formatLevel(double level,
                                      const std::string& unit,
                                      int decimals = 1);

}  // namespace hbt_core

#endif  // HBT_CORE_LEVEL_CLASSIFICATION_HPP
