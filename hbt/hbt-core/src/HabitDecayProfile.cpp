#include "hbt-core/src/HabitDecayProfile.hpp"

#include <cmath>
#include <string>

#include "hbt-core/src/EstimatorErrors.hpp"

namespace hbt_core
{

HabitDecayProfile::HabitDecayProfile(double halfLifeHours,
                                     double thresholdPercent)
  : halfLifeHours_{halfLifeHours}, thresholdPercent_{thresholdPercent}
{
  validateHalfLife(halfLifeHours);

  if (!std::isfinite(thresholdPercent) || thresholdPercent <= 0.0 ||
      thresholdPercent > 100.0)
  {
    throw InvalidConfiguration(
      "Threshold percent must be in (0, 100], got: " +
      std::to_string(thresholdPercent));
  }
}

HabitDecayProfile HabitDecayProfile::fromConfiguration(
  std::optional<double> halfLifeHours,
  std::optional<double> thresholdPercent)
{
  if (!halfLifeHours)
  {
    throw InvalidConfiguration("Half-life is not configured for this habit");
  }
  return HabitDecayProfile{*halfLifeHours,
                           thresholdPercent.value_or(kDefaultThresholdPercent)};
}

double HabitDecayProfile::hoursToNegligible() const
{
  return halfLifeHours_ * std::log2(100.0 / thresholdPercent_);
}

void HabitDecayProfile::validateHalfLife(double halfLifeHours)
{
  if (!std::isfinite(halfLifeHours) || halfLifeHours <= 0.0)
  {
    throw InvalidConfiguration("Half-life must be positive, got: " +
                               std::to_string(halfLifeHours));
  }
}

}  // namespace hbt_core
