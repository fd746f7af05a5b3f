#include "hbt-core/src/LookbackWindowPolicy.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <string>

#include "hbt-core/src/EstimatorErrors.hpp"

namespace hbt_core
{

namespace
{

constexpr double kHoursPerDay{24.0};

int daysCovering(double hours)
{
  double const days = std::ceil(hours / kHoursPerDay);
  if (days > LookbackWindowPolicy::kMaximumDays)
  {
    throw InvalidConfiguration(
      "Lookback window of " + std::to_string(days) + " days exceeds " +
      std::to_string(LookbackWindowPolicy::kMaximumDays) + " days");
  }
  return std::max(LookbackWindowPolicy::kMinimumDays, static_cast<int>(days));
}

}  // namespace

int LookbackWindowPolicy::lookbackDays(double halfLifeHours)
{
  HabitDecayProfile::validateHalfLife(halfLifeHours);
  return daysCovering(kHalfLivesCovered * halfLifeHours);
}

int LookbackWindowPolicy::thresholdLookbackDays(
  const HabitDecayProfile& profile)
{
  return daysCovering(profile.hoursToNegligible());
}

int LookbackWindowPolicy::lookbackDays(const HabitDecayProfile& profile,
                                       LookbackMode mode)
{
  switch (mode)
  {
    case LookbackMode::ThreeHalfLives:
      return lookbackDays(profile.halfLifeHours());
    case LookbackMode::Threshold:
      return thresholdLookbackDays(profile);
  }
  return lookbackDays(profile.halfLifeHours());
}

LookbackWindow LookbackWindowPolicy::window(Timestamp referenceInstant,
                                            int days)
{
  if (days < 0 || days > kMaximumDays)
  {
    throw std::invalid_argument("Lookback days must be in [0, " +
                                std::to_string(kMaximumDays) + "], got: " +
                                std::to_string(days));
  }
  return LookbackWindow{referenceInstant - std::chrono::days{days},
                        referenceInstant};
}

}  // namespace hbt_core
