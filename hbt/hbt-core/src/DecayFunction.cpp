#include "hbt-core/src/DecayFunction.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "hbt-core/src/HabitDecayProfile.hpp"

namespace hbt_core
{

double remainingFraction(double elapsedHours, double halfLifeHours)
{
  HabitDecayProfile::validateHalfLife(halfLifeHours);

  if (std::isnan(elapsedHours) || elapsedHours < 0.0)
  {
    throw std::invalid_argument(
      "Elapsed time must be non-negative, got: " +
      std::to_string(elapsedHours));
  }

  return std::exp2(-elapsedHours / halfLifeHours);
}

}  // namespace hbt_core
