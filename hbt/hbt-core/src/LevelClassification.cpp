#include "hbt-core/src/LevelClassification.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace hbt_core
{

const char* toString(LevelBand band)
{
  switch (band)
  {
    case LevelBand::Low:
      return "Low";
    case LevelBand::Moderate:
      return "Moderate";
    case LevelBand::High:
      return "High";
  }
  return "Unknown";
}

LevelBand classifyLevel(double level, double typicalDose)
{
  if (level <= 0.0)
  {
    return LevelBand::Low;
  }
  if (level <= typicalDose * kModerateFractionOfTypicalDose)
  {
    return LevelBand::Moderate;
  }
  return LevelBand::High;
}

double typicalDose(std::span<const ConsumptionEvent> events)
{
  double total{0.0};
  std::size_t count{0};
  for (const auto& event : events)
  {
    if (event.validate())
    {
      continue;
    }
    total += event.amount();
    ++count;
  }
  return count == 0 ? 0.0 : total / static_cast<double>(count);
}

std::string formatLevel(double level, const std::string& unit, int decimals)
{
  if (!std::isfinite(level))
  {
    return "0 " + unit;
  }

  std::ostringstream oss;
  oss << std::fixed << std::setprecision(decimals < 0 ? 0 : decimals) << level
      << ' ' << unit;
  return oss.str();
}

}  // namespace hbt_core
