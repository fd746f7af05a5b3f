#include "hbt-core/src/LevelEstimator.hpp"

#include <iterator>
#include <string>
#include <utility>

#include "hbt-core/src/DecayFunction.hpp"

namespace hbt_core
{

EstimationResult LevelEstimator::estimateLevel(
  std::span<const ConsumptionEvent> events,
  Timestamp referenceInstant,
  double halfLifeHours)
{
  // Fail before looking at any event so an empty history cannot hide a
  // misconfigured habit
  HabitDecayProfile::validateHalfLife(halfLifeHours);

  EstimationResult result{};
  result.referenceInstant = referenceInstant;

  for (const auto& event : events)
  {
    if (auto const reason = event.validate())
    {
      result.rejectedEvents.push_back(
        RejectedEvent{event.id(), *reason, std::to_string(event.amount())});
      continue;
    }

    // Hard filter: a later intake cannot raise an earlier level
    if (event.consumedAt() > referenceInstant)
    {
      ++result.futureEventCount;
      continue;
    }

    result.level += contribution(event, referenceInstant, halfLifeHours);
    result.includedEvents.push_back(event);
  }

  return result;
}

EstimationResult LevelEstimator::estimateLevel(
  std::span<const ConsumptionEvent> events,
  Timestamp referenceInstant,
  const HabitDecayProfile& profile)
{
  return estimateLevel(events, referenceInstant, profile.halfLifeHours());
}

EstimationResult LevelEstimator::estimateFromRecords(
  std::span<const hbt_transfer::ConsumptionEventRecord> records,
  Timestamp referenceInstant,
  double halfLifeHours)
{
  HabitDecayProfile::validateHalfLife(halfLifeHours);

  auto batch = ConsumptionEvent::fromRecords(records);
  EstimationResult result =
    estimateLevel(batch.events, referenceInstant, halfLifeHours);

  result.rejectedEvents.insert(result.rejectedEvents.begin(),
                               std::make_move_iterator(batch.rejected.begin()),
                               std::make_move_iterator(batch.rejected.end()));
  return result;
}

double LevelEstimator::contribution(const ConsumptionEvent& event,
                                    Timestamp referenceInstant,
                                    double halfLifeHours)
{
  if (event.consumedAt() > referenceInstant)
  {
    return 0.0;
  }

  double const elapsedHours =
    hoursBetween(event.consumedAt(), referenceInstant);
  return event.amount() * remainingFraction(elapsedHours, halfLifeHours);
}

}  // namespace hbt_core
