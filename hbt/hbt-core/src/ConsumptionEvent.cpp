#include "hbt-core/src/ConsumptionEvent.hpp"

#include <cmath>
#include <utility>

namespace hbt_core
{

namespace
{

// Returns the converted event, or fills `rejection` and returns nullopt
std::optional<ConsumptionEvent> convert(
  const hbt_transfer::ConsumptionEventRecord& record,
  RejectedEvent& rejection)
{
  auto const consumedAt = parseTimestamp(record.consumed_at);
  if (!consumedAt)
  {
    rejection = RejectedEvent{
      record.event_id, EventRejection::UnparsableTimestamp, record.consumed_at};
    return std::nullopt;
  }

  if (auto const reason = checkAmount(record.amount))
  {
    rejection =
      RejectedEvent{record.event_id, *reason, std::to_string(record.amount)};
    return std::nullopt;
  }

  return ConsumptionEvent{
    record.event_id, record.habit_id, *consumedAt, record.amount};
}

}  // namespace

std::optional<EventRejection> checkAmount(double amount)
{
  if (!std::isfinite(amount))
  {
    return EventRejection::NonFiniteAmount;
  }
  if (amount < 0.0)
  {
    return EventRejection::NegativeAmount;
  }
  return std::nullopt;
}

ConsumptionEvent::ConsumptionEvent(std::string id,
                                   std::string habitId,
                                   Timestamp consumedAt,
                                   double amount)
  : id_{std::move(id)},
    habitId_{std::move(habitId)},
    consumedAt_{consumedAt},
    amount_{amount}
{
}

std::optional<EventRejection> ConsumptionEvent::validate() const
{
  return checkAmount(amount_);
}

hbt_transfer::ConsumptionEventRecord ConsumptionEvent::toRecord(
  const std::string& userId) const
{
  hbt_transfer::ConsumptionEventRecord record{};
  record.event_id = id_;
  record.user_id = userId;
  record.habit_id = habitId_;
  record.consumed_at = formatTimestamp(consumedAt_);
  record.consumed_at_ms =
    static_cast<double>(consumedAt_.time_since_epoch().count());
  record.timestamp_valid = 1;
  record.amount = amount_;
  return record;
}

ConsumptionEvent ConsumptionEvent::fromRecord(
  const hbt_transfer::ConsumptionEventRecord& record)
{
  RejectedEvent rejection{};
  auto event = convert(record, rejection);
  if (!event)
  {
    throw InvalidEvent("Consumption event '" + record.event_id +
                       "' rejected: " + toString(rejection.reason) + " (" +
                       rejection.detail + ")");
  }
  return std::move(*event);
}

ConsumptionEvent::Batch ConsumptionEvent::fromRecords(
  std::span<const hbt_transfer::ConsumptionEventRecord> records)
{
  Batch batch{};
  batch.events.reserve(records.size());

  for (const auto& record : records)
  {
    RejectedEvent rejection{};
    if (auto event = convert(record, rejection))
    {
      batch.events.push_back(std::move(*event));
    }
    else
    {
      batch.rejected.push_back(std::move(rejection));
    }
  }

  return batch;
}

}  // namespace hbt_core
