#ifndef HBT_CORE_CONSUMPTION_EVENT_HPP
#define HBT_CORE_CONSUMPTION_EVENT_HPP

#include <optional>
#include <span>
#include <string>
#include <vector>

#include "hbt-core/src/EstimatorErrors.hpp"
#include "hbt-core/src/Timestamp.hpp"
#include "hbt-transfer/src/ConsumptionEventRecord.hpp"

namespace hbt_core
{

/**
 * @brief One logged intake of a tracked substance
 *
 * Immutable after construction; a correction is a delete followed by a new
 * event. An amount of zero is an explicit "none consumed" log. Whether any
 * log exists for a period is a separate question answered by the event store,
 * not by the amount.
 *
 * The constructor does not validate the amount so that data delivered by the
 * persistence layer can be represented as-is and rejected by the estimator
 * with a reason. Use validate() or LevelEstimator for the checks.
 */
class ConsumptionEvent
{
public:
  ConsumptionEvent(std::string id,
                   std::string habitId,
                   Timestamp consumedAt,
                   double amount);

  [[nodiscard]] const std::string& id() const
  {
    return id_;
  }

  [[nodiscard]] const std::string& habitId() const
  {
    return habitId_;
  }

  [[nodiscard]] Timestamp consumedAt() const
  {
    return consumedAt_;
  }

  [[nodiscard]] double amount() const
  {
    return amount_;
  }

  /// True for an explicit zero log
  [[nodiscard]] bool isNoneConsumed() const
  {
    return amount_ == 0.0;
  }

  /**
   * @brief Check the amount of this event
   * @return The reason the event is unusable, or std::nullopt when valid
   */
  [[nodiscard]] std::optional<EventRejection> validate() const;

  /**
   * @brief Convert to a stored record
   * @param userId Owner of the habit
   */
  [[nodiscard]] hbt_transfer::ConsumptionEventRecord toRecord(
    const std::string& userId) const;

  /**
   * @brief Convert a single stored record, validating it in isolation
   * @throws InvalidEvent if the timestamp is unparsable or the amount invalid
   */
  static ConsumptionEvent fromRecord(
    const hbt_transfer::ConsumptionEventRecord& record);

  /**
   * @brief Result of converting a batch of stored records
   */
  struct Batch
  {
    std::vector<ConsumptionEvent> events;
    std::vector<RejectedEvent> rejected;
  };

  /**
   * @brief Convert stored records, setting invalid ones aside
   *
   * A bad record never aborts the batch: it is reported in Batch::rejected
   * and the remaining records are converted.
   */
  static Batch fromRecords(
    std::span<const hbt_transfer::ConsumptionEventRecord> records);

private:
  std::string id_;
  std::string habitId_;
  Timestamp consumedAt_;
  double amount_;
};

/**
 * @brief Check an amount as delivered by the persistence layer
 * @return Rejection reason, or std::nullopt if the amount is finite and >= 0
 */
[[nodiscard]] std::optional<EventRejection> checkAmount(double amount);

}  // namespace hbt_core

#endif  // HBT_CORE_CONSUMPTION_EVENT_HPP
