#ifndef HBT_DB_CONSUMPTION_EVENT_STORE_HPP
#define HBT_DB_CONSUMPTION_EVENT_STORE_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>
#include <spdlog/spdlog.h>

#include "hbt-core/src/Timestamp.hpp"
#include "hbt-transfer/src/ConsumptionEventRecord.hpp"

namespace hbt_db
{

/**
 * @brief Logged consumption events
 *
 * Each row keeps the timestamp text as logged together with its normalized
 * UTC epoch milliseconds, which range queries use. A row whose text could not
 * be normalized has timestamp_valid == 0.
 *
 * Events are immutable: a correction is remove() followed by insert().
 */
class ConsumptionEventStore
{
public:
  /**
   * @throws std::invalid_argument if logger is null
   */
  ConsumptionEventStore(cpp_sqlite::Database& db,
                        std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Insert a newly logged event
   *
   * @throws hbt_core::InvalidEvent for a negative or non-finite amount or an
   *         unparsable timestamp
   * @throws std::runtime_error if the event_id already exists
   */
  void insert(const hbt_transfer::ConsumptionEventRecord& record);

  /**
   * @brief Store a row exactly as delivered by another client
   *
   * No validation is applied, so that the estimator can report bad rows
   * instead of them disappearing at import time.
   *
   * @throws std::runtime_error if the event_id already exists
   */
  void importRecord(const hbt_transfer::ConsumptionEventRecord& record);

  /**
   * @brief importRecord() for a batch, inside one transaction
   * @return Number of rows stored
   */
  std::size_t importRecords(
    std::span<const hbt_transfer::ConsumptionEventRecord> records);

  /**
   * @return true if a row with this event_id was deleted
   */
  bool remove(const std::string& eventId);

  /**
   * @brief Events of one habit with from <= consumed_at <= to
   *
   * Ordered by time ascending. Rows whose timestamp could not be normalized
   * are returned first.
   */
  [[nodiscard]] std::vector<hbt_transfer::ConsumptionEventRecord> findInRange(
    const std::string& userId,
    const std::string& habitId,
    hbt_core::Timestamp from,
    hbt_core::Timestamp to);

  /**
   * @brief Whether any event, zero amounts included, lies in [from, to]
   */
  [[nodiscard]] bool hasEventsInRange(const std::string& userId,
                                      const std::string& habitId,
                                      hbt_core::Timestamp from,
                                      hbt_core::Timestamp to);

private:
  void write(const hbt_transfer::ConsumptionEventRecord& record,
             std::optional<hbt_core::Timestamp> consumedAt);

  [[nodiscard]] bool contains(const std::string& eventId);

  cpp_sqlite::Database& db_;
  std::shared_ptr<spdlog::logger> logger_;
  std::string table_;
};

}  // namespace hbt_db

#endif  // HBT_DB_CONSUMPTION_EVENT_STORE_HPP
