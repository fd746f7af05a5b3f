#include "hbt-db/src/ConsumptionEventStore.hpp"

#include <stdexcept>
#include <utility>

#include <cpp_sqlite/src/cpp_sqlite/DBDataAccessObject.hpp>

#include "hbt-core/src/ConsumptionEvent.hpp"
#include "hbt-core/src/EstimatorErrors.hpp"
#include "hbt-db/src/RawQuery.hpp"

namespace hbt_db
{

namespace
{

double toEpochMs(hbt_core::Timestamp instant)
{
  return static_cast<double>(instant.time_since_epoch().count());
}

std::shared_ptr<spdlog::logger> requireLogger(
  std::shared_ptr<spdlog::logger> logger)
{
  if (!logger)
  {
    throw std::invalid_argument("ConsumptionEventStore requires a logger");
  }
  return logger;
}

}  // namespace

ConsumptionEventStore::ConsumptionEventStore(
  cpp_sqlite::Database& db,
  std::shared_ptr<spdlog::logger> logger)
  : db_{db},
    logger_{requireLogger(std::move(logger))},
    table_{db.getDAO<hbt_transfer::ConsumptionEventRecord>().getTableName()}
{
  execute(db_,
          "CREATE UNIQUE INDEX IF NOT EXISTS idx_consumption_key ON " +
            table_ + " (event_id);");
  execute(db_,
          "CREATE INDEX IF NOT EXISTS idx_consumption_user_habit_time ON " +
            table_ + " (user_id, habit_id, consumed_at_ms);");
}

void ConsumptionEventStore::insert(
  const hbt_transfer::ConsumptionEventRecord& record)
{
  auto const event = hbt_core::ConsumptionEvent::fromRecord(record);
  write(record, event.consumedAt());
}

void ConsumptionEventStore::importRecord(
  const hbt_transfer::ConsumptionEventRecord& record)
{
  auto const consumedAt = hbt_core::parseTimestamp(record.consumed_at);
  if (!consumedAt)
  {
    logger_->warn("Storing event {} with unparsable timestamp '{}'",
                  record.event_id,
                  record.consumed_at);
  }
  write(record, consumedAt);
}

std::size_t ConsumptionEventStore::importRecords(
  std::span<const hbt_transfer::ConsumptionEventRecord> records)
{
  db_.withTransaction(
    [this, records]()
    {
      for (const auto& record : records)
      {
        importRecord(record);
      }
    });

  logger_->debug("Imported {} consumption events", records.size());
  return records.size();
}

void ConsumptionEventStore::write(
  const hbt_transfer::ConsumptionEventRecord& record,
  std::optional<hbt_core::Timestamp> consumedAt)
{
  if (contains(record.event_id))
  {
    throw std::runtime_error("Consumption event '" + record.event_id +
                             "' already exists");
  }

  hbt_transfer::ConsumptionEventRecord row = record;
  row.consumed_at_ms = consumedAt ? toEpochMs(*consumedAt) : 0.0;
  row.timestamp_valid = consumedAt ? 1 : 0;
  db_.getDAO<hbt_transfer::ConsumptionEventRecord>().insert(row);
}

bool ConsumptionEventStore::contains(const std::string& eventId)
{
  auto stmt = prepare(
    db_, "SELECT * FROM " + table_ + " WHERE event_id = ? LIMIT 1;");
  bind(stmt, 1, eventId);
  return !db_.select<hbt_transfer::ConsumptionEventRecord>(stmt).empty();
}

bool ConsumptionEventStore::remove(const std::string& eventId)
{
  auto stmt = prepare(db_, "DELETE FROM " + table_ + " WHERE event_id = ?;");
  bind(stmt, 1, eventId);
  return execute(db_, stmt) > 0;
}

std::vector<hbt_transfer::ConsumptionEventRecord>
ConsumptionEventStore::findInRange(const std::string& userId,
                                   const std::string& habitId,
                                   hbt_core::Timestamp from,
                                   hbt_core::Timestamp to)
{
  auto stmt = prepare(
    db_,
    "SELECT * FROM " + table_ +
      " WHERE user_id = ? AND habit_id = ? AND "
      "(timestamp_valid = 0 OR consumed_at_ms BETWEEN ? AND ?) "
      "ORDER BY timestamp_valid ASC, consumed_at_ms ASC, event_id ASC;");
  bind(stmt, 1, userId);
  bind(stmt, 2, habitId);
  bind(stmt, 3, toEpochMs(from));
  bind(stmt, 4, toEpochMs(to));
  return db_.select<hbt_transfer::ConsumptionEventRecord>(stmt);
}

bool ConsumptionEventStore::hasEventsInRange(const std::string& userId,
                                             const std::string& habitId,
                                             hbt_core::Timestamp from,
                                             hbt_core::Timestamp to)
{
  auto stmt = prepare(db_,
                      "SELECT * FROM " + table_ +
                        " WHERE user_id = ? AND habit_id = ? AND "
                        "timestamp_valid = 1 AND "
                        "consumed_at_ms BETWEEN ? AND ? LIMIT 1;");
  bind(stmt, 1, userId);
  bind(stmt, 2, habitId);
  bind(stmt, 3, toEpochMs(from));
  bind(stmt, 4, toEpochMs(to));
  return !db_.select<hbt_transfer::ConsumptionEventRecord>(stmt).empty();
}

}  // namespace hbt_db
