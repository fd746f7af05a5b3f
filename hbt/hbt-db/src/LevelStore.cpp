#include "hbt-db/src/LevelStore.hpp"

#include <stdexcept>
#include <utility>

#include <cpp_sqlite/src/cpp_sqlite/DBDataAccessObject.hpp>

#include "hbt-db/src/RawQuery.hpp"

namespace hbt_db
{

LevelStore::LevelStore(cpp_sqlite::Database& db,
                       std::shared_ptr<spdlog::logger> logger)
  : db_{db},
    logger_{std::move(logger)},
    table_{db.getDAO<hbt_transfer::DrugLevelRecord>().getTableName()}
{
  if (!logger_)
  {
    throw std::invalid_argument("LevelStore requires a logger");
  }
  execute(db_,
          "CREATE UNIQUE INDEX IF NOT EXISTS idx_level_user_habit_date ON " +
            table_ + " (user_id, habit_id, date);");
}

void LevelStore::upsert(const hbt_transfer::DrugLevelRecord& level)
{
  db_.withTransaction(
    [this, &level]()
    {
      auto stmt = prepare(db_,
                          "UPDATE " + table_ +
                            " SET level_value = ?, unit = ?, "
                            "calculated_at = ? WHERE user_id = ? AND "
                            "habit_id = ? AND date = ?;");
      bind(stmt, 1, level.level_value);
      bind(stmt, 2, level.unit);
      bind(stmt, 3, level.calculated_at);
      bind(stmt, 4, level.user_id);
      bind(stmt, 5, level.habit_id);
      bind(stmt, 6, level.date);

      if (execute(db_, stmt) == 0)
      {
        hbt_transfer::DrugLevelRecord record = level;
        db_.getDAO<hbt_transfer::DrugLevelRecord>().insert(record);
      }
    });

  logger_->debug("Stored level {} {} for habit {} on {}",
                 level.level_value,
                 level.unit,
                 level.habit_id,
                 level.date);
}

std::optional<hbt_transfer::DrugLevelRecord> LevelStore::find(
  const std::string& userId,
  const std::string& habitId,
  const std::string& date)
{
  auto stmt = prepare(db_,
                      "SELECT * FROM " + table_ +
                        " WHERE user_id = ? AND habit_id = ? AND date = ?;");
  bind(stmt, 1, userId);
  bind(stmt, 2, habitId);
  bind(stmt, 3, date);

  auto rows = db_.select<hbt_transfer::DrugLevelRecord>(stmt);
  if (rows.empty())
  {
    return std::nullopt;
  }
  return std::move(rows.front());
}

}  // namespace hbt_db
