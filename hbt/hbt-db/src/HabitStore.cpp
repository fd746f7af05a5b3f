#include "hbt-db/src/HabitStore.hpp"

#include <array>
#include <stdexcept>
#include <utility>

#include <cpp_sqlite/src/cpp_sqlite/DBDataAccessObject.hpp>

#include "hbt-db/src/RawQuery.hpp"

namespace hbt_db
{

namespace
{

constexpr std::array<std::pair<HabitType, const char*>, 6> kHabitTypeNames{{
  {HabitType::Binary, "binary"},
  {HabitType::Numeric, "numeric"},
  {HabitType::Time, "time"},
  {HabitType::Text, "text"},
  {HabitType::Drug, "drug"},
  {HabitType::QuickConsumption, "quick_consumption"},
}};

void requireKnownType(const std::string& type)
{
  if (!parseHabitType(type))
  {
    throw std::invalid_argument("Unknown habit type: " + type);
  }
}

std::shared_ptr<spdlog::logger> requireLogger(
  std::shared_ptr<spdlog::logger> logger)
{
  if (!logger)
  {
    throw std::invalid_argument("HabitStore requires a logger");
  }
  return logger;
}

}  // namespace

const char* toString(HabitType type)
{
  for (const auto& [value, name] : kHabitTypeNames)
  {
    if (value == type)
    {
      return name;
    }
  }
  return "unknown";
}

std::optional<HabitType> parseHabitType(std::string_view text)
{
  for (const auto& [value, name] : kHabitTypeNames)
  {
    if (text == name)
    {
      return value;
    }
  }
  return std::nullopt;
}

bool tracksDecay(HabitType type)
{
  return type == HabitType::Drug || type == HabitType::QuickConsumption;
}

HabitStore::HabitStore(cpp_sqlite::Database& db,
                       std::shared_ptr<spdlog::logger> logger)
  : db_{db},
    logger_{requireLogger(std::move(logger))},
    table_{db.getDAO<hbt_transfer::HabitRecord>().getTableName()}
{
  execute(db_,
          "CREATE UNIQUE INDEX IF NOT EXISTS idx_habit_key ON " + table_ +
            " (habit_id);");
}

void HabitStore::insert(const hbt_transfer::HabitRecord& habit)
{
  requireKnownType(habit.type);
  if (findById(habit.habit_id))
  {
    throw std::runtime_error("Habit '" + habit.habit_id + "' already exists");
  }

  hbt_transfer::HabitRecord record = habit;
  db_.getDAO<hbt_transfer::HabitRecord>().insert(record);

  logger_->debug("Inserted habit {} ({}) as row {}",
                 record.habit_id,
                 record.type,
                 record.id);
}

bool HabitStore::update(const hbt_transfer::HabitRecord& habit)
{
  requireKnownType(habit.type);

  auto stmt = prepare(db_,
                      "UPDATE " + table_ +
                        " SET user_id = ?, name = ?, type = ?, unit = ?, "
                        "half_life_hours = ?, drug_threshold_percent = ? "
                        "WHERE habit_id = ?;");
  bind(stmt, 1, habit.user_id);
  bind(stmt, 2, habit.name);
  bind(stmt, 3, habit.type);
  bind(stmt, 4, habit.unit);
  bind(stmt, 5, habit.half_life_hours);
  bind(stmt, 6, habit.drug_threshold_percent);
  bind(stmt, 7, habit.habit_id);
  return execute(db_, stmt) > 0;
}

std::optional<hbt_transfer::HabitRecord> HabitStore::findById(
  const std::string& habitId)
{
  auto stmt =
    prepare(db_, "SELECT * FROM " + table_ + " WHERE habit_id = ?;");
  bind(stmt, 1, habitId);

  auto rows = db_.select<hbt_transfer::HabitRecord>(stmt);
  if (rows.empty())
  {
    return std::nullopt;
  }
  return std::move(rows.front());
}

}  // namespace hbt_db
