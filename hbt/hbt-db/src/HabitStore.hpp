#ifndef HBT_DB_HABIT_STORE_HPP
#define HBT_DB_HABIT_STORE_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>
#include <spdlog/spdlog.h>

#include "hbt-transfer/src/HabitRecord.hpp"

namespace hbt_db
{

/**
 * @brief Kinds of habit a user can track
 */
enum class HabitType
{
  Binary,
  Numeric,
  Time,
  Text,
  Drug,
  QuickConsumption
};

/// Stored name of a habit type, e.g. "quick_consumption"
[[nodiscard]] const char* toString(HabitType type);

[[nodiscard]] std::optional<HabitType> parseHabitType(std::string_view text);

/// True for the types that carry a decay configuration
[[nodiscard]] bool tracksDecay(HabitType type);

/**
 * @brief Habits and their decay configuration
 *
 * Habits are addressed by their habit_id, which is unique. The table is
 * created by the HabitRecord DAO on construction if it does not exist. The
 * referenced Database must outlive the store.
 */
class HabitStore
{
public:
  /**
   * @throws std::invalid_argument if logger is null
   */
  HabitStore(cpp_sqlite::Database& db, std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Insert a new habit
   *
   * @throws std::invalid_argument for an unknown habit type
   * @throws std::runtime_error if the habit_id already exists
   */
  void insert(const hbt_transfer::HabitRecord& habit);

  /**
   * @brief Replace every column of the habit with the same habit_id
   * @return false if no habit has this habit_id
   * @throws std::invalid_argument for an unknown habit type
   */
  bool update(const hbt_transfer::HabitRecord& habit);

  [[nodiscard]] std::optional<hbt_transfer::HabitRecord> findById(
    const std::string& habitId);

private:
  cpp_sqlite::Database& db_;
  std::shared_ptr<spdlog::logger> logger_;
  std::string table_;
};

}  // namespace hbt_db

#endif  // HBT_DB_HABIT_STORE_HPP
