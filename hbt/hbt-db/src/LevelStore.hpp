#ifndef HBT_DB_LEVEL_STORE_HPP
#define HBT_DB_LEVEL_STORE_HPP

#include <memory>
#include <optional>
#include <string>

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>
#include <spdlog/spdlog.h>

#include "hbt-transfer/src/DrugLevelRecord.hpp"

namespace hbt_db
{

/**
 * @brief Calculated daily levels, one per user, habit and date
 */
class LevelStore
{
public:
  /**
   * @throws std::invalid_argument if logger is null
   */
  LevelStore(cpp_sqlite::Database& db, std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Insert the level for a date, or replace the one already stored
   */
  void upsert(const hbt_transfer::DrugLevelRecord& level);

  [[nodiscard]] std::optional<hbt_transfer::DrugLevelRecord> find(
    const std::string& userId,
    const std::string& habitId,
    const std::string& date);

private:
  cpp_sqlite::Database& db_;
  std::shared_ptr<spdlog::logger> logger_;
  std::string table_;
};

}  // namespace hbt_db

#endif  // HBT_DB_LEVEL_STORE_HPP
