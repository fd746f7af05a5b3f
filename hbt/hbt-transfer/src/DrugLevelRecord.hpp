#ifndef HBT_TRANSFER_DRUG_LEVEL_RECORD_HPP
#define HBT_TRANSFER_DRUG_LEVEL_RECORD_HPP

#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace hbt_transfer
{

/**
 * @brief Stored calculated level
 *
 * One row per (user_id, habit_id, date). Written by the caller of the
 * estimator, never by the estimator itself.
 */
struct DrugLevelRecord : public cpp_sqlite::BaseTransferObject
{
  std::string user_id;
  std::string habit_id;
  std::string date;           // Logged date, "YYYY-MM-DD"
  double level_value{0.0};    // Estimated level at the reference instant
  std::string unit;           // Inherited from the habit
  std::string calculated_at;  // ISO-8601, when the level was computed
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(DrugLevelRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (user_id, habit_id, date, level_value, unit,
                       calculated_at));

}  // namespace hbt_transfer

#endif  // HBT_TRANSFER_DRUG_LEVEL_RECORD_HPP
