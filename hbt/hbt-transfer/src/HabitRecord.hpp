#ifndef HBT_TRANSFER_HABIT_RECORD_HPP
#define HBT_TRANSFER_HABIT_RECORD_HPP

#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace hbt_transfer
{

/**
 * @brief Stored habit and its decay configuration
 *
 * type is one of "binary", "numeric", "time", "text", "drug",
 * "quick_consumption". Only the last two carry a decay configuration.
 * A half_life_hours of 0 means no half-life has been configured.
 */
struct HabitRecord : public cpp_sqlite::BaseTransferObject
{
  std::string habit_id;
  std::string user_id;
  std::string name;
  std::string type;
  std::string unit;                    // e.g. "mg", "drinks"
  double half_life_hours{0.0};         // 0 when not configured
  double drug_threshold_percent{5.0};  // Negligible-level threshold [%]
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(HabitRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (habit_id,
                       user_id,
                       name,
                       type,
                       unit,
                       half_life_hours,
                       drug_threshold_percent));

}  // namespace hbt_transfer

#endif  // HBT_TRANSFER_HABIT_RECORD_HPP
