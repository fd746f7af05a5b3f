#ifndef HBT_TRANSFER_CONSUMPTION_EVENT_RECORD_HPP
#define HBT_TRANSFER_CONSUMPTION_EVENT_RECORD_HPP

#include <cstdint>
#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace hbt_transfer
{

/**
 * @brief Stored row of a logged consumption event
 *
 * The timestamp is kept as the raw ISO-8601 text so that malformed values
 * reach the estimator and can be reported instead of being dropped silently.
 * consumed_at_ms is the normalized UTC instant that range queries use; it is
 * only meaningful when timestamp_valid is 1.
 *
 * amount == 0 is an explicit "none consumed" log.
 *
 * @see hbt_core::ConsumptionEvent
 */
struct ConsumptionEventRecord : public cpp_sqlite::BaseTransferObject
{
  std::string event_id;
  std::string user_id;
  std::string habit_id;
  std::string consumed_at;     // ISO-8601 with offset
  double consumed_at_ms{0.0};  // Epoch milliseconds, exact below 2^53
  uint32_t timestamp_valid{0}; // Boolean as uint32_t for SQLite
  double amount{0.0};          // In the habit's unit
  std::string drink_type;      // Preset name, e.g. "espresso"; may be empty
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(ConsumptionEventRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (event_id,
                       user_id,
                       habit_id,
                       consumed_at,
                       consumed_at_ms,
                       timestamp_valid,
                       amount,
                       drink_type));

}  // namespace hbt_transfer

#endif  // HBT_TRANSFER_CONSUMPTION_EVENT_RECORD_HPP
