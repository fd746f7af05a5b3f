#ifndef HBT_CORE_ESTIMATOR_ERRORS_HPP
#define HBT_CORE_ESTIMATOR_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace hbt_core
{

/**
 * @brief Thrown when a habit's decay configuration cannot be used
 *
 * Covers a missing, zero, negative or non-finite half-life and a threshold
 * percentage outside (0, 100]. Never converted into a default value.
 */
class InvalidConfiguration : public std::invalid_argument
{
public:
  explicit InvalidConfiguration(const std::string& what)
    : std::invalid_argument{what}
  {
  }
};

/**
 * @brief Thrown when a single consumption event is validated in isolation
 *
 * The estimator itself never throws this; it reports rejected events in its
 * result and keeps going. Stores throw it on insert.
 */
class InvalidEvent : public std::invalid_argument
{
public:
  explicit InvalidEvent(const std::string& what)
    : std::invalid_argument{what}
  {
  }
};

/**
 * @brief Why an event was left out of an estimate
 */
enum class EventRejection
{
  NegativeAmount,
  NonFiniteAmount,
  UnparsableTimestamp
};

/**
 * @brief Human readable name of a rejection reason
 */
[[nodiscard]] const char* toString(EventRejection reason);

/**
 * @brief An event excluded from the sum because it failed validation
 */
struct RejectedEvent
{
  std::string eventId;
  EventRejection reason{EventRejection::NegativeAmount};
  std::string detail;  // Offending raw value
};

}  // namespace hbt_core

#endif  // HBT_CORE_ESTIMATOR_ERRORS_HPP
