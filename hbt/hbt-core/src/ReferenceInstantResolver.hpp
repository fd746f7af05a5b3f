#ifndef HBT_CORE_REFERENCE_INSTANT_RESOLVER_HPP
#define HBT_CORE_REFERENCE_INSTANT_RESOLVER_HPP

#include <chrono>
#include <optional>
#include <string_view>

#include "hbt-core/src/Timestamp.hpp"

namespace hbt_core
{

/**
 * @brief Rule mapping a logged day to the instant its level is evaluated at
 */
enum class AnchorRule
{
  /**
   * The reference instant of day D is the night of D: D at the clock time,
   * or D + 1 when the clock time falls before Config::nightRollover (a
   * bedtime after midnight). Never depends on the current time.
   */
  NightOf,

  /**
   * For today only: D at the clock time, moved to D + 1 once that instant
   * is no longer in the future. Other dates use NightOf.
   */
  LiveClock
};

/**
 * @brief Combines a logged date and a habitual clock time into an instant
 *
 * The clock time is the user's habitual bedtime. A missing or unparsable
 * clock time falls back to Config::defaultClockTime and is never an error.
 *
 * Local dates are mapped to instants with a fixed UTC offset supplied in the
 * configuration.
 */
class ReferenceInstantResolver
{
public:
  struct Config
  {
    std::chrono::seconds defaultClockTime{std::chrono::hours{22}};
    std::chrono::minutes utcOffset{0};  // Local time minus UTC
    AnchorRule anchorRule{AnchorRule::NightOf};
    // Clock times strictly before this belong to the following calendar day
    std::chrono::seconds nightRollover{std::chrono::hours{6}};
  };

  /**
   * @brief Resolved reference instant and how it was obtained
   */
  struct Resolution
  {
    Timestamp instant{};
    std::chrono::seconds clockTime{0};  // Clock time actually used
    bool usedDefaultClockTime{false};
    bool projected{false};  // instant is after `now`
  };

  ReferenceInstantResolver();

  /**
   * @param config Resolver configuration
   * @throws std::invalid_argument if a configured time of day lies outside
   *         [0, 24h) or the rollover outside [0, 24h]
   */
  explicit ReferenceInstantResolver(const Config& config);

  /**
   * @brief Resolve the reference instant for a logged date
   *
   * @param loggedDate Date the level is wanted for (local calendar)
   * @param habitualClockTime "HH:MM" or "HH:MM:SS", may be absent
   * @param now Current instant, used for the projected flag and LiveClock
   */
  [[nodiscard]] Resolution resolve(
    LocalDate loggedDate,
    std::optional<std::string_view> habitualClockTime,
    Timestamp now) const;

  /**
   * @brief Shorthand for resolve(...).instant
   */
  [[nodiscard]] Timestamp resolveReferenceInstant(
    LocalDate loggedDate,
    std::optional<std::string_view> habitualClockTime,
    Timestamp now) const;

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

private:
  // Instant of `date` at `clockTime` in the configured zone
  [[nodiscard]] Timestamp atLocalTime(LocalDate date,
                                      std::chrono::seconds clockTime) const;

  Config config_;
};

}  // namespace hbt_core

#endif  // HBT_CORE_REFERENCE_INSTANT_RESOLVER_HPP
