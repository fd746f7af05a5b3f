#include "hbt-core/src/ReferenceInstantResolver.hpp"

#include <stdexcept>

namespace hbt_core
{

namespace
{

constexpr std::chrono::seconds kDay{std::chrono::hours{24}};

}  // namespace

ReferenceInstantResolver::ReferenceInstantResolver()
  : ReferenceInstantResolver{Config{}}
{
}

ReferenceInstantResolver::ReferenceInstantResolver(const Config& config)
  : config_{config}
{
  if (config_.defaultClockTime < std::chrono::seconds{0} ||
      config_.defaultClockTime >= kDay)
  {
    throw std::invalid_argument("Default clock time must be within a day");
  }
  if (config_.nightRollover < std::chrono::seconds{0} ||
      config_.nightRollover > kDay)
  {
    throw std::invalid_argument("Night rollover must be within a day");
  }
}

ReferenceInstantResolver::Resolution ReferenceInstantResolver::resolve(
  LocalDate loggedDate,
  std::optional<std::string_view> habitualClockTime,
  Timestamp now) const
{
  if (!loggedDate.ok())
  {
    throw std::invalid_argument("Logged date is not a valid calendar date");
  }

  Resolution resolution{};

  std::optional<std::chrono::seconds> parsed;
  if (habitualClockTime)
  {
    parsed = parseClockTime(*habitualClockTime);
  }
  resolution.clockTime = parsed.value_or(config_.defaultClockTime);
  resolution.usedDefaultClockTime = !parsed.has_value();

  bool const isToday = localDateOf(now, config_.utcOffset) == loggedDate;

  if (config_.anchorRule == AnchorRule::LiveClock && isToday)
  {
    resolution.instant = atLocalTime(loggedDate, resolution.clockTime);
    if (resolution.instant <= now)
    {
      resolution.instant += std::chrono::days{1};
    }
  }
  else
  {
    LocalDate anchorDate = loggedDate;
    if (resolution.clockTime < config_.nightRollover)
    {
      anchorDate = LocalDate{std::chrono::sys_days{loggedDate} +
                             std::chrono::days{1}};
    }
    resolution.instant = atLocalTime(anchorDate, resolution.clockTime);
  }

  resolution.projected = resolution.instant > now;
  return resolution;
}

Timestamp ReferenceInstantResolver::resolveReferenceInstant(
  LocalDate loggedDate,
  std::optional<std::string_view> habitualClockTime,
  Timestamp now) const
{
  return resolve(loggedDate, habitualClockTime, now).instant;
}

Timestamp ReferenceInstantResolver::atLocalTime(
  LocalDate date,
  std::chrono::seconds clockTime) const
{
  return Timestamp{std::chrono::sys_days{date}} + clockTime -
         config_.utcOffset;
}

}  // namespace hbt_core
