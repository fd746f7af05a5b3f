#ifndef HBT_CORE_TIMESTAMP_HPP
#define HBT_CORE_TIMESTAMP_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace hbt_core
{

/// Absolute instant, UTC based, millisecond resolution
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

/// Calendar date in the user's local calendar
using LocalDate = std::chrono::year_month_day;

/**
 * @brief Parse an ISO-8601 timestamp carrying an explicit UTC designator
 *
 * Accepted form:
 *   YYYY-MM-DD('T'|' ')HH:MM[:SS[.fraction]](Z|+HH|+HHMM|+HH:MM)
 * with '-' accepted in place of '+'. Fractions beyond milliseconds are
 * truncated.
 *
 * @param text Timestamp text
 * @return Parsed instant, or std::nullopt if the text is malformed, a field is
 *         out of range, or no offset is present
 */
[[nodiscard]] std::optional<Timestamp> parseTimestamp(std::string_view text);

/**
 * @brief Format an instant as "YYYY-MM-DDTHH:MM:SS.mmmZ"
 */
[[nodiscard]] std::string formatTimestamp(Timestamp instant);

/**
 * @brief Parse a calendar date "YYYY-MM-DD"
 * @return Date, or std::nullopt for malformed or impossible dates
 */
[[nodiscard]] std::optional<LocalDate> parseDate(std::string_view text);

/**
 * @brief Format a calendar date as "YYYY-MM-DD"
 */
[[nodiscard]] std::string formatDate(LocalDate date);

/**
 * @brief Parse a time of day "HH:MM" or "HH:MM:SS"
 * @return Offset from midnight, or std::nullopt if malformed or out of range
 */
[[nodiscard]] std::optional<std::chrono::seconds> parseClockTime(
  std::string_view text);

/**
 * @brief Elapsed time from @p from to @p to in fractional hours
 *
 * Negative when @p to precedes @p from.
 */
[[nodiscard]] double hoursBetween(Timestamp from, Timestamp to);

/**
 * @brief Calendar date of an instant in a zone with a fixed UTC offset
 */
[[nodiscard]] LocalDate localDateOf(Timestamp instant,
                                    std::chrono::minutes utcOffset);

}  // namespace hbt_core

#endif  // HBT_CORE_TIMESTAMP_HPP
