#include "hbt-core/src/Timestamp.hpp"

#include <cstddef>
#include <iomanip>
#include <sstream>

namespace hbt_core
{

namespace
{

// Reads exactly `count` decimal digits starting at `pos`
bool readDigits(std::string_view text,
                std::size_t& pos,
                std::size_t count,
                int& out)
{
  if (pos + count > text.size())
  {
    return false;
  }

  int value = 0;
  for (std::size_t i = 0; i < count; ++i)
  {
    char const c = text[pos + i];
    if (c < '0' || c > '9')
    {
      return false;
    }
    value = value * 10 + (c - '0');
  }

  pos += count;
  out = value;
  return true;
}

bool consume(std::string_view text, std::size_t& pos, char expected)
{
  if (pos < text.size() && text[pos] == expected)
  {
    ++pos;
    return true;
  }
  return false;
}

std::optional<LocalDate> readDate(std::string_view text, std::size_t& pos)
{
  int y{0};
  int m{0};
  int d{0};
  if (!readDigits(text, pos, 4, y) || !consume(text, pos, '-') ||
      !readDigits(text, pos, 2, m) || !consume(text, pos, '-') ||
      !readDigits(text, pos, 2, d))
  {
    return std::nullopt;
  }

  LocalDate const date{std::chrono::year{y},
                       std::chrono::month{static_cast<unsigned>(m)},
                       std::chrono::day{static_cast<unsigned>(d)}};
  if (!date.ok())
  {
    return std::nullopt;
  }
  return date;
}

// HH:MM[:SS], leaves `pos` after the last consumed field
std::optional<std::chrono::seconds> readClock(std::string_view text,
                                              std::size_t& pos)
{
  int h{0};
  int m{0};
  int s{0};
  if (!readDigits(text, pos, 2, h) || !consume(text, pos, ':') ||
      !readDigits(text, pos, 2, m))
  {
    return std::nullopt;
  }
  if (consume(text, pos, ':') && !readDigits(text, pos, 2, s))
  {
    return std::nullopt;
  }
  if (h > 23 || m > 59 || s > 59)
  {
    return std::nullopt;
  }
  return std::chrono::hours{h} + std::chrono::minutes{m} +
         std::chrono::seconds{s};
}

}  // namespace

std::optional<Timestamp> parseTimestamp(std::string_view text)
{
  std::size_t pos = 0;

  auto const date = readDate(text, pos);
  if (!date)
  {
    return std::nullopt;
  }

  if (pos >= text.size() ||
      (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' '))
  {
    return std::nullopt;
  }
  ++pos;

  auto const clock = readClock(text, pos);
  if (!clock)
  {
    return std::nullopt;
  }

  std::chrono::milliseconds fraction{0};
  if (consume(text, pos, '.'))
  {
    std::size_t digits = 0;
    int millis = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
    {
      if (digits < 3)
      {
        millis = millis * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0)
    {
      return std::nullopt;
    }
    for (std::size_t i = digits; i < 3; ++i)
    {
      millis *= 10;
    }
    fraction = std::chrono::milliseconds{millis};
  }

  if (pos >= text.size())
  {
    // A timestamp without an offset is ambiguous
    return std::nullopt;
  }

  std::chrono::minutes offset{0};
  char const designator = text[pos++];
  if (designator == 'Z' || designator == 'z')
  {
    offset = std::chrono::minutes{0};
  }
  else if (designator == '+' || designator == '-')
  {
    int oh{0};
    int om{0};
    if (!readDigits(text, pos, 2, oh))
    {
      return std::nullopt;
    }
    if (pos < text.size())
    {
      consume(text, pos, ':');
      if (!readDigits(text, pos, 2, om))
      {
        return std::nullopt;
      }
    }
    if (oh > 23 || om > 59)
    {
      return std::nullopt;
    }
    offset = std::chrono::hours{oh} + std::chrono::minutes{om};
    if (designator == '-')
    {
      offset = -offset;
    }
  }
  else
  {
    return std::nullopt;
  }

  if (pos != text.size())
  {
    return std::nullopt;
  }

  return Timestamp{std::chrono::sys_days{*date}} + *clock + fraction - offset;
}

std::string formatTimestamp(Timestamp instant)
{
  auto const dayPoint = std::chrono::floor<std::chrono::days>(instant);
  LocalDate const date{dayPoint};
  std::chrono::hh_mm_ss const timeOfDay{instant - dayPoint};

  std::ostringstream oss;
  oss << formatDate(date) << 'T' << std::setfill('0') << std::setw(2)
      << timeOfDay.hours().count() << ':' << std::setw(2)
      << timeOfDay.minutes().count() << ':' << std::setw(2)
      << timeOfDay.seconds().count() << '.' << std::setw(3)
      << timeOfDay.subseconds().count() << 'Z';
  return oss.str();
}

std::optional<LocalDate> parseDate(std::string_view text)
{
  std::size_t pos = 0;
  auto date = readDate(text, pos);
  if (!date || pos != text.size())
  {
    return std::nullopt;
  }
  return date;
}

std::string formatDate(LocalDate date)
{
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(date.year())
      << '-' << std::setw(2) << static_cast<unsigned>(date.month()) << '-'
      << std::setw(2) << static_cast<unsigned>(date.day());
  return oss.str();
}

std::optional<std::chrono::seconds> parseClockTime(std::string_view text)
{
  std::size_t pos = 0;
  auto clock = readClock(text, pos);
  if (!clock || pos != text.size())
  {
    return std::nullopt;
  }
  return clock;
}

double hoursBetween(Timestamp from, Timestamp to)
{
  return std::chrono::duration<double, std::ratio<3600>>{to - from}.count();
}

LocalDate localDateOf(Timestamp instant, std::chrono::minutes utcOffset)
{
  return LocalDate{std::chrono::floor<std::chrono::days>(instant + utcOffset)};
}

}  // namespace hbt_core
