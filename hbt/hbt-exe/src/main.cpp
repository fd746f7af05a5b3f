#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "hbt-core/src/HabitDecayProfile.hpp"
#include "hbt-core/src/LevelClassification.hpp"
#include "hbt-core/src/LevelTimeline.hpp"
#include "hbt-core/src/Timestamp.hpp"
#include "hbt-db/src/ConsumptionEventStore.hpp"
#include "hbt-db/src/HabitStore.hpp"
#include "hbt-service/src/BedtimeLevelService.hpp"
#include "hbt-transfer/src/Records.hpp"

namespace
{

constexpr int kExitUsage{1};
constexpr int kExitFailure{2};

class UsageError : public std::runtime_error
{
public:
  explicit UsageError(const std::string& what) : std::runtime_error{what}
  {
  }
};

void printUsage(const char* program)
{
  std::cerr
    << "Usage:\n"
    << "  " << program
    << " <db> add-habit <userId> <habitId> <name> <type> <unit>"
       " [halfLifeHours] [thresholdPercent]\n"
    << "  " << program
    << " <db> log <userId> <habitId> <eventId> <consumedAtIso> <amount>\n"
    << "  " << program
    << " <db> level <userId> <habitId> <YYYY-MM-DD> [HH:MM[:SS]] [--save]\n"
    << "  " << program
    << " <db> timeline <userId> <habitId> <fromIso> <toIso>"
       " [intervalMinutes]\n";
}

double parseNumber(const std::string& text, const char* what)
{
  char* end = nullptr;
  double const value = std::strtod(text.c_str(), &end);
  if (text.empty() || end != text.c_str() + text.size() ||
      !std::isfinite(value))
  {
    throw UsageError(std::string{"Invalid "} + what + ": " + text);
  }
  return value;
}

hbt_core::Timestamp parseInstant(const std::string& text)
{
  auto const instant = hbt_core::parseTimestamp(text);
  if (!instant)
  {
    throw UsageError("Invalid timestamp (ISO-8601 with offset): " + text);
  }
  return *instant;
}

hbt_core::Timestamp currentTime()
{
  return std::chrono::time_point_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now());
}

std::shared_ptr<spdlog::logger> namedLogger(const std::string& name)
{
  auto logger = spdlog::get(name);
  if (!logger)
  {
    logger = spdlog::stdout_color_mt(name);
  }
  return logger;
}

int addHabit(cpp_sqlite::Database& db, const std::vector<std::string>& args)
{
  if (args.size() < 5 || args.size() > 7)
  {
    throw UsageError("add-habit takes 5 to 7 arguments");
  }

  hbt_transfer::HabitRecord habit{};
  habit.user_id = args[0];
  habit.habit_id = args[1];
  habit.name = args[2];
  habit.type = args[3];
  habit.unit = args[4];
  if (args.size() > 5)
  {
    habit.half_life_hours = parseNumber(args[5], "half-life");
  }
  if (args.size() > 6)
  {
    habit.drug_threshold_percent = parseNumber(args[6], "threshold percent");
  }

  auto const type = hbt_db::parseHabitType(habit.type);
  if (!type)
  {
    throw UsageError("Unknown habit type: " + habit.type);
  }
  if (hbt_db::tracksDecay(*type))
  {
    // Reject an unusable decay configuration before it is stored
    auto const profile = hbt_core::HabitDecayProfile::fromConfiguration(
      args.size() > 5 ? std::optional<double>{habit.half_life_hours}
                      : std::nullopt,
      habit.drug_threshold_percent);
    std::cout << "Doses become negligible after "
              << profile.hoursToNegligible() << " h\n";
  }

  hbt_db::HabitStore store{db, namedLogger("hbt-db")};
  store.insert(habit);
  std::cout << "Added habit " << habit.habit_id << "\n";
  return 0;
}

int logEvent(cpp_sqlite::Database& db, const std::vector<std::string>& args)
{
  if (args.size() != 5)
  {
    throw UsageError("log takes 5 arguments");
  }

  hbt_transfer::ConsumptionEventRecord record{};
  record.user_id = args[0];
  record.habit_id = args[1];
  record.event_id = args[2];
  record.consumed_at = args[3];
  record.amount = parseNumber(args[4], "amount");

  hbt_db::ConsumptionEventStore store{db, namedLogger("hbt-db")};
  store.insert(record);
  std::cout << "Logged " << record.amount << " for " << record.habit_id
            << " at " << record.consumed_at << "\n";
  return 0;
}

int showLevel(cpp_sqlite::Database& db, const std::vector<std::string>& args)
{
  std::vector<std::string> positional;
  bool save{false};
  for (const auto& arg : args)
  {
    if (arg == "--save")
    {
      save = true;
    }
    else
    {
      positional.push_back(arg);
    }
  }
  if (positional.size() < 3 || positional.size() > 4)
  {
    throw UsageError("level takes 3 or 4 arguments");
  }

  auto const date = hbt_core::parseDate(positional[2]);
  if (!date)
  {
    throw UsageError("Invalid date (YYYY-MM-DD): " + positional[2]);
  }
  std::optional<std::string_view> clockTime;
  if (positional.size() == 4)
  {
    clockTime = positional[3];
  }

  hbt_service::BedtimeLevelService service{db, namedLogger("hbt-service")};
  auto const now = currentTime();
  auto const daily = service.computeForDate(
    positional[0], positional[1], *date, clockTime, now);

  auto const band = hbt_core::classifyLevel(
    daily.level, hbt_core::typicalDose(daily.includedEvents));

  std::cout << hbt_core::formatDate(daily.date) << " "
            << hbt_core::formatLevel(daily.level, daily.unit) << " ("
            << hbt_core::toString(band) << ") at "
            << hbt_core::formatTimestamp(daily.referenceInstant)
            << (daily.projected ? " [projected]" : "")
            << (daily.hasLoggedEvents ? "" : " [nothing logged]") << "\n";
  for (const auto& rejected : daily.rejectedEvents)
  {
    std::cout << "  skipped " << rejected.eventId << ": "
              << hbt_core::toString(rejected.reason) << "\n";
  }

  if (save)
  {
    service.persist(positional[0], daily, now);
  }
  return 0;
}

int showTimeline(cpp_sqlite::Database& db, const std::vector<std::string>& args)
{
  if (args.size() < 4 || args.size() > 5)
  {
    throw UsageError("timeline takes 4 or 5 arguments");
  }

  auto const start = parseInstant(args[2]);
  auto const end = parseInstant(args[3]);
  std::chrono::minutes interval{30};
  if (args.size() == 5)
  {
    auto const parsed = hbt_core::LevelTimeline::parseInterval(args[4]);
    if (!parsed)
    {
      throw UsageError("Interval must be between 1 and " +
                       std::to_string(
                         hbt_core::LevelTimeline::kMaxInterval.count()) +
                       " minutes: " + args[4]);
    }
    interval = *parsed;
  }

  hbt_service::BedtimeLevelService service{db, namedLogger("hbt-service")};
  auto const samples =
    service.timeline(args[0], args[1], start, end, interval);

  for (const auto& sample : samples)
  {
    std::cout << hbt_core::formatTimestamp(sample.time) << " "
              << sample.level << "\n";
  }
  std::cout << "max " << hbt_core::LevelTimeline::maxLevel(samples) << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv)
{
  if (argc < 3)
  {
    printUsage(argv[0]);
    return kExitUsage;
  }

  std::string const dbPath = argv[1];
  std::string const command = argv[2];
  std::vector<std::string> const args(argv + 3, argv + argc);

  try
  {
    cpp_sqlite::Database db{dbPath, true};

    if (command == "add-habit")
    {
      return addHabit(db, args);
    }
    if (command == "log")
    {
      return logEvent(db, args);
    }
    if (command == "level")
    {
      return showLevel(db, args);
    }
    if (command == "timeline")
    {
      return showTimeline(db, args);
    }
    throw UsageError("Unknown command: " + command);
  }
  catch (const UsageError& e)
  {
    std::cerr << e.what() << "\n";
    printUsage(argv[0]);
    return kExitUsage;
  }
  catch (const std::exception& e)
  {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitFailure;
  }
}
