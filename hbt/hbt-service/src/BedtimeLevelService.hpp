#ifndef HBT_SERVICE_BEDTIME_LEVEL_SERVICE_HPP
#define HBT_SERVICE_BEDTIME_LEVEL_SERVICE_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>
#include <spdlog/spdlog.h>

#include "hbt-core/src/ConsumptionEvent.hpp"
#include "hbt-core/src/EstimatorErrors.hpp"
#include "hbt-core/src/HabitDecayProfile.hpp"
#include "hbt-core/src/LevelTimeline.hpp"
#include "hbt-core/src/LookbackWindowPolicy.hpp"
#include "hbt-core/src/ReferenceInstantResolver.hpp"
#include "hbt-core/src/Timestamp.hpp"
#include "hbt-db/src/ConsumptionEventStore.hpp"
#include "hbt-db/src/HabitStore.hpp"
#include "hbt-db/src/LevelStore.hpp"

namespace hbt_service
{

/**
 * @brief Level of one habit at the reference instant of a logged date
 */
struct DailyLevel
{
  std::string habitId;
  hbt_core::LocalDate date{};
  double level{0.0};
  std::string unit;
  hbt_core::Timestamp referenceInstant{};
  bool usedDefaultClockTime{false};
  bool projected{false};  // referenceInstant is still in the future
  // Any event, zero amounts included, was logged on the date itself
  bool hasLoggedEvents{false};
  std::vector<hbt_core::ConsumptionEvent> includedEvents;
  std::vector<hbt_core::RejectedEvent> rejectedEvents;
};

/**
 * @brief Computes bedtime levels from stored habits and events
 *
 * Ties the stores to the pure estimator: loads the habit's decay
 * configuration, resolves the reference instant, queries the lookback window
 * and sums the decayed contributions. Decay configuration is read per call;
 * nothing is cached between calls.
 *
 * The referenced Database must outlive the service.
 */
class BedtimeLevelService
{
public:
  struct Config
  {
    hbt_core::ReferenceInstantResolver::Config resolver{};
    hbt_core::LookbackMode lookbackMode{hbt_core::LookbackMode::ThreeHalfLives};
  };

  BedtimeLevelService(cpp_sqlite::Database& db,
                      std::shared_ptr<spdlog::logger> logger);

  /**
   * @throws std::invalid_argument if the logger is null or the resolver
   *         configuration is out of range
   */
  BedtimeLevelService(cpp_sqlite::Database& db,
                      std::shared_ptr<spdlog::logger> logger,
                      const Config& config);

  /**
   * @brief Estimate the level at the reference instant of a logged date
   *
   * @param habitualClockTime "HH:MM" or "HH:MM:SS"; missing or unparsable
   *        values fall back to the configured default
   * @throws std::runtime_error if the habit does not exist for this user
   * @throws hbt_core::InvalidConfiguration if the habit does not track decay
   *         or its decay configuration is unusable
   */
  [[nodiscard]] DailyLevel computeForDate(
    const std::string& userId,
    const std::string& habitId,
    hbt_core::LocalDate loggedDate,
    std::optional<std::string_view> habitualClockTime,
    hbt_core::Timestamp now);

  /**
   * @brief Store a computed level, replacing any earlier one for that date
   */
  void persist(const std::string& userId,
               const DailyLevel& level,
               hbt_core::Timestamp calculatedAt);

  /**
   * @brief Sampled level curve of a habit between two instants
   *
   * Events from the lookback window before `start` are included so that the
   * curve does not start at zero.
   *
   * @throws std::runtime_error if the habit does not exist for this user
   * @throws hbt_core::InvalidConfiguration as computeForDate()
   */
  [[nodiscard]] std::vector<hbt_core::LevelSample> timeline(
    const std::string& userId,
    const std::string& habitId,
    hbt_core::Timestamp start,
    hbt_core::Timestamp end,
    std::chrono::minutes interval = std::chrono::minutes{30});

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

private:
  struct LoadedHabit
  {
    hbt_core::HabitDecayProfile profile;
    std::string unit;
  };

  LoadedHabit loadHabit(const std::string& userId, const std::string& habitId);

  void reportRejections(const std::string& habitId,
                        const std::vector<hbt_core::RejectedEvent>& rejected);

  Config config_;
  std::shared_ptr<spdlog::logger> logger_;
  hbt_core::ReferenceInstantResolver resolver_;
  hbt_db::HabitStore habits_;
  hbt_db::ConsumptionEventStore events_;
  hbt_db::LevelStore levels_;
};

}  // namespace hbt_service

#endif  // HBT_SERVICE_BEDTIME_LEVEL_SERVICE_HPP
