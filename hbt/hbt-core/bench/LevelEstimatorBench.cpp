// Purpose: Profile level estimation and timeline sampling over a long history

#include <benchmark/benchmark.h>

#include <chrono>
#include <random>
#include <string>
#include <vector>

#include "hbt-core/src/ConsumptionEvent.hpp"
#include "hbt-core/src/LevelEstimator.hpp"
#include "hbt-core/src/LevelTimeline.hpp"
#include "hbt-core/src/Timestamp.hpp"

using namespace hbt_core;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

Timestamp referenceInstant()
{
  return Timestamp{std::chrono::sys_days{std::chrono::year{2024} / 3 / 10}} +
         std::chrono::hours{22};
}

// Events spread over the days before the reference instant
std::vector<ConsumptionEvent> generateHistory(std::size_t count, int days)
{
  std::mt19937 rng{42};
  std::uniform_int_distribution<long> offsetDist{0, days * 24L * 60L};
  std::uniform_real_distribution<double> amountDist{20.0, 200.0};

  std::vector<ConsumptionEvent> events;
  events.reserve(count);
  for (std::size_t i = 0; i < count; ++i)
  {
    events.emplace_back("e" + std::to_string(i),
                        "caffeine",
                        referenceInstant() -
                          std::chrono::minutes{offsetDist(rng)},
                        amountDist(rng));
  }
  return events;
}

}  // namespace

// ============================================================================
// Benchmarks
// ============================================================================

static void BM_EstimateLevel(benchmark::State& state)
{
  auto const count = static_cast<std::size_t>(state.range(0));
  auto const events = generateHistory(count, 7);
  Timestamp const reference = referenceInstant();

  for (auto _ : state)
  {
    auto result = LevelEstimator::estimateLevel(events, reference, 5.0);
    benchmark::DoNotOptimize(result.level);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EstimateLevel)->RangeMultiplier(4)->Range(16, 4096);

static void BM_GenerateTimeline(benchmark::State& state)
{
  auto const count = static_cast<std::size_t>(state.range(0));
  auto const events = generateHistory(count, 3);
  Timestamp const end = referenceInstant();
  Timestamp const start = end - std::chrono::hours{24};

  for (auto _ : state)
  {
    auto samples = LevelTimeline::generate(events, start, end, 5.0);
    benchmark::DoNotOptimize(samples.data());
  }
}
BENCHMARK(BM_GenerateTimeline)->RangeMultiplier(4)->Range(16, 1024);

BENCHMARK_MAIN();
