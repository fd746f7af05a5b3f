#ifndef HBT_CORE_DECAY_FUNCTION_HPP
#define HBT_CORE_DECAY_FUNCTION_HPP

namespace hbt_core
{

/**
 * @brief Fraction of an initial dose remaining after first-order elimination
 *
 *   f(t) = 2^(-t / h)
 *
 * f(0) = 1, f(h) = 0.5, and f is monotonically non-increasing in t. No other
 * decay shape is supported.
 *
 * @param elapsedHours Time since the dose [h], must be >= 0
 * @param halfLifeHours Half-life [h], must be finite and > 0
 * @return Remaining fraction in [0, 1]
 * @throws InvalidConfiguration if halfLifeHours is not positive
 * @throws std::invalid_argument if elapsedHours is negative or NaN. Doses
 *         after the evaluation instant must be filtered out by the caller.
 */
[[nodiscard]] double remainingFraction(double elapsedHours,
                                       double halfLifeHours);

}  // namespace hbt_core

#endif  // HBT_CORE_DECAY_FUNCTION_HPP
