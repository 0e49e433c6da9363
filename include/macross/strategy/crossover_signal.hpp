// include/macross/strategy/crossover_signal.hpp
#pragma once

#include <vector>
#include "macross/core/error.hpp"
#include "macross/core/types.hpp"

namespace macross {

/**
 * @brief Turns a fast/slow moving average pair into discrete crossover signals
 *
 * Bar i is compared with bar i-1 only. BUY when the fast average moves from
 * strictly below to strictly above the slow one, SELL for the reverse, HOLD
 * otherwise. Ties at either bar and undefined averages never signal. Bar 0 is
 * always HOLD.
 */
class CrossoverSignalGenerator {
public:
    CrossoverSignalGenerator() = default;

    /**
     * @brief Generate one signal per bar
     * @param short_ma Fast average, NaN where undefined
     * @param long_ma Slow average, NaN where undefined
     * @return Signals aligned with the inputs, or INVALID_ARGUMENT if the two
     *         series differ in length
     */
    Result<std::vector<Signal>> generate(const std::vector<double>& short_ma,
                                         const std::vector<double>& long_ma) const;

    /**
     * @brief Transition rule for a single consecutive bar pair
     */
    static Signal evaluate(double prev_short, double prev_long, double curr_short,
                           double curr_long);
};

}  // namespace macross
