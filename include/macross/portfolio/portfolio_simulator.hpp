// include/macross/portfolio/portfolio_simulator.hpp
#pragma once

#include <vector>
#include "macross/backtest/backtest_config.hpp"
#include "macross/core/error.hpp"
#include "macross/core/types.hpp"
#include "macross/portfolio/position_sizer.hpp"

namespace macross {

/**
 * @brief Outcome of a portfolio simulation
 */
struct SimulationResult {
    std::vector<PortfolioState> states;  // One per bar, states[0] is the seed
    int trades_executed{0};              // Buys and liquidating sells that went through
    int trades_skipped{0};               // Buys that could not be funded
};

/**
 * @brief Executes crossover signals against a cash account, one bar at a time
 *
 * Bar 0 seeds cash with the initial capital and nothing invested. For every
 * later bar:
 *  - BUY commits the allocation policy's amount, capped at cash. The trade is
 *    skipped when it cannot be funded.
 *  - SELL returns the invested capital to cash.
 *  - HOLD carries invested capital forward (COST_BASIS) or revalues the held
 *    shares at the bar's close (MARK_TO_MARKET).
 * portfolio_value = cash + invested_capital on every bar.
 */
class PortfolioSimulator {
public:
    PortfolioSimulator(double initial_capital, ValuationMode valuation);

    /**
     * @brief Run the simulation
     * @param closes Closing prices in time order
     * @param signals Crossover signals aligned with closes
     * @param policy Allocation used for buys
     * @return Per-bar states, INVALID_ARGUMENT on misaligned inputs, or the
     *         policy's error when a buy cannot be sized
     */
    Result<SimulationResult> simulate(const std::vector<double>& closes,
                                      const std::vector<Signal>& signals,
                                      const AllocationPolicy& policy) const;

private:
    double initial_capital_;
    ValuationMode valuation_;
};

}  // namespace macross
