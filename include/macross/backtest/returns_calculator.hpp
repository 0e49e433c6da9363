// include/macross/backtest/returns_calculator.hpp
#pragma once

#include <vector>
#include "macross/core/error.hpp"
#include "macross/core/types.hpp"

namespace macross {

/**
 * @brief Period and cumulative return series for both backtest variants
 *
 * Every period return series has an undefined (NaN) first element.
 */
class ReturnsCalculator {
public:
    /**
     * @brief Close-to-close returns of the instrument itself
     */
    static std::vector<double> instrument_returns(const std::vector<double>& closes);

    /**
     * @brief Returns earned by the simple variant
     *
     * strategy[i] = instrument[i] * position[i-1]: the position held at the
     * close of bar i-1 earns bar i's move.
     * @return INVALID_ARGUMENT when the inputs differ in length
     */
    static Result<std::vector<double>> strategy_returns(
        const std::vector<double>& instrument_returns, const std::vector<int>& positions);

    /**
     * @brief Returns of the simulated portfolio value
     */
    static std::vector<double> portfolio_returns(const std::vector<PortfolioState>& states);

    /**
     * @brief Growth of one unit invested at the start, NaN where returns are
     */
    static std::vector<double> cumulative_returns(const std::vector<double>& returns);

    /**
     * @brief Portfolio value series extracted from the simulation states
     */
    static std::vector<double> portfolio_values(const std::vector<PortfolioState>& states);
};

}  // namespace macross
