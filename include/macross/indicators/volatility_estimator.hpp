// include/macross/indicators/volatility_estimator.hpp
#pragma once

#include <vector>
#include "macross/core/error.hpp"

namespace macross {

/**
 * @brief Rolling annualized volatility of bar-to-bar returns
 *
 * Returns are close-to-close percent changes (the first bar has none). Element
 * i is the sample standard deviation of the window returns ending at i,
 * multiplied by sqrt(bars_per_year). NaN until window defined returns exist,
 * i.e. for i < window.
 */
class VolatilityEstimator {
public:
    VolatilityEstimator(int window, double bars_per_year);

    /**
     * @brief Compute the rolling volatility series
     * @param closes Closing prices in time order
     * @return Series aligned with closes, or INVALID_ARGUMENT for a bad window
     *         or annualization factor
     */
    Result<std::vector<double>> calculate(const std::vector<double>& closes) const;

    /**
     * @brief Same as calculate() but over an already computed return series
     */
    Result<std::vector<double>> calculate_from_returns(const std::vector<double>& returns) const;

    int window() const {
        return window_;
    }

    double bars_per_year() const {
        return bars_per_year_;
    }

private:
    int window_;
    double bars_per_year_;
};

}  // namespace macross
