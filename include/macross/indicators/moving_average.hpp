// include/macross/indicators/moving_average.hpp
#pragma once

#include <vector>
#include "macross/core/error.hpp"

namespace macross {

/**
 * @brief Short and long trailing means aligned with the input series
 */
struct MovingAveragePair {
    std::vector<double> short_ma;
    std::vector<double> long_ma;
};

/**
 * @brief Trailing simple moving averages over closing prices
 *
 * For a window W, element i is the mean of values[i-W+1..i] and is NaN for
 * i < W-1. No value after i contributes to element i.
 */
class MovingAverageCalculator {
public:
    /**
     * @param short_window Length of the fast average
     * @param long_window Length of the slow average
     */
    MovingAverageCalculator(int short_window, int long_window);

    /**
     * @brief Compute both averages over a close price series
     * @param closes Closing prices in time order
     * @return Both averages, or INVALID_ARGUMENT for non-positive windows
     */
    Result<MovingAveragePair> calculate(const std::vector<double>& closes) const;

    /**
     * @brief Single trailing simple moving average
     */
    static std::vector<double> simple_moving_average(const std::vector<double>& values,
                                                     int window);

    int short_window() const {
        return short_window_;
    }
    int long_window() const {
        return long_window_;
    }

private:
    int short_window_;
    int long_window_;
};

}  // namespace macross
