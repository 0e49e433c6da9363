// src/indicators/moving_average.cpp
#include "macross/indicators/moving_average.hpp"
#include <numeric>
#include <string>
#include "macross/core/types.hpp"

namespace macross {

MovingAverageCalculator::MovingAverageCalculator(int short_window, int long_window)
    : short_window_(short_window), long_window_(long_window) {}

Result<MovingAveragePair> MovingAverageCalculator::calculate(
    const std::vector<double>& closes) const {
    if (short_window_ < 1 || long_window_ < 1) {
        return make_error<MovingAveragePair>(
            ErrorCode::INVALID_ARGUMENT,
            "Moving average windows must be positive, got " + std::to_string(short_window_) +
                " and " + std::to_string(long_window_),
            "MovingAverageCalculator");
    }

    MovingAveragePair averages;
    averages.short_ma = simple_moving_average(closes, short_window_);
    averages.long_ma = simple_moving_average(closes, long_window_);
    return Result<MovingAveragePair>(std::move(averages));
}

std::vector<double> MovingAverageCalculator::simple_moving_average(
    const std::vector<double>& values, int window) {
    std::vector<double> sma(values.size(), kUndefined);
    if (window < 1) {
        return sma;
    }

    const size_t w = static_cast<size_t>(window);
    // Each window is summed from scratch, no rounding drift carries across bars
    for (size_t i = w - 1; i < values.size(); ++i) {
        double sum = std::accumulate(values.begin() + (i + 1 - w), values.begin() + (i + 1), 0.0);
        sma[i] = sum / static_cast<double>(w);
    }
    return sma;
}

}  // namespace macross
