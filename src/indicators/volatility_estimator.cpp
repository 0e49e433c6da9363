// src/indicators/volatility_estimator.cpp
#include "macross/indicators/volatility_estimator.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include "macross/core/types.hpp"
#include "macross/statistics/series_statistics.hpp"

namespace macross {

VolatilityEstimator::VolatilityEstimator(int window, double bars_per_year)
    : window_(window), bars_per_year_(bars_per_year) {}

Result<std::vector<double>> VolatilityEstimator::calculate(
    const std::vector<double>& closes) const {
    return calculate_from_returns(statistics::percent_change(closes));
}

Result<std::vector<double>> VolatilityEstimator::calculate_from_returns(
    const std::vector<double>& returns) const {
    if (window_ < 2) {
        return make_error<std::vector<double>>(
            ErrorCode::INVALID_ARGUMENT,
            "Volatility window must be at least 2, got " + std::to_string(window_),
            "VolatilityEstimator");
    }
    if (!(bars_per_year_ > 0.0)) {
        return make_error<std::vector<double>>(ErrorCode::INVALID_ARGUMENT,
                                               "bars_per_year must be positive",
                                               "VolatilityEstimator");
    }

    const size_t w = static_cast<size_t>(window_);
    const double annualization = std::sqrt(bars_per_year_);
    std::vector<double> volatility(returns.size(), kUndefined);

    for (size_t i = w - 1; i < returns.size(); ++i) {
        size_t begin = i + 1 - w;
        bool complete = std::none_of(returns.begin() + begin, returns.begin() + i + 1,
                                     [](double r) { return std::isnan(r); });
        if (!complete) {
            continue;
        }
        volatility[i] = statistics::sample_stddev(returns, begin, i + 1) * annualization;
    }

    return Result<std::vector<double>>(std::move(volatility));
}

}  // namespace macross
