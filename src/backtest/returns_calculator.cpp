// src/backtest/returns_calculator.cpp
#include "macross/backtest/returns_calculator.hpp"
#include <string>
#include "macross/statistics/series_statistics.hpp"

namespace macross {

std::vector<double> ReturnsCalculator::instrument_returns(const std::vector<double>& closes) {
    return statistics::percent_change(closes);
}

Result<std::vector<double>> ReturnsCalculator::strategy_returns(
    const std::vector<double>& instrument_returns, const std::vector<int>& positions) {
    if (instrument_returns.size() != positions.size()) {
        return make_error<std::vector<double>>(
            ErrorCode::INVALID_ARGUMENT,
            "Returns and positions differ in length: " +
                std::to_string(instrument_returns.size()) + " vs " +
                std::to_string(positions.size()),
            "ReturnsCalculator");
    }

    std::vector<double> returns(instrument_returns.size(), kUndefined);
    for (size_t i = 1; i < instrument_returns.size(); ++i) {
        returns[i] = instrument_returns[i] * static_cast<double>(positions[i - 1]);
    }
    return Result<std::vector<double>>(std::move(returns));
}

std::vector<double> ReturnsCalculator::portfolio_returns(
    const std::vector<PortfolioState>& states) {
    return statistics::percent_change(portfolio_values(states));
}

std::vector<double> ReturnsCalculator::cumulative_returns(const std::vector<double>& returns) {
    return statistics::cumulative_growth(returns);
}

std::vector<double> ReturnsCalculator::portfolio_values(
    const std::vector<PortfolioState>& states) {
    std::vector<double> values;
    values.reserve(states.size());
    for (const auto& state : states) {
        values.push_back(state.portfolio_value);
    }
    return values;
}

}  // namespace macross
