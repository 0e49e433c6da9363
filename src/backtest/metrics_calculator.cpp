// src/backtest/metrics_calculator.cpp
#include "macross/backtest/metrics_calculator.hpp"
#include <algorithm>
#include <cmath>
#include "macross/statistics/series_statistics.hpp"

namespace macross {

PerformanceMetricsCalculator::PerformanceMetricsCalculator(MetricsConfig config)
    : config_(config) {}

// ========== Return Metrics ==========

Result<double> PerformanceMetricsCalculator::annualized_return(
    const std::vector<double>& returns) const {
    auto defined = statistics::drop_undefined(returns);
    if (defined.empty()) {
        return make_error<double>(ErrorCode::INSUFFICIENT_DATA,
                                  "Annualized return needs at least one defined return",
                                  "PerformanceMetricsCalculator");
    }

    double growth = 1.0;
    for (double r : defined) {
        growth *= (1.0 + r);
    }

    double exponent = config_.bars_per_year / static_cast<double>(defined.size());
    return Result<double>(std::pow(growth, exponent) - 1.0);
}

// ========== Volatility Metrics ==========

Result<double> PerformanceMetricsCalculator::annualized_volatility(
    const std::vector<double>& returns) const {
    auto defined = statistics::drop_undefined(returns);
    if (defined.size() < 2) {
        return make_error<double>(ErrorCode::INSUFFICIENT_DATA,
                                  "Volatility needs at least two defined returns",
                                  "PerformanceMetricsCalculator");
    }

    return Result<double>(statistics::sample_stddev(defined) *
                          std::sqrt(config_.bars_per_year));
}

// ========== Risk-Adjusted Return Metrics ==========

Result<double> PerformanceMetricsCalculator::sharpe_ratio(double annualized_return,
                                                          double annualized_volatility) const {
    if (std::isnan(annualized_volatility) || annualized_volatility == 0.0) {
        return make_error<double>(ErrorCode::DEGENERATE_VOLATILITY,
                                  "Sharpe ratio undefined for zero or undefined volatility",
                                  "PerformanceMetricsCalculator");
    }
    if (std::isnan(annualized_return)) {
        return make_error<double>(ErrorCode::INSUFFICIENT_DATA,
                                  "Sharpe ratio undefined without an annualized return",
                                  "PerformanceMetricsCalculator");
    }

    return Result<double>((annualized_return - config_.risk_free_rate) / annualized_volatility);
}

// ========== Drawdown Metrics ==========

std::vector<double> PerformanceMetricsCalculator::drawdowns(
    const std::vector<double>& values) const {
    auto peaks = statistics::running_max(values);
    std::vector<double> result(values.size(), kUndefined);

    for (size_t i = 0; i < values.size(); ++i) {
        if (std::isnan(values[i]) || std::isnan(peaks[i]) || peaks[i] == 0.0) {
            continue;
        }
        result[i] = values[i] / peaks[i] - 1.0;
    }
    return result;
}

Result<double> PerformanceMetricsCalculator::max_drawdown(const std::vector<double>& values) const {
    auto defined = statistics::drop_undefined(drawdowns(values));
    if (defined.empty()) {
        return make_error<double>(ErrorCode::INSUFFICIENT_DATA,
                                  "Drawdown needs at least one defined value",
                                  "PerformanceMetricsCalculator");
    }

    return Result<double>(*std::min_element(defined.begin(), defined.end()));
}

// ========== Composite Calculation ==========

PerformanceMetrics PerformanceMetricsCalculator::calculate(const std::string& instrument_id,
                                                           const std::vector<double>& returns,
                                                           const std::vector<double>& values) const {
    PerformanceMetrics metrics;
    metrics.instrument_id = instrument_id;

    bool insufficient = false;
    bool degenerate = false;

    auto ret = annualized_return(returns);
    if (ret.is_ok()) {
        metrics.annualized_return = ret.value();
    } else {
        insufficient = true;
    }

    auto vol = annualized_volatility(returns);
    if (vol.is_ok()) {
        metrics.annualized_volatility = vol.value();
    } else {
        insufficient = true;
    }

    auto sharpe = sharpe_ratio(metrics.annualized_return, metrics.annualized_volatility);
    if (sharpe.is_ok()) {
        metrics.sharpe_ratio = sharpe.value();
    } else if (sharpe.error()->code() == ErrorCode::DEGENERATE_VOLATILITY &&
               !std::isnan(metrics.annualized_volatility)) {
        degenerate = true;
    }

    auto mdd = max_drawdown(values);
    if (mdd.is_ok()) {
        metrics.max_drawdown = mdd.value();
    } else {
        insufficient = true;
    }

    if (insufficient) {
        metrics.status = RunStatus::INSUFFICIENT_DATA;
    } else if (degenerate) {
        metrics.status = RunStatus::DEGENERATE_VOLATILITY;
    }
    return metrics;
}

}  // namespace macross
