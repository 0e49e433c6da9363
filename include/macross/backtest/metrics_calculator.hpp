// include/macross/backtest/metrics_calculator.hpp
#pragma once

#include <string>
#include <vector>
#include "macross/backtest/backtest_config.hpp"
#include "macross/core/error.hpp"
#include "macross/core/types.hpp"

namespace macross {

/**
 * @brief Pure stateless calculation of risk-adjusted performance metrics
 *
 * One code path serves both backtest variants: the caller chooses which
 * period return series and which value series to supply.
 *
 * Design principles:
 * - All methods are const (no state mutation)
 * - No logging (caller is responsible for logging)
 * - Undefined inputs are reported as errors, never coerced to zero or infinity
 */
class PerformanceMetricsCalculator {
public:
    explicit PerformanceMetricsCalculator(MetricsConfig config);

    // ========== Return Metrics ==========

    /**
     * @brief Compound annualized return
     *
     * (prod(1 + r))^(bars_per_year / n) - 1 over the n defined returns.
     * @return INSUFFICIENT_DATA when no defined return exists
     */
    Result<double> annualized_return(const std::vector<double>& returns) const;

    // ========== Volatility Metrics ==========

    /**
     * @brief Sample standard deviation of the defined returns times sqrt(bars_per_year)
     * @return INSUFFICIENT_DATA with fewer than two defined returns
     */
    Result<double> annualized_volatility(const std::vector<double>& returns) const;

    // ========== Risk-Adjusted Return Metrics ==========

    /**
     * @brief (annualized_return - risk_free_rate) / annualized_volatility
     * @return DEGENERATE_VOLATILITY when the volatility is zero or undefined
     */
    Result<double> sharpe_ratio(double annualized_return, double annualized_volatility) const;

    // ========== Drawdown Metrics ==========

    /**
     * @brief Per-element drawdown value / running_max(value) - 1, NaN where value is
     */
    std::vector<double> drawdowns(const std::vector<double>& values) const;

    /**
     * @brief Most negative drawdown of the value series, always <= 0
     * @return INSUFFICIENT_DATA when no defined value exists
     */
    Result<double> max_drawdown(const std::vector<double>& values) const;

    // ========== Composite Calculation ==========

    /**
     * @brief All four metrics for one instrument
     *
     * Fields whose computation fails are left NaN. status records the first
     * degradation encountered (insufficient data before degenerate volatility).
     * @param instrument_id Identifier copied to the record
     * @param returns Period returns, first element undefined
     * @param values Value or cumulative return series used for drawdown
     */
    PerformanceMetrics calculate(const std::string& instrument_id,
                                 const std::vector<double>& returns,
                                 const std::vector<double>& values) const;

    const MetricsConfig& config() const {
        return config_;
    }

private:
    MetricsConfig config_;
};

}  // namespace macross
