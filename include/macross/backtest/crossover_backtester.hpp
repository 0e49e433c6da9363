// include/macross/backtest/crossover_backtester.hpp
#pragma once

#include <string>
#include <vector>
#include "macross/backtest/backtest_config.hpp"
#include "macross/backtest/metrics_calculator.hpp"
#include "macross/core/error.hpp"
#include "macross/core/types.hpp"

namespace macross {

/**
 * @brief Everything a single instrument run produced
 */
struct BacktestRun {
    PerformanceMetrics metrics;
    std::vector<SeriesState> series;         // One per input bar
    std::vector<PortfolioState> portfolio;   // Enhanced variant only
    std::vector<double> returns;             // Period returns fed to the metrics
    std::vector<double> values;              // Value series fed to the drawdown
};

/**
 * @brief Dual moving average crossover backtest of one instrument
 *
 * Pipeline: moving averages -> crossover signals -> (simple) binary position
 * and strategy returns, or (enhanced) volatility-sized portfolio simulation
 * and portfolio returns -> performance metrics.
 *
 * Per-instrument failures never surface as errors: a series shorter than the
 * long window, a degenerate volatility or an invalid close produce a
 * metrics record with NaN fields and the matching status.
 */
class CrossoverBacktester {
public:
    explicit CrossoverBacktester(BacktestConfig config);

    /**
     * @brief Run the configured variant over one instrument's bars
     * @param instrument_id Identifier copied to the metrics record
     * @param bars Bars in time order
     * @return The run, or INVALID_ARGUMENT if the configuration is invalid
     */
    Result<BacktestRun> run(const std::string& instrument_id, const std::vector<Bar>& bars) const;

    /**
     * @brief Convenience wrapper returning only the metrics record
     */
    Result<PerformanceMetrics> run_metrics(const std::string& instrument_id,
                                           const std::vector<Bar>& bars) const;

    const BacktestConfig& config() const {
        return config_;
    }

private:
    BacktestConfig config_;
    PerformanceMetricsCalculator metrics_calculator_;

    Result<void> run_simple(BacktestRun& run, const std::vector<double>& closes) const;
    Result<void> run_enhanced(BacktestRun& run, const std::vector<double>& closes) const;

    PerformanceMetrics degraded_metrics(const std::string& instrument_id, size_t bars,
                                        RunStatus status) const;
};

}  // namespace macross
