// include/macross/backtest/batch_runner.hpp
#pragma once

#include <string>
#include <utility>
#include <vector>
#include "macross/backtest/backtest_config.hpp"
#include "macross/backtest/crossover_backtester.hpp"
#include "macross/core/error.hpp"
#include "macross/core/types.hpp"

namespace macross {

/**
 * @brief Runs one independent backtest per instrument of a dataset
 *
 * Instruments share no state, so up to max_parallel_instruments of them run
 * concurrently. Results come back in order of first appearance regardless of
 * completion order. A failing instrument yields a NaN record and never stops
 * the batch.
 */
class BatchRunner {
public:
    explicit BatchRunner(BacktestConfig config);

    /**
     * @brief Group a multi-instrument bar list and backtest every instrument
     * @return One record per instrument, or INVALID_ARGUMENT for a bad config
     */
    Result<std::vector<PerformanceMetrics>> run(const std::vector<Bar>& bars) const;

    /**
     * @brief Backtest already grouped series
     */
    Result<std::vector<PerformanceMetrics>> run(
        const std::vector<std::pair<std::string, std::vector<Bar>>>& series) const;

private:
    BacktestConfig config_;
    CrossoverBacktester backtester_;

    PerformanceMetrics run_instrument(const std::string& instrument_id,
                                      const std::vector<Bar>& bars) const;
};

}  // namespace macross
