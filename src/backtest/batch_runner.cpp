// src/backtest/batch_runner.cpp
#include "macross/backtest/batch_runner.hpp"
#include <algorithm>
#include <future>
#include "macross/core/logger.hpp"
#include "macross/data/series_preprocessor.hpp"

namespace macross {

BatchRunner::BatchRunner(BacktestConfig config)
    : config_(config), backtester_(std::move(config)) {}

Result<std::vector<PerformanceMetrics>> BatchRunner::run(const std::vector<Bar>& bars) const {
    return run(SeriesPreprocessor::group_by_instrument(bars));
}

Result<std::vector<PerformanceMetrics>> BatchRunner::run(
    const std::vector<std::pair<std::string, std::vector<Bar>>>& series) const {
    auto valid = config_.validate();
    if (valid.is_error()) {
        return make_error<std::vector<PerformanceMetrics>>(valid.error()->code(),
                                                           valid.error()->what(), "BatchRunner");
    }

    INFO("Backtesting " << series.size() << " instruments, "
                        << variant_to_string(config_.variant) << " variant, up to "
                        << config_.max_parallel_instruments << " in parallel");

    std::vector<PerformanceMetrics> results;
    results.reserve(series.size());

    const size_t parallel = static_cast<size_t>(config_.max_parallel_instruments);
    if (parallel <= 1) {
        for (const auto& [instrument_id, bars] : series) {
            results.push_back(run_instrument(instrument_id, bars));
        }
    } else {
        for (size_t start = 0; start < series.size(); start += parallel) {
            size_t end = std::min(start + parallel, series.size());

            std::vector<std::future<PerformanceMetrics>> pending;
            pending.reserve(end - start);
            for (size_t i = start; i < end; ++i) {
                const auto& entry = series[i];
                pending.push_back(std::async(std::launch::async, [this, &entry]() {
                    Logger::register_component(entry.first);
                    return run_instrument(entry.first, entry.second);
                }));
            }

            for (auto& future : pending) {
                results.push_back(future.get());
            }
        }
    }

    size_t degraded = std::count_if(results.begin(), results.end(), [](const auto& m) {
        return m.status != RunStatus::OK;
    });
    INFO("Backtest batch complete: " << results.size() << " instruments, " << degraded
                                     << " with undefined metrics");
    return Result<std::vector<PerformanceMetrics>>(std::move(results));
}

PerformanceMetrics BatchRunner::run_instrument(const std::string& instrument_id,
                                               const std::vector<Bar>& bars) const {
    try {
        auto result = backtester_.run_metrics(instrument_id, bars);
        if (result.is_ok()) {
            return result.value();
        }
        ERROR(instrument_id << ": backtest failed: " << result.error()->to_string());
    } catch (const std::exception& e) {
        ERROR(instrument_id << ": backtest threw: " << e.what());
    }

    PerformanceMetrics metrics;
    metrics.instrument_id = instrument_id;
    metrics.bars = bars.size();
    metrics.status = RunStatus::INVALID_DATA;
    if (config_.variant == BacktestVariant::ENHANCED) {
        metrics.final_portfolio_value = kUndefined;
    }
    return metrics;
}

}  // namespace macross
