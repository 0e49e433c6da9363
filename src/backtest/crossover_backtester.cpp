// src/backtest/crossover_backtester.cpp
#include "macross/backtest/crossover_backtester.hpp"
#include <algorithm>
#include <memory>
#include "macross/backtest/returns_calculator.hpp"
#include "macross/core/logger.hpp"
#include "macross/core/time_utils.hpp"
#include "macross/data/series_preprocessor.hpp"
#include "macross/indicators/moving_average.hpp"
#include "macross/indicators/volatility_estimator.hpp"
#include "macross/portfolio/portfolio_simulator.hpp"
#include "macross/portfolio/position_sizer.hpp"
#include "macross/strategy/crossover_signal.hpp"
#include "macross/strategy/position_tracker.hpp"

namespace macross {

namespace {

void count_signals(BacktestRun& run) {
    run.metrics.buy_signals = 0;
    run.metrics.sell_signals = 0;
    for (const auto& state : run.series) {
        if (state.signal == Signal::BUY)
            run.metrics.buy_signals++;
        else if (state.signal == Signal::SELL)
            run.metrics.sell_signals++;
    }
}

}  // namespace

CrossoverBacktester::CrossoverBacktester(BacktestConfig config)
    : config_(std::move(config)), metrics_calculator_(config_.metrics) {}

Result<PerformanceMetrics> CrossoverBacktester::run_metrics(const std::string& instrument_id,
                                                           const std::vector<Bar>& bars) const {
    auto result = run(instrument_id, bars);
    if (result.is_error()) {
        return make_error<PerformanceMetrics>(result.error()->code(), result.error()->what(),
                                              "CrossoverBacktester");
    }
    return Result<PerformanceMetrics>(result.value().metrics);
}

Result<BacktestRun> CrossoverBacktester::run(const std::string& instrument_id,
                                             const std::vector<Bar>& bars) const {
    auto valid = config_.validate();
    if (valid.is_error()) {
        return make_error<BacktestRun>(valid.error()->code(), valid.error()->what(),
                                       "CrossoverBacktester");
    }

    BacktestRun run;
    run.series.reserve(bars.size());
    for (const auto& bar : bars) {
        SeriesState state;
        state.timestamp = bar.timestamp;
        state.close = bar.close;
        run.series.push_back(state);
    }

    auto data_check = SeriesPreprocessor::validate(bars);
    if (data_check.is_error()) {
        WARN(instrument_id << ": " << data_check.error()->what() << ", metrics left undefined");
        run.metrics = degraded_metrics(instrument_id, bars.size(), RunStatus::INVALID_DATA);
        return Result<BacktestRun>(std::move(run));
    }

    const auto closes = SeriesPreprocessor::closes(bars);

    MovingAverageCalculator ma_calculator(config_.crossover.short_window,
                                          config_.crossover.long_window);
    auto averages = ma_calculator.calculate(closes);
    if (averages.is_error()) {
        return make_error<BacktestRun>(averages.error()->code(), averages.error()->what(),
                                       "CrossoverBacktester");
    }

    auto signals = CrossoverSignalGenerator().generate(averages.value().short_ma,
                                                       averages.value().long_ma);
    if (signals.is_error()) {
        return make_error<BacktestRun>(signals.error()->code(), signals.error()->what(),
                                       "CrossoverBacktester");
    }

    for (size_t i = 0; i < run.series.size(); ++i) {
        run.series[i].sma_short = averages.value().short_ma[i];
        run.series[i].sma_long = averages.value().long_ma[i];
        run.series[i].signal = signals.value()[i];
    }

    if (bars.size() < static_cast<size_t>(config_.crossover.long_window)) {
        WARN(instrument_id << ": " << bars.size() << " bars, fewer than the long window of "
                           << config_.crossover.long_window << ", metrics left undefined");
        run.metrics = degraded_metrics(instrument_id, bars.size(), RunStatus::INSUFFICIENT_DATA);
        count_signals(run);
        return Result<BacktestRun>(std::move(run));
    }

    auto outcome = config_.variant == BacktestVariant::SIMPLE ? run_simple(run, closes)
                                                              : run_enhanced(run, closes);
    if (outcome.is_error()) {
        if (outcome.error()->code() != ErrorCode::DEGENERATE_VOLATILITY) {
            return make_error<BacktestRun>(outcome.error()->code(), outcome.error()->what(),
                                           "CrossoverBacktester");
        }
        WARN(instrument_id << ": " << outcome.error()->what() << ", metrics left undefined");
        run.metrics =
            degraded_metrics(instrument_id, bars.size(), RunStatus::DEGENERATE_VOLATILITY);
        count_signals(run);
        return Result<BacktestRun>(std::move(run));
    }

    run.metrics.instrument_id = instrument_id;
    run.metrics.bars = bars.size();
    count_signals(run);

    DEBUG(instrument_id << ": " << variant_to_string(config_.variant) << " run over "
                        << bars.size() << " bars from "
                        << core::format_timestamp(bars.front().timestamp) << " to "
                        << core::format_timestamp(bars.back().timestamp) << ", "
                        << run.metrics.buy_signals << " buys, "
                        << run.metrics.sell_signals << " sells, status "
                        << run_status_to_string(run.metrics.status));
    return Result<BacktestRun>(std::move(run));
}

Result<void> CrossoverBacktester::run_simple(BacktestRun& run,
                                             const std::vector<double>& closes) const {
    std::vector<Signal> signals;
    signals.reserve(run.series.size());
    for (const auto& state : run.series) {
        signals.push_back(state.signal);
    }

    auto positions = PositionTracker().track(signals);
    for (size_t i = 0; i < run.series.size(); ++i) {
        run.series[i].position = positions[i];
        run.series[i].position_size = static_cast<double>(positions[i]);
    }

    auto instrument_returns = ReturnsCalculator::instrument_returns(closes);
    auto strategy_returns = ReturnsCalculator::strategy_returns(instrument_returns, positions);
    if (strategy_returns.is_error()) {
        return make_error<void>(strategy_returns.error()->code(), strategy_returns.error()->what(),
                                "CrossoverBacktester");
    }

    run.returns = strategy_returns.value();
    run.values = ReturnsCalculator::cumulative_returns(run.returns);
    run.metrics = metrics_calculator_.calculate("", run.returns, run.values);

    auto benchmark_return = metrics_calculator_.annualized_return(instrument_returns);
    auto benchmark_vol = metrics_calculator_.annualized_volatility(instrument_returns);
    run.metrics.benchmark_annualized_return =
        benchmark_return.is_ok() ? benchmark_return.value() : kUndefined;
    run.metrics.benchmark_volatility = benchmark_vol.is_ok() ? benchmark_vol.value() : kUndefined;

    int trades = 0;
    for (size_t i = 1; i < positions.size(); ++i) {
        if (positions[i] != positions[i - 1]) {
            trades++;
        }
    }
    run.metrics.trades_executed = trades;
    return Result<void>();
}

Result<void> CrossoverBacktester::run_enhanced(BacktestRun& run,
                                               const std::vector<double>& closes) const {
    std::vector<Signal> signals;
    signals.reserve(run.series.size());
    for (const auto& state : run.series) {
        signals.push_back(state.signal);
    }

    std::unique_ptr<AllocationPolicy> policy;
    if (config_.sizing.sizing_mode == SizingMode::VOLATILITY_SCALED) {
        VolatilityEstimator estimator(config_.sizing.volatility_window,
                                      config_.metrics.bars_per_year);
        auto volatility = estimator.calculate(closes);
        if (volatility.is_error()) {
            return make_error<void>(volatility.error()->code(), volatility.error()->what(),
                                    "CrossoverBacktester");
        }

        auto sizer = PositionSizer::create(volatility.take(), config_.sizing,
                                           config_.initial_capital);
        if (sizer.is_error()) {
            return make_error<void>(sizer.error()->code(), sizer.error()->what(),
                                    "CrossoverBacktester");
        }
        policy = sizer.take();
    } else {
        policy = std::make_unique<FullCashAllocation>();
    }

    PortfolioSimulator simulator(config_.initial_capital, config_.sizing.valuation);
    auto simulation = simulator.simulate(closes, signals, *policy);
    if (simulation.is_error()) {
        return make_error<void>(simulation.error()->code(), simulation.error()->what(),
                                "CrossoverBacktester");
    }

    const auto& result = simulation.value();
    run.portfolio = result.states;
    for (size_t i = 0; i < run.series.size(); ++i) {
        run.series[i].position_size = run.portfolio[i].invested_capital;
        run.series[i].position = run.portfolio[i].shares_held > 0.0 ? PositionTracker::LONG
                                                                    : PositionTracker::FLAT;
    }

    run.values = ReturnsCalculator::portfolio_values(run.portfolio);
    run.returns = ReturnsCalculator::portfolio_returns(run.portfolio);
    run.metrics = metrics_calculator_.calculate("", run.returns, run.values);
    run.metrics.final_portfolio_value = run.values.empty() ? kUndefined : run.values.back();
    run.metrics.trades_executed = result.trades_executed;
    run.metrics.trades_skipped = result.trades_skipped;
    return Result<void>();
}

PerformanceMetrics CrossoverBacktester::degraded_metrics(const std::string& instrument_id,
                                                         size_t bars, RunStatus status) const {
    PerformanceMetrics metrics;
    metrics.instrument_id = instrument_id;
    metrics.bars = bars;
    metrics.status = status;
    if (config_.variant == BacktestVariant::ENHANCED) {
        metrics.final_portfolio_value = kUndefined;
    } else {
        metrics.benchmark_annualized_return = kUndefined;
        metrics.benchmark_volatility = kUndefined;
    }
    return metrics;
}

}  // namespace macross
