// include/macross/backtest/backtest_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "macross/core/config_base.hpp"
#include "macross/core/error.hpp"

namespace macross {

/**
 * @brief Which pipeline a backtest runs
 */
enum class BacktestVariant {
    SIMPLE,   // Binary position, strategy returns from instrument returns
    ENHANCED  // Cash/invested capital simulation, returns from portfolio value
};

/**
 * @brief How much capital a buy signal commits
 */
enum class SizingMode {
    FULL_CASH,          // All available cash
    VOLATILITY_SCALED   // Position sizer output, capped at available cash
};

/**
 * @brief Reference maximum used to normalize volatility in the position sizer
 */
enum class VolatilityNormalization {
    TRAILING_MAX,     // Volatility at the buy bar against the maximum up to that bar
    FULL_SERIES_MAX   // Final-bar volatility against the whole-series maximum
};

/**
 * @brief How invested capital is valued between trades
 */
enum class ValuationMode {
    COST_BASIS,      // Carried at the cost paid on entry
    MARK_TO_MARKET   // Held shares revalued at each close
};

std::string variant_to_string(BacktestVariant variant);
std::string sizing_mode_to_string(SizingMode mode);
std::string normalization_to_string(VolatilityNormalization normalization);
std::string valuation_to_string(ValuationMode mode);

/**
 * @brief Moving average crossover parameters
 */
struct CrossoverConfig {
    int short_window{20};
    int long_window{50};

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

/**
 * @brief Volatility estimation and position sizing parameters
 */
struct SizingConfig {
    int volatility_window{20};
    double base_allocation_fraction{0.10};  // Fraction of initial capital
    SizingMode sizing_mode{SizingMode::VOLATILITY_SCALED};
    VolatilityNormalization normalization{VolatilityNormalization::TRAILING_MAX};
    ValuationMode valuation{ValuationMode::COST_BASIS};

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

/**
 * @brief Annualization and risk-free parameters of the metrics
 */
struct MetricsConfig {
    double bars_per_year{245.0 * 25.0};  // 245 sessions of 25 fifteen-minute bars
    double risk_free_rate{0.06};

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

/**
 * @brief Complete configuration of a backtest run or batch
 */
struct BacktestConfig : public ConfigBase {
    BacktestVariant variant{BacktestVariant::ENHANCED};
    double initial_capital{100000.0};
    CrossoverConfig crossover;
    SizingConfig sizing;
    MetricsConfig metrics;
    int max_parallel_instruments{1};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Check every parameter is usable
     * @return INVALID_ARGUMENT naming the first offending parameter
     */
    Result<void> validate() const;
};

}  // namespace macross
