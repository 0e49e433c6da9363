// src/backtest/backtest_config.cpp
#include "macross/backtest/backtest_config.hpp"

namespace macross {

std::string variant_to_string(BacktestVariant variant) {
    switch (variant) {
        case BacktestVariant::SIMPLE:
            return "SIMPLE";
        case BacktestVariant::ENHANCED:
            return "ENHANCED";
        default:
            return "UNKNOWN";
    }
}

std::string sizing_mode_to_string(SizingMode mode) {
    switch (mode) {
        case SizingMode::FULL_CASH:
            return "FULL_CASH";
        case SizingMode::VOLATILITY_SCALED:
            return "VOLATILITY_SCALED";
        default:
            return "UNKNOWN";
    }
}

std::string normalization_to_string(VolatilityNormalization normalization) {
    switch (normalization) {
        case VolatilityNormalization::TRAILING_MAX:
            return "TRAILING_MAX";
        case VolatilityNormalization::FULL_SERIES_MAX:
            return "FULL_SERIES_MAX";
        default:
            return "UNKNOWN";
    }
}

std::string valuation_to_string(ValuationMode mode) {
    switch (mode) {
        case ValuationMode::COST_BASIS:
            return "COST_BASIS";
        case ValuationMode::MARK_TO_MARKET:
            return "MARK_TO_MARKET";
        default:
            return "UNKNOWN";
    }
}

nlohmann::json CrossoverConfig::to_json() const {
    nlohmann::json j;
    j["short_window"] = short_window;
    j["long_window"] = long_window;
    return j;
}

void CrossoverConfig::from_json(const nlohmann::json& j) {
    if (j.contains("short_window"))
        short_window = j.at("short_window").get<int>();
    if (j.contains("long_window"))
        long_window = j.at("long_window").get<int>();
}

nlohmann::json SizingConfig::to_json() const {
    nlohmann::json j;
    j["volatility_window"] = volatility_window;
    j["base_allocation_fraction"] = base_allocation_fraction;
    j["sizing_mode"] = sizing_mode_to_string(sizing_mode);
    j["normalization"] = normalization_to_string(normalization);
    j["valuation"] = valuation_to_string(valuation);
    return j;
}

void SizingConfig::from_json(const nlohmann::json& j) {
    if (j.contains("volatility_window"))
        volatility_window = j.at("volatility_window").get<int>();
    if (j.contains("base_allocation_fraction"))
        base_allocation_fraction = j.at("base_allocation_fraction").get<double>();
    if (j.contains("sizing_mode")) {
        std::string mode = j.at("sizing_mode").get<std::string>();
        if (mode == "FULL_CASH")
            sizing_mode = SizingMode::FULL_CASH;
        else if (mode == "VOLATILITY_SCALED")
            sizing_mode = SizingMode::VOLATILITY_SCALED;
    }
    if (j.contains("normalization")) {
        std::string norm = j.at("normalization").get<std::string>();
        if (norm == "TRAILING_MAX")
            normalization = VolatilityNormalization::TRAILING_MAX;
        else if (norm == "FULL_SERIES_MAX")
            normalization = VolatilityNormalization::FULL_SERIES_MAX;
    }
    if (j.contains("valuation")) {
        std::string val = j.at("valuation").get<std::string>();
        if (val == "COST_BASIS")
            valuation = ValuationMode::COST_BASIS;
        else if (val == "MARK_TO_MARKET")
            valuation = ValuationMode::MARK_TO_MARKET;
    }
}

nlohmann::json MetricsConfig::to_json() const {
    nlohmann::json j;
    j["bars_per_year"] = bars_per_year;
    j["risk_free_rate"] = risk_free_rate;
    return j;
}

void MetricsConfig::from_json(const nlohmann::json& j) {
    if (j.contains("bars_per_year"))
        bars_per_year = j.at("bars_per_year").get<double>();
    if (j.contains("risk_free_rate"))
        risk_free_rate = j.at("risk_free_rate").get<double>();
}

nlohmann::json BacktestConfig::to_json() const {
    nlohmann::json j;
    j["variant"] = variant_to_string(variant);
    j["initial_capital"] = initial_capital;
    j["crossover"] = crossover.to_json();
    j["sizing"] = sizing.to_json();
    j["metrics"] = metrics.to_json();
    j["max_parallel_instruments"] = max_parallel_instruments;
    j["version"] = version;
    return j;
}

void BacktestConfig::from_json(const nlohmann::json& j) {
    if (j.contains("variant")) {
        std::string v = j.at("variant").get<std::string>();
        if (v == "SIMPLE")
            variant = BacktestVariant::SIMPLE;
        else if (v == "ENHANCED")
            variant = BacktestVariant::ENHANCED;
    }
    if (j.contains("initial_capital"))
        initial_capital = j.at("initial_capital").get<double>();
    if (j.contains("crossover"))
        crossover.from_json(j.at("crossover"));
    if (j.contains("sizing"))
        sizing.from_json(j.at("sizing"));
    if (j.contains("metrics"))
        metrics.from_json(j.at("metrics"));
    if (j.contains("max_parallel_instruments"))
        max_parallel_instruments = j.at("max_parallel_instruments").get<int>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<void> BacktestConfig::validate() const {
    if (crossover.short_window < 1 || crossover.long_window < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Moving average windows must be positive", "BacktestConfig");
    }
    if (crossover.short_window >= crossover.long_window) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "short_window must be smaller than long_window",
                                "BacktestConfig");
    }
    if (sizing.volatility_window < 2) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "volatility_window must be at least 2", "BacktestConfig");
    }
    if (!(sizing.base_allocation_fraction > 0.0) || sizing.base_allocation_fraction > 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "base_allocation_fraction must be in (0, 1]", "BacktestConfig");
    }
    if (!(metrics.bars_per_year > 0.0)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "bars_per_year must be positive",
                                "BacktestConfig");
    }
    if (!(initial_capital > 0.0)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "initial_capital must be positive", "BacktestConfig");
    }
    if (max_parallel_instruments < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "max_parallel_instruments must be at least 1", "BacktestConfig");
    }
    return Result<void>();
}

}  // namespace macross
