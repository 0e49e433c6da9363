// src/portfolio/position_sizer.cpp
#include "macross/portfolio/position_sizer.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include "macross/core/logger.hpp"
#include "macross/core/types.hpp"
#include "macross/statistics/series_statistics.hpp"

namespace macross {

Result<double> FullCashAllocation::allocation(size_t /* bar */, double available_cash) const {
    return Result<double>(std::max(available_cash, 0.0));
}

PositionSizer::PositionSizer(CreateTag, std::vector<double> volatility,
                             const SizingConfig& config, double initial_capital)
    : volatility_(std::move(volatility)),
      trailing_max_(statistics::running_max(volatility_)),
      config_(config),
      initial_capital_(initial_capital) {}

Result<std::unique_ptr<PositionSizer>> PositionSizer::create(std::vector<double> volatility,
                                                             const SizingConfig& config,
                                                             double initial_capital) {
    auto sizer = std::make_unique<PositionSizer>(CreateTag{}, std::move(volatility), config,
                                                 initial_capital);

    if (config.normalization == VolatilityNormalization::FULL_SERIES_MAX) {
        WARN("Position sizing normalized by whole-series maximum volatility; sizes depend on "
             "bars after each decision");

        double current = sizer->volatility_.empty() ? kUndefined : sizer->volatility_.back();
        double series_max = sizer->trailing_max_.empty() ? kUndefined : sizer->trailing_max_.back();
        auto size = size_from(current, series_max, initial_capital,
                              config.base_allocation_fraction);
        if (size.is_error()) {
            return make_error<std::unique_ptr<PositionSizer>>(
                size.error()->code(), size.error()->what(), "PositionSizer");
        }
        sizer->full_series_size_ = size.value();
    }

    return Result<std::unique_ptr<PositionSizer>>(std::move(sizer));
}

Result<double> PositionSizer::size_from(double current_volatility,
                                        double reference_max_volatility, double initial_capital,
                                        double base_allocation_fraction) {
    if (std::isnan(current_volatility) || current_volatility <= 0.0) {
        return make_error<double>(ErrorCode::DEGENERATE_VOLATILITY,
                                  "Current volatility is zero or undefined", "PositionSizer");
    }
    if (std::isnan(reference_max_volatility) || reference_max_volatility <= 0.0) {
        return make_error<double>(ErrorCode::DEGENERATE_VOLATILITY,
                                  "Reference maximum volatility is zero or undefined",
                                  "PositionSizer");
    }

    double normalized = (1.0 / current_volatility) / reference_max_volatility;
    return Result<double>(initial_capital * base_allocation_fraction * normalized);
}

Result<double> PositionSizer::position_size(size_t bar) const {
    if (config_.normalization == VolatilityNormalization::FULL_SERIES_MAX) {
        return Result<double>(full_series_size_);
    }

    if (bar >= volatility_.size()) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT,
                                  "Bar " + std::to_string(bar) + " outside volatility series",
                                  "PositionSizer");
    }

    auto size = size_from(volatility_[bar], trailing_max_[bar], initial_capital_,
                          config_.base_allocation_fraction);
    if (size.is_error()) {
        return make_error<double>(size.error()->code(),
                                  std::string(size.error()->what()) + " at bar " +
                                      std::to_string(bar),
                                  "PositionSizer");
    }
    return size;
}

Result<double> PositionSizer::allocation(size_t bar, double available_cash) const {
    auto size = position_size(bar);
    if (size.is_error()) {
        return size;
    }
    return Result<double>(std::min(size.value(), std::max(available_cash, 0.0)));
}

}  // namespace macross
