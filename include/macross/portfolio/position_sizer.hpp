// include/macross/portfolio/position_sizer.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <vector>
#include "macross/backtest/backtest_config.hpp"
#include "macross/core/error.hpp"

namespace macross {

/**
 * @brief Decides how much capital a buy signal at a given bar commits
 */
class AllocationPolicy {
public:
    virtual ~AllocationPolicy() = default;

    /**
     * @brief Capital to commit on a buy at bar
     * @param bar Index of the bar carrying the buy signal
     * @param available_cash Cash on hand before the trade
     * @return Amount no larger than available_cash, or an error that makes the
     *         whole simulation undefined
     */
    virtual Result<double> allocation(size_t bar, double available_cash) const = 0;
};

/**
 * @brief Commits all available cash on every buy
 */
class FullCashAllocation : public AllocationPolicy {
public:
    Result<double> allocation(size_t bar, double available_cash) const override;
};

/**
 * @brief Volatility-scaled allocation
 *
 * size = initial_capital * base_allocation_fraction * (1 / current_vol) / max_vol
 *
 * With TRAILING_MAX, current_vol is the volatility at the buy bar and max_vol the
 * maximum over bars up to and including it. With FULL_SERIES_MAX, current_vol is
 * the last bar's volatility and max_vol the maximum over the whole series, which
 * lets bars after the decision influence it. A zero or undefined current_vol is
 * reported as DEGENERATE_VOLATILITY.
 */
class PositionSizer : public AllocationPolicy {
    struct CreateTag {
        explicit CreateTag() = default;
    };

public:
    /**
     * @brief Build a sizer over a precomputed annualized volatility series
     * @return The sizer, or DEGENERATE_VOLATILITY when FULL_SERIES_MAX is
     *         configured and the final volatility is zero or undefined
     */
    static Result<std::unique_ptr<PositionSizer>> create(std::vector<double> volatility,
                                                         const SizingConfig& config,
                                                         double initial_capital);

    Result<double> allocation(size_t bar, double available_cash) const override;

    /**
     * @brief Uncapped size for bar
     */
    Result<double> position_size(size_t bar) const;

    /**
     * @brief The sizing formula on its own
     */
    static Result<double> size_from(double current_volatility, double reference_max_volatility,
                                    double initial_capital, double base_allocation_fraction);

    // Only reachable through create()
    PositionSizer(CreateTag, std::vector<double> volatility, const SizingConfig& config,
                  double initial_capital);

private:
    std::vector<double> volatility_;
    std::vector<double> trailing_max_;
    SizingConfig config_;
    double initial_capital_;
    double full_series_size_{0.0};
};

}  // namespace macross
