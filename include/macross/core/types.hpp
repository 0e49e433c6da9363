// include/macross/core/types.hpp

#pragma once

#include <chrono>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace macross {

/**
 * @brief Timestamp type for consistent time representation
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Quantity type for share counts, fractional shares allowed
 */
using Quantity = double;

/**
 * @brief Quiet NaN used for every undefined numeric value
 */
constexpr double kUndefined = std::numeric_limits<double>::quiet_NaN();

/**
 * @brief One observation of an instrument's closing price
 */
struct Bar {
    Timestamp timestamp;
    Price close{0.0};
    std::string symbol;

    Bar() = default;
    Bar(Timestamp ts, Price c, std::string s)
        : timestamp(ts), close(c), symbol(std::move(s)) {}
};

/**
 * @brief Discrete trading signal produced by a crossover
 */
enum class Signal : int {
    SELL = -1,
    HOLD = 0,
    BUY = 1
};

inline std::string signal_to_string(Signal signal) {
    switch (signal) {
        case Signal::SELL:
            return "SELL";
        case Signal::HOLD:
            return "HOLD";
        case Signal::BUY:
            return "BUY";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Per-bar derived fields of one backtest run
 *
 * Moving averages are NaN until their window is full. position is the binary
 * held state of the simple variant; position_size is the capital invested in
 * the instrument in the enhanced variant.
 */
struct SeriesState {
    Timestamp timestamp;
    Price close{0.0};
    double sma_short{kUndefined};
    double sma_long{kUndefined};
    Signal signal{Signal::HOLD};
    int position{0};
    double position_size{0.0};
};

/**
 * @brief Per-bar capital bookkeeping of the enhanced variant
 */
struct PortfolioState {
    double cash{0.0};
    double invested_capital{0.0};
    double portfolio_value{0.0};
    Quantity shares_held{0.0};
};

/**
 * @brief Outcome classification of a single instrument run
 */
enum class RunStatus {
    OK,
    INSUFFICIENT_DATA,
    DEGENERATE_VOLATILITY,
    INVALID_DATA
};

inline std::string run_status_to_string(RunStatus status) {
    switch (status) {
        case RunStatus::OK:
            return "OK";
        case RunStatus::INSUFFICIENT_DATA:
            return "INSUFFICIENT_DATA";
        case RunStatus::DEGENERATE_VOLATILITY:
            return "DEGENERATE_VOLATILITY";
        case RunStatus::INVALID_DATA:
            return "INVALID_DATA";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Aggregate result of one backtest run for one instrument
 *
 * Numeric fields are NaN when the run degraded (see status).
 */
struct PerformanceMetrics {
    std::string instrument_id;
    double annualized_return{kUndefined};
    double annualized_volatility{kUndefined};
    double sharpe_ratio{kUndefined};
    double max_drawdown{kUndefined};

    // Enhanced variant only
    std::optional<double> final_portfolio_value;

    // Simple variant only: buy-and-hold of the instrument itself
    std::optional<double> benchmark_annualized_return;
    std::optional<double> benchmark_volatility;

    // Run diagnostics
    size_t bars{0};
    int buy_signals{0};
    int sell_signals{0};
    int trades_executed{0};
    int trades_skipped{0};
    RunStatus status{RunStatus::OK};
};

}  // namespace macross
