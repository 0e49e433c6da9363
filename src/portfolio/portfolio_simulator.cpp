// src/portfolio/portfolio_simulator.cpp
#include "macross/portfolio/portfolio_simulator.hpp"
#include <algorithm>
#include <string>
#include "macross/core/logger.hpp"

namespace macross {

namespace {

// Relative tolerance for the rounding error of (cash / price) * price
constexpr double kCostTolerance = 1e-12;

}  // namespace

PortfolioSimulator::PortfolioSimulator(double initial_capital, ValuationMode valuation)
    : initial_capital_(initial_capital), valuation_(valuation) {}

Result<SimulationResult> PortfolioSimulator::simulate(const std::vector<double>& closes,
                                                      const std::vector<Signal>& signals,
                                                      const AllocationPolicy& policy) const {
    if (closes.size() != signals.size()) {
        return make_error<SimulationResult>(
            ErrorCode::INVALID_ARGUMENT,
            "Closes and signals differ in length: " + std::to_string(closes.size()) + " vs " +
                std::to_string(signals.size()),
            "PortfolioSimulator");
    }

    SimulationResult result;
    if (closes.empty()) {
        return Result<SimulationResult>(std::move(result));
    }
    result.states.reserve(closes.size());

    PortfolioState seed;
    seed.cash = initial_capital_;
    seed.invested_capital = 0.0;
    seed.portfolio_value = initial_capital_;
    seed.shares_held = 0.0;
    result.states.push_back(seed);

    for (size_t i = 1; i < closes.size(); ++i) {
        const double price = closes[i];

        PortfolioState state = result.states.back();
        if (valuation_ == ValuationMode::MARK_TO_MARKET) {
            state.invested_capital = state.shares_held * price;
        }

        if (signals[i] == Signal::BUY) {
            auto allocation = policy.allocation(i, state.cash);
            if (allocation.is_error()) {
                return make_error<SimulationResult>(allocation.error()->code(),
                                                    allocation.error()->what(),
                                                    "PortfolioSimulator");
            }

            double amount = std::min(allocation.value(), state.cash);
            double shares = price > 0.0 ? amount / price : 0.0;
            double cost = shares * price;

            if (cost > state.cash && cost - state.cash <= state.cash * kCostTolerance) {
                cost = state.cash;
            }

            if (shares > 0.0 && cost <= state.cash) {
                state.cash -= cost;
                state.invested_capital += cost;
                state.shares_held += shares;
                result.trades_executed++;
                DEBUG("Bar " << i << ": bought " << shares << " @ " << price << " for " << cost
                             << ", cash " << state.cash);
            } else {
                result.trades_skipped++;
                DEBUG("Bar " << i << ": buy skipped, cash " << state.cash << " cannot fund "
                             << amount);
            }
        } else if (signals[i] == Signal::SELL) {
            if (state.shares_held > 0.0 || state.invested_capital > 0.0) {
                DEBUG("Bar " << i << ": sold " << state.shares_held << " @ " << price
                             << ", released " << state.invested_capital);
                result.trades_executed++;
            }
            state.cash += state.invested_capital;
            state.invested_capital = 0.0;
            state.shares_held = 0.0;
        }

        state.portfolio_value = state.cash + state.invested_capital;
        result.states.push_back(state);
    }

    return Result<SimulationResult>(std::move(result));
}

}  // namespace macross
