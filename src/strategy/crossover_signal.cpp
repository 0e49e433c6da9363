// src/strategy/crossover_signal.cpp
#include "macross/strategy/crossover_signal.hpp"
#include <cmath>
#include <string>

namespace macross {

Signal CrossoverSignalGenerator::evaluate(double prev_short, double prev_long,
                                          double curr_short, double curr_long) {
    if (std::isnan(prev_short) || std::isnan(prev_long) || std::isnan(curr_short) ||
        std::isnan(curr_long)) {
        return Signal::HOLD;
    }

    if (curr_short > curr_long && prev_short < prev_long) {
        return Signal::BUY;
    }
    if (curr_short < curr_long && prev_short > prev_long) {
        return Signal::SELL;
    }
    return Signal::HOLD;
}

Result<std::vector<Signal>> CrossoverSignalGenerator::generate(
    const std::vector<double>& short_ma, const std::vector<double>& long_ma) const {
    if (short_ma.size() != long_ma.size()) {
        return make_error<std::vector<Signal>>(
            ErrorCode::INVALID_ARGUMENT,
            "Moving average series differ in length: " + std::to_string(short_ma.size()) +
                " vs " + std::to_string(long_ma.size()),
            "CrossoverSignalGenerator");
    }

    std::vector<Signal> signals;
    signals.reserve(short_ma.size());
    if (short_ma.empty()) {
        return Result<std::vector<Signal>>(std::move(signals));
    }

    signals.push_back(Signal::HOLD);
    double prev_short = short_ma[0];
    double prev_long = long_ma[0];

    for (size_t i = 1; i < short_ma.size(); ++i) {
        signals.push_back(evaluate(prev_short, prev_long, short_ma[i], long_ma[i]));
        prev_short = short_ma[i];
        prev_long = long_ma[i];
    }

    return Result<std::vector<Signal>>(std::move(signals));
}

}  // namespace macross
