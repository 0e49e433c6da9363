// include/macross/strategy/position_tracker.hpp
#pragma once

#include <vector>
#include "macross/core/types.hpp"

namespace macross {

/**
 * @brief Binary flat/long state machine driven by crossover signals
 *
 * Starts flat. BUY goes long, SELL goes flat, HOLD keeps the previous state.
 */
class PositionTracker {
public:
    static constexpr int FLAT = 0;
    static constexpr int LONG = 1;

    PositionTracker() = default;

    /**
     * @brief Position held at the close of every bar
     */
    std::vector<int> track(const std::vector<Signal>& signals) const;

    static int next_position(int current, Signal signal);
};

}  // namespace macross
