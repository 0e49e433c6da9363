// src/strategy/position_tracker.cpp
#include "macross/strategy/position_tracker.hpp"

namespace macross {

int PositionTracker::next_position(int current, Signal signal) {
    switch (signal) {
        case Signal::BUY:
            return LONG;
        case Signal::SELL:
            return FLAT;
        case Signal::HOLD:
        default:
            return current;
    }
}

std::vector<int> PositionTracker::track(const std::vector<Signal>& signals) const {
    std::vector<int> positions;
    positions.reserve(signals.size());

    int position = FLAT;
    for (Signal signal : signals) {
        position = next_position(position, signal);
        positions.push_back(position);
    }
    return positions;
}

}  // namespace macross
