//===== test_base.hpp =====
#pragma once

#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <utility>
#include <vector>
#include "macross/core/logger.hpp"
#include "macross/core/types.hpp"

namespace macross {
namespace testing {

/**
 * @brief Fixture that silences the logger for the duration of a test
 */
class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        LoggerConfig config;
        config.destination = LogDestination::CONSOLE;
        config.min_level = LogLevel::FATAL;
        Logger::instance().initialize(config);
    }

    void TearDown() override {
        Logger::reset_for_tests();
    }
};

/**
 * @brief Fifteen-minute bars for one instrument, one per close
 */
inline std::vector<Bar> make_bars(const std::vector<double>& closes,
                                  const std::string& symbol = "TEST") {
    std::vector<Bar> bars;
    bars.reserve(closes.size());
    auto start = std::chrono::system_clock::time_point(std::chrono::seconds(1704186000));
    for (size_t i = 0; i < closes.size(); ++i) {
        bars.emplace_back(start + std::chrono::minutes(15 * static_cast<int>(i)), closes[i],
                          symbol);
    }
    return bars;
}

/**
 * @brief Piecewise linear price path: each leg moves by step for count bars
 */
inline std::vector<double> make_path(double start,
                                     const std::vector<std::pair<int, double>>& legs) {
    std::vector<double> closes{start};
    for (const auto& [count, step] : legs) {
        for (int i = 0; i < count; ++i) {
            closes.push_back(closes.back() + step);
        }
    }
    return closes;
}

inline int count_signal(const std::vector<Signal>& signals, Signal wanted) {
    int count = 0;
    for (Signal s : signals) {
        if (s == wanted)
            count++;
    }
    return count;
}

}  // namespace testing
}  // namespace macross
