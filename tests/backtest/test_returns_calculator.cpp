#include <gtest/gtest.h>
#include <cmath>
#include <vector>
#include "macross/backtest/returns_calculator.hpp"

using namespace macross;

TEST(ReturnsCalculatorTest, InstrumentReturns) {
    auto returns = ReturnsCalculator::instrument_returns({100.0, 105.0, 84.0});
    ASSERT_EQ(returns.size(), 3);
    EXPECT_TRUE(std::isnan(returns[0]));
    EXPECT_NEAR(returns[1], 0.05, 1e-12);
    EXPECT_NEAR(returns[2], -0.20, 1e-12);
}

TEST(ReturnsCalculatorTest, StrategyReturnsUsePreviousPosition) {
    std::vector<double> instrument{kUndefined, 0.10, 0.05, -0.02, 0.03};
    std::vector<int> positions{0, 1, 1, 0, 0};

    auto result = ReturnsCalculator::strategy_returns(instrument, positions);
    ASSERT_TRUE(result.is_ok());

    const auto& returns = result.value();
    EXPECT_TRUE(std::isnan(returns[0]));
    EXPECT_DOUBLE_EQ(returns[1], 0.0);    // bought at the close of bar 1
    EXPECT_DOUBLE_EQ(returns[2], 0.05);
    EXPECT_DOUBLE_EQ(returns[3], -0.02);  // sold at the close of bar 3
    EXPECT_DOUBLE_EQ(returns[4], 0.0);
}

TEST(ReturnsCalculatorTest, StrategyReturnsLengthMismatch) {
    auto result = ReturnsCalculator::strategy_returns({kUndefined, 0.1}, {0});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST(ReturnsCalculatorTest, PortfolioReturnsAndValues) {
    std::vector<PortfolioState> states(3);
    states[0].portfolio_value = 100.0;
    states[1].portfolio_value = 110.0;
    states[2].portfolio_value = 99.0;

    auto values = ReturnsCalculator::portfolio_values(states);
    EXPECT_EQ(values, (std::vector<double>{100.0, 110.0, 99.0}));

    auto returns = ReturnsCalculator::portfolio_returns(states);
    EXPECT_TRUE(std::isnan(returns[0]));
    EXPECT_NEAR(returns[1], 0.10, 1e-12);
    EXPECT_NEAR(returns[2], -0.10, 1e-12);
}

TEST(ReturnsCalculatorTest, CumulativeReturns) {
    auto growth = ReturnsCalculator::cumulative_returns({kUndefined, 0.10, -0.10});
    EXPECT_TRUE(std::isnan(growth[0]));
    EXPECT_NEAR(growth[1], 1.10, 1e-12);
    EXPECT_NEAR(growth[2], 0.99, 1e-12);
}
