#include <gtest/gtest.h>
#include <cmath>
#include <vector>
#include "macross/indicators/volatility_estimator.hpp"

using namespace macross;

TEST(VolatilityEstimatorTest, AnnualizedRollingSampleStddev) {
    VolatilityEstimator estimator(2, 4.0);
    auto result = estimator.calculate({100.0, 110.0, 99.0, 99.0});
    ASSERT_TRUE(result.is_ok());

    const auto& vol = result.value();
    ASSERT_EQ(vol.size(), 4);
    EXPECT_TRUE(std::isnan(vol[0]));
    EXPECT_TRUE(std::isnan(vol[1]));  // only one defined return so far
    EXPECT_NEAR(vol[2], std::sqrt(0.02) * 2.0, 1e-12);
    EXPECT_NEAR(vol[3], std::sqrt(0.005) * 2.0, 1e-12);
}

TEST(VolatilityEstimatorTest, ConstantPricesHaveZeroVolatility) {
    VolatilityEstimator estimator(20, 6125.0);
    auto result = estimator.calculate(std::vector<double>(60, 100.0));
    ASSERT_TRUE(result.is_ok());

    const auto& vol = result.value();
    EXPECT_TRUE(std::isnan(vol[19]));
    EXPECT_DOUBLE_EQ(vol[20], 0.0);
    EXPECT_DOUBLE_EQ(vol[59], 0.0);
}

TEST(VolatilityEstimatorTest, UndefinedReturnsInWindowYieldUndefined) {
    VolatilityEstimator estimator(2, 1.0);
    std::vector<double> returns{0.01, std::nan(""), 0.02, -0.01};
    auto result = estimator.calculate_from_returns(returns);
    ASSERT_TRUE(result.is_ok());

    const auto& vol = result.value();
    EXPECT_TRUE(std::isnan(vol[1]));
    EXPECT_TRUE(std::isnan(vol[2]));
    EXPECT_NEAR(vol[3], std::sqrt(0.00045), 1e-12);
}

TEST(VolatilityEstimatorTest, InvalidParametersRejected) {
    auto small_window = VolatilityEstimator(1, 252.0).calculate({1.0, 2.0});
    ASSERT_TRUE(small_window.is_error());
    EXPECT_EQ(small_window.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto bad_annualization = VolatilityEstimator(20, 0.0).calculate({1.0, 2.0});
    ASSERT_TRUE(bad_annualization.is_error());
    EXPECT_EQ(bad_annualization.error()->code(), ErrorCode::INVALID_ARGUMENT);
}
