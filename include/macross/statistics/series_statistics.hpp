// include/macross/statistics/series_statistics.hpp
#pragma once

#include <cstddef>
#include <vector>

namespace macross {
namespace statistics {

// ============================================================================
// Element-wise transforms over ordered series
// ============================================================================

/**
 * @brief Relative change between consecutive elements
 *
 * out[0] is NaN. out[i] = values[i] / values[i-1] - 1, NaN when either operand
 * is NaN or values[i-1] is zero.
 */
std::vector<double> percent_change(const std::vector<double>& values);

/**
 * @brief Running product of (1 + r) over the series
 * NaN elements are skipped: they yield NaN at their position and leave the
 * running product untouched.
 */
std::vector<double> cumulative_growth(const std::vector<double>& returns);

/**
 * @brief Non-decreasing prefix maximum, NaN elements are skipped
 */
std::vector<double> running_max(const std::vector<double>& values);

// ============================================================================
// Reductions
// ============================================================================

/**
 * @brief Sample standard deviation (n - 1 denominator)
 * NaN when fewer than two values are supplied.
 */
double sample_stddev(const std::vector<double>& values);

/**
 * @brief Sample standard deviation of values[begin, end)
 */
double sample_stddev(const std::vector<double>& values, size_t begin, size_t end);

/**
 * @brief Copy of the series with NaN elements removed
 */
std::vector<double> drop_undefined(const std::vector<double>& values);

}  // namespace statistics
}  // namespace macross
