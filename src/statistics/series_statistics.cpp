// src/statistics/series_statistics.cpp
#include "macross/statistics/series_statistics.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>
#include "macross/core/types.hpp"

namespace macross {
namespace statistics {

std::vector<double> percent_change(const std::vector<double>& values) {
    std::vector<double> changes(values.size(), kUndefined);
    for (size_t i = 1; i < values.size(); ++i) {
        double prev = values[i - 1];
        double curr = values[i];
        if (std::isnan(prev) || std::isnan(curr) || prev == 0.0) {
            continue;
        }
        changes[i] = curr / prev - 1.0;
    }
    return changes;
}

std::vector<double> cumulative_growth(const std::vector<double>& returns) {
    std::vector<double> growth(returns.size(), kUndefined);
    double product = 1.0;
    for (size_t i = 0; i < returns.size(); ++i) {
        if (std::isnan(returns[i])) {
            continue;
        }
        product *= (1.0 + returns[i]);
        growth[i] = product;
    }
    return growth;
}

std::vector<double> running_max(const std::vector<double>& values) {
    std::vector<double> peaks(values.size(), kUndefined);
    double peak = kUndefined;
    for (size_t i = 0; i < values.size(); ++i) {
        if (!std::isnan(values[i]) && (std::isnan(peak) || values[i] > peak)) {
            peak = values[i];
        }
        peaks[i] = peak;
    }
    return peaks;
}

double sample_stddev(const std::vector<double>& values) {
    return sample_stddev(values, 0, values.size());
}

double sample_stddev(const std::vector<double>& values, size_t begin, size_t end) {
    end = std::min(end, values.size());
    if (begin >= end || end - begin < 2) {
        return kUndefined;
    }

    const double count = static_cast<double>(end - begin);
    double sum = std::accumulate(values.begin() + begin, values.begin() + end, 0.0);
    double avg = sum / count;

    double sq_sum = 0.0;
    for (size_t i = begin; i < end; ++i) {
        sq_sum += (values[i] - avg) * (values[i] - avg);
    }
    return std::sqrt(sq_sum / (count - 1.0));
}

std::vector<double> drop_undefined(const std::vector<double>& values) {
    std::vector<double> defined;
    defined.reserve(values.size());
    std::copy_if(values.begin(), values.end(), std::back_inserter(defined),
                 [](double v) { return !std::isnan(v); });
    return defined;
}

}  // namespace statistics
}  // namespace macross
