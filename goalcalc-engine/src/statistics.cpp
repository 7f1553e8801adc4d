#include "statistics.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace goalcalc {

double calculate_mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

// Population form: divides by n, not n - 1
double calculate_std_dev(const std::vector<double>& values, double mean) {
    if (values.size() < 2) {
        return 0.0;
    }
    double squares = std::accumulate(values.begin(), values.end(), 0.0,
                                     [mean](double acc, double v) {
                                         return acc + (v - mean) * (v - mean);
                                     });
    return std::sqrt(squares / static_cast<double>(values.size()));
}

// Linear interpolation between closest ranks on (n - 1) spacing
double calculate_percentile(const std::vector<double>& sorted_values, double p) {
    if (sorted_values.empty()) {
        return 0.0;
    }
    const size_t last = sorted_values.size() - 1;
    double rank = (p / 100.0) * static_cast<double>(last);
    if (rank <= 0.0) {
        return sorted_values.front();
    }
    if (rank >= static_cast<double>(last)) {
        return sorted_values.back();
    }

    size_t below = static_cast<size_t>(rank);
    double weight = rank - static_cast<double>(below);
    if (weight == 0.0) {
        return sorted_values[below];
    }
    return sorted_values[below] + weight * (sorted_values[below + 1] - sorted_values[below]);
}

double calculate_median(std::vector<double> values) {
    std::sort(values.begin(), values.end());
    return calculate_percentile(values, 50.0);
}

double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

} // namespace goalcalc
