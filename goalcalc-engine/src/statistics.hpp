#ifndef GOALCALC_STATISTICS_HPP
#define GOALCALC_STATISTICS_HPP

#include <vector>

namespace goalcalc {

// Arithmetic mean; 0.0 for an empty vector
double calculate_mean(const std::vector<double>& values);

// Population standard deviation; 0.0 for fewer than two values
double calculate_std_dev(const std::vector<double>& values, double mean);

// Percentile using linear interpolation between order statistics.
// values must be sorted in ascending order; p is the percentile (0-100).
double calculate_percentile(const std::vector<double>& sorted_values, double p);

// Median of an unsorted vector (copies and sorts); 0.0 for an empty vector
double calculate_median(std::vector<double> values);

// Reporting helpers, applied at the output boundary only
double round_to(double value, int decimals);
inline double round_currency(double value) { return round_to(value, 2); }
inline double round_rate(double value) { return round_to(value, 4); }

} // namespace goalcalc

#endif // GOALCALC_STATISTICS_HPP
