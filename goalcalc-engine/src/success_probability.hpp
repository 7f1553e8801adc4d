#ifndef GOALCALC_SUCCESS_PROBABILITY_HPP
#define GOALCALC_SUCCESS_PROBABILITY_HPP

#include "monte_carlo.hpp"
#include <cstdint>
#include <vector>

namespace goalcalc {

// Summary of a Monte Carlo run against a goal target.
// Values are unrounded; rounding happens when results are written out.
struct SimulationResult {
    double success_probability;     // count(value >= target) / iterations
    double shortfall_risk;          // 1 - success_probability

    double median_outcome;
    double percentile_10;
    double percentile_25;
    double percentile_75;
    double percentile_90;
    double expected_value;          // Mean terminal value
    double standard_deviation;      // Population std dev of terminal values

    // Median of (target - value) over failing paths; 0.0 if none fail
    double median_shortfall;

    double target_amount;
    size_t iterations;
    double execution_time_ms;

    // Terminal value for each path, kept only when requested
    std::vector<double> terminal_values;

    SimulationResult();
};

struct SuccessConfig {
    uint64_t seed;
    bool store_terminal_values;

    SuccessConfig();
    explicit SuccessConfig(uint64_t s, bool store = false);
};

// Run the projection engine and reduce paths to a probability of reaching
// target_amount plus the outcome distribution.
//
// years_to_goal <= 0 is the degenerate case: no simulation, every statistic
// equals current_amount and success is 1.0 or 0.0 by direct comparison.
SimulationResult compute_success_probability(
    double target_amount,
    const SimulationParams& params,
    const SuccessConfig& config = SuccessConfig()
);

// Reduce an existing set of terminal values against a target
SimulationResult summarize_terminal_values(
    double target_amount,
    const std::vector<double>& terminal_values,
    bool store_terminal_values = false
);

} // namespace goalcalc

#endif // GOALCALC_SUCCESS_PROBABILITY_HPP
