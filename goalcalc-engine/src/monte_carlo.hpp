#ifndef GOALCALC_MONTE_CARLO_HPP
#define GOALCALC_MONTE_CARLO_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace goalcalc {

constexpr size_t DEFAULT_ITERATIONS = 5000;
constexpr size_t MIN_ITERATIONS = 1000;
constexpr size_t MAX_ITERATIONS = 10000;

// Inputs for one batch of portfolio-value paths
struct SimulationParams {
    double current_amount;          // Starting portfolio value
    double monthly_contribution;    // Posted at month end, after growth
    double years_to_goal;
    double expected_return;         // Annual
    double return_volatility;       // Annual standard deviation
    size_t iterations;              // Number of independent paths

    SimulationParams();
    SimulationParams(double current, double contribution, double years,
                     double ret, double vol, size_t iters = DEFAULT_ITERATIONS);

    // years_to_goal * 12, truncated
    int months() const;
};

// Simulate terminal portfolio values.
//
// For each path, starting from current_amount, each month draws
// r ~ N(expected_return/12, return_volatility/sqrt(12)) and updates
//   value = value * (1 + r) + monthly_contribution
//
// Path i draws from its own generator seeded from (seed, i), so the
// returned vector depends only on the inputs and the seed, never on the
// number of OpenMP threads or the order in which paths complete.
//
// years_to_goal <= 0 returns a single value equal to current_amount.
// A zero volatility grows every path at exactly expected_return/12.
std::vector<double> simulate_terminal_values(const SimulationParams& params, uint64_t seed);

// Non-deterministic seed for production calls
uint64_t random_seed();

} // namespace goalcalc

#endif // GOALCALC_MONTE_CARLO_HPP
