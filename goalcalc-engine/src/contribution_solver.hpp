#ifndef GOALCALC_CONTRIBUTION_SOLVER_HPP
#define GOALCALC_CONTRIBUTION_SOLVER_HPP

#include "logger.hpp"
#include "monte_carlo.hpp"
#include <cstdint>

namespace goalcalc {

// Tunable constants of the required-contribution search. The search runs
// cheap batches; the reported probability always comes from a full-size
// verification batch.
struct SolverConfig {
    size_t search_iterations;        // Paths per bisection step (default 1,000)
    size_t verification_iterations;  // Paths for the final estimate (default 5,000)
    double tolerance;                // Stop when high - low <= tolerance ($10)
    size_t max_steps;                // Hard cap on bisection steps
    size_t max_bracket_expansions;   // Hard cap on doubling the upper bound
    uint64_t seed;                   // Shared by every batch of one search

    SolverConfig();
};

struct RequiredContribution {
    double required_monthly;
    double required_annual;                  // required_monthly * 12
    double target_probability;
    double estimated_success_probability;    // From the verification batch
    double median_outcome;                   // From the verification batch
    double years_to_goal;
    double total_contributions;              // required_monthly * years * 12
    double contribution_percentage;          // total_contributions / target * 100
    size_t search_steps;
    bool converged;                          // false when a step or expansion cap stopped the search

    RequiredContribution();
};

// Smallest monthly contribution whose simulated success probability reaches
// target_probability.
//
// Bisects on [0, 3 x initial guess], where the initial guess is the
// deterministic contribution from monthly_contribution_for_target(). Every
// step reuses config.seed, so the success function sampled by the search is
// monotone in the contribution. If the upper bound does not reach the target
// it is doubled, at most max_bracket_expansions times.
//
// years_to_goal <= 0 needs no search: the answer is max(0, target - current).
RequiredContribution compute_required_contribution(
    double target_amount,
    double current_amount,
    double years_to_goal,
    double target_probability,
    double expected_return = 0.07,
    double return_volatility = 0.15,
    const SolverConfig& config = SolverConfig(),
    const RunContext& ctx = RunContext()
);

} // namespace goalcalc

#endif // GOALCALC_CONTRIBUTION_SOLVER_HPP
