#include "contribution_solver.hpp"
#include "funding_calculator.hpp"
#include "success_probability.hpp"
#include <algorithm>

namespace goalcalc {

namespace {

// Smallest upper bound tried when the deterministic guess is 0
constexpr double MIN_UPPER_BOUND = 100.0;

double probability_at(double target_amount, double current_amount, double years_to_goal,
                      double contribution, double expected_return, double return_volatility,
                      size_t iterations, uint64_t seed) {
    SimulationParams params(current_amount, contribution, years_to_goal,
                            expected_return, return_volatility, iterations);
    return compute_success_probability(target_amount, params, SuccessConfig(seed))
        .success_probability;
}

} // anonymous namespace

SolverConfig::SolverConfig()
    : search_iterations(1000),
      verification_iterations(DEFAULT_ITERATIONS),
      tolerance(10.0),
      max_steps(64),
      max_bracket_expansions(16),
      seed(42) {}

RequiredContribution::RequiredContribution()
    : required_monthly(0.0), required_annual(0.0), target_probability(0.0),
      estimated_success_probability(0.0), median_outcome(0.0), years_to_goal(0.0),
      total_contributions(0.0), contribution_percentage(0.0), search_steps(0),
      converged(true) {}

RequiredContribution compute_required_contribution(
    double target_amount,
    double current_amount,
    double years_to_goal,
    double target_probability,
    double expected_return,
    double return_volatility,
    const SolverConfig& config,
    const RunContext& ctx)
{
    Logger& logger = Logger::get_instance();
    RequiredContribution result;
    result.target_probability = target_probability;
    result.years_to_goal = years_to_goal;

    if (years_to_goal <= 0.0) {
        double shortfall = std::max(0.0, target_amount - current_amount);
        result.required_monthly = shortfall;
        result.required_annual = shortfall;
        result.estimated_success_probability = shortfall == 0.0 ? 1.0 : 0.0;
        result.median_outcome = current_amount;
        result.years_to_goal = 0.0;
        result.total_contributions = shortfall;
        result.contribution_percentage = target_amount > 0.0
            ? shortfall / target_amount * 100.0 : 0.0;
        logger.log_solver_result(ctx, result.required_monthly,
                                 result.estimated_success_probability, 0, true);
        return result;
    }

    auto probability = [&](double contribution) {
        return probability_at(target_amount, current_amount, years_to_goal, contribution,
                              expected_return, return_volatility,
                              config.search_iterations, config.seed);
    };

    double initial_guess = monthly_contribution_for_target(
        target_amount, current_amount, years_to_goal, expected_return);

    double low = 0.0;
    double high = initial_guess * 3.0;

    RunContext step_ctx = ctx;
    size_t expansions = 0;
    double p_high = probability(high);
    while (p_high < target_probability && expansions < config.max_bracket_expansions) {
        low = high;
        high = std::max(high * 2.0, MIN_UPPER_BOUND);
        p_high = probability(high);
        ++expansions;
        step_ctx.step = expansions;
        logger.log_solver_step(step_ctx, low, high, p_high);
    }

    const bool bracketed = p_high >= target_probability;

    size_t steps = 0;
    while (high - low > config.tolerance && steps < config.max_steps) {
        double mid = (low + high) / 2.0;
        double p = probability(mid);
        ++steps;
        step_ctx.step = expansions + steps;
        logger.log_solver_step(step_ctx, low, high, p);

        if (p < target_probability) {
            low = mid;
        } else {
            high = mid;
        }
    }

    result.required_monthly = (low + high) / 2.0;
    result.search_steps = steps;
    result.converged = bracketed && high - low <= config.tolerance;

    SimulationParams verify(current_amount, result.required_monthly, years_to_goal,
                            expected_return, return_volatility,
                            config.verification_iterations);
    SimulationResult final_result =
        compute_success_probability(target_amount, verify, SuccessConfig(config.seed));

    const double months = years_to_goal * 12.0;
    result.estimated_success_probability = final_result.success_probability;
    result.median_outcome = final_result.median_outcome;
    result.required_annual = result.required_monthly * 12.0;
    result.total_contributions = result.required_monthly * months;
    result.contribution_percentage = target_amount > 0.0
        ? result.total_contributions / target_amount * 100.0 : 0.0;

    logger.log_solver_result(ctx, result.required_monthly,
                             result.estimated_success_probability,
                             result.search_steps, result.converged);
    return result;
}

} // namespace goalcalc
