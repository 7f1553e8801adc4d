#include "success_probability.hpp"
#include "statistics.hpp"
#include "logger.hpp"
#include <algorithm>
#include <chrono>

namespace goalcalc {

// ============================================================================
// SimulationResult / SuccessConfig
// ============================================================================

SimulationResult::SimulationResult()
    : success_probability(0.0),
      shortfall_risk(1.0),
      median_outcome(0.0),
      percentile_10(0.0),
      percentile_25(0.0),
      percentile_75(0.0),
      percentile_90(0.0),
      expected_value(0.0),
      standard_deviation(0.0),
      median_shortfall(0.0),
      target_amount(0.0),
      iterations(0),
      execution_time_ms(0.0) {}

SuccessConfig::SuccessConfig() : seed(42), store_terminal_values(false) {}

SuccessConfig::SuccessConfig(uint64_t s, bool store) : seed(s), store_terminal_values(store) {}

// ============================================================================
// Reduction
// ============================================================================

SimulationResult summarize_terminal_values(
    double target_amount,
    const std::vector<double>& terminal_values,
    bool store_terminal_values)
{
    SimulationResult result;
    result.target_amount = target_amount;
    result.iterations = terminal_values.size();

    if (terminal_values.empty()) {
        return result;
    }

    size_t success_count = 0;
    std::vector<double> shortfalls;
    for (double v : terminal_values) {
        if (v >= target_amount) {
            ++success_count;
        } else {
            shortfalls.push_back(target_amount - v);
        }
    }

    result.success_probability =
        static_cast<double>(success_count) / static_cast<double>(terminal_values.size());
    result.shortfall_risk = 1.0 - result.success_probability;

    result.expected_value = calculate_mean(terminal_values);
    result.standard_deviation = calculate_std_dev(terminal_values, result.expected_value);

    std::vector<double> sorted_values = terminal_values;
    std::sort(sorted_values.begin(), sorted_values.end());

    result.percentile_10 = calculate_percentile(sorted_values, 10.0);
    result.percentile_25 = calculate_percentile(sorted_values, 25.0);
    result.median_outcome = calculate_percentile(sorted_values, 50.0);
    result.percentile_75 = calculate_percentile(sorted_values, 75.0);
    result.percentile_90 = calculate_percentile(sorted_values, 90.0);

    result.median_shortfall = shortfalls.empty() ? 0.0 : calculate_median(std::move(shortfalls));

    if (store_terminal_values) {
        result.terminal_values = terminal_values;
    }

    return result;
}

SimulationResult compute_success_probability(
    double target_amount,
    const SimulationParams& params,
    const SuccessConfig& config)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    SimulationResult result;

    if (params.years_to_goal <= 0.0) {
        // Goal is due now: direct comparison, no growth
        const bool met = params.current_amount >= target_amount;
        result.success_probability = met ? 1.0 : 0.0;
        result.shortfall_risk = met ? 0.0 : 1.0;
        result.median_outcome = params.current_amount;
        result.percentile_10 = params.current_amount;
        result.percentile_25 = params.current_amount;
        result.percentile_75 = params.current_amount;
        result.percentile_90 = params.current_amount;
        result.expected_value = params.current_amount;
        result.standard_deviation = 0.0;
        result.median_shortfall = met ? 0.0 : target_amount - params.current_amount;
        result.target_amount = target_amount;
        result.iterations = 1;
        if (config.store_terminal_values) {
            result.terminal_values.assign(1, params.current_amount);
        }
    } else {
        std::vector<double> terminal_values = simulate_terminal_values(params, config.seed);
        result = summarize_terminal_values(target_amount, terminal_values,
                                           config.store_terminal_values);
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    Logger::get_instance().log_simulation_complete(
        "success_probability", result.iterations, result.success_probability,
        result.execution_time_ms);

    return result;
}

} // namespace goalcalc
