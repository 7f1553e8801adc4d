#include "monte_carlo.hpp"
#include <cmath>
#include <random>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace goalcalc {

// ============================================================================
// SimulationParams Implementation
// ============================================================================

SimulationParams::SimulationParams()
    : current_amount(0.0), monthly_contribution(0.0), years_to_goal(0.0),
      expected_return(0.07), return_volatility(0.15), iterations(DEFAULT_ITERATIONS) {}

SimulationParams::SimulationParams(double current, double contribution, double years,
                                   double ret, double vol, size_t iters)
    : current_amount(current), monthly_contribution(contribution), years_to_goal(years),
      expected_return(ret), return_volatility(vol), iterations(iters) {}

int SimulationParams::months() const {
    if (years_to_goal <= 0.0) {
        return 0;
    }
    return static_cast<int>(years_to_goal * 12.0);
}

// ============================================================================
// Path simulation
// ============================================================================

namespace {

// Independent Mersenne Twister stream for one path
std::mt19937_64 path_generator(uint64_t seed, uint64_t path) {
    std::seed_seq seq{
        static_cast<uint32_t>(seed & 0xffffffffu),
        static_cast<uint32_t>(seed >> 32),
        static_cast<uint32_t>(path & 0xffffffffu),
        static_cast<uint32_t>(path >> 32)
    };
    return std::mt19937_64(seq);
}

double simulate_path(const SimulationParams& params, int months,
                     double monthly_mean, double monthly_sd,
                     uint64_t seed, uint64_t path) {
    double value = params.current_amount;

    if (monthly_sd <= 0.0) {
        for (int m = 0; m < months; ++m) {
            value = value * (1.0 + monthly_mean) + params.monthly_contribution;
        }
        return value;
    }

    std::mt19937_64 rng = path_generator(seed, path);
    std::normal_distribution<double> normal(monthly_mean, monthly_sd);

    for (int m = 0; m < months; ++m) {
        double r = normal(rng);
        value = value * (1.0 + r) + params.monthly_contribution;
    }
    return value;
}

} // anonymous namespace

std::vector<double> simulate_terminal_values(const SimulationParams& params, uint64_t seed) {
    // No time for growth
    if (params.years_to_goal <= 0.0) {
        return std::vector<double>(1, params.current_amount);
    }

    const int months = params.months();
    const double monthly_mean = params.expected_return / 12.0;
    const double monthly_sd = params.return_volatility / std::sqrt(12.0);

    std::vector<double> terminal_values(params.iterations, 0.0);
    const int64_t count = static_cast<int64_t>(params.iterations);

#ifdef HAVE_OPENMP
    // Paths are independent and each writes only its own slot
    #pragma omp parallel for schedule(static)
    for (int64_t i = 0; i < count; ++i) {
        terminal_values[static_cast<size_t>(i)] = simulate_path(
            params, months, monthly_mean, monthly_sd, seed, static_cast<uint64_t>(i));
    }
#else
    for (int64_t i = 0; i < count; ++i) {
        terminal_values[static_cast<size_t>(i)] = simulate_path(
            params, months, monthly_mean, monthly_sd, seed, static_cast<uint64_t>(i));
    }
#endif

    return terminal_values;
}

uint64_t random_seed() {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

} // namespace goalcalc
