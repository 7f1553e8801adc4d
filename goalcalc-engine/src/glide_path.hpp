#ifndef GOALCALC_GLIDE_PATH_HPP
#define GOALCALC_GLIDE_PATH_HPP

#include "goal.hpp"
#include "market_assumptions.hpp"
#include <map>
#include <string>

namespace goalcalc {

// Heuristic constants of the glide path. Defaults reproduce the reference
// allocation; every field can be overridden from the engine config.
struct GlidePathSettings {
    // Equity sleeve split (domestic / international / emerging), sums to 1
    double domestic_equity_share;
    double international_equity_share;
    double emerging_markets_share;

    // Fixed-income sleeve split (bonds / TIPS / cash), sums to 1
    double bonds_share;
    double tips_share;
    double cash_share;

    // Risk tolerance adjustment by priority
    double essential_delta;
    double important_delta;
    double aspirational_delta;

    double min_equity;              // Equity share floor
    double max_equity;              // Equity share ceiling
    double horizon_years;           // base = 1 - years / horizon_years
    double risk_free_rate;

    GlidePathSettings();

    // Throws std::invalid_argument if a split does not sum to 1 or a bound is
    // outside [0, 1]
    void validate() const;
};

// Glide-path allocation for one goal's capital
struct AllocationResult {
    std::string goal_id;
    double allocated_amount;
    double years_to_goal;
    double risk_tolerance;                  // 0-1
    std::map<AssetClass, double> weights;   // Sums to 1.0
    double expected_return;
    double expected_risk;
    double sharpe_ratio;

    AllocationResult();

    double weight(AssetClass asset) const;
};

// Step function of years to goal, shifted by the priority delta, clamped to [0, 1]
double derive_risk_tolerance(double years_to_goal, Priority priority,
                             const GlidePathSettings& settings = GlidePathSettings());

// clamp(1 - years/horizon) scaled by (0.7 + 0.6 * risk_tolerance), clamped again
double equity_share(double years_to_goal, double risk_tolerance,
                    const GlidePathSettings& settings = GlidePathSettings());

// Six-way weight vector for a given equity share
std::map<AssetClass, double> glide_path_weights(
    double equity, const GlidePathSettings& settings = GlidePathSettings());

// Weighted-sum return and risk (correlations ignored) and Sharpe ratio.
// Sharpe is 0 when risk is 0.
void compute_portfolio_metrics(const std::map<AssetClass, double>& weights,
                               const CapitalMarketAssumptions& cma,
                               double risk_free_rate,
                               double& expected_return,
                               double& expected_risk,
                               double& sharpe_ratio);

AllocationResult build_goal_portfolio(
    const Goal& goal,
    double allocated_amount,
    const CapitalMarketAssumptions& cma,
    const GlidePathSettings& settings = GlidePathSettings()
);

} // namespace goalcalc

#endif // GOALCALC_GLIDE_PATH_HPP
