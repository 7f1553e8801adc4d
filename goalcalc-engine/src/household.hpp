#ifndef GOALCALC_HOUSEHOLD_HPP
#define GOALCALC_HOUSEHOLD_HPP

#include "account_placement.hpp"
#include "capital_allocator.hpp"
#include "glide_path.hpp"
#include <map>
#include <string>
#include <vector>

namespace goalcalc {

constexpr double DEFAULT_RISK_FREE_RATE = 0.04;

struct AggregateStats {
    double total_value;                                 // Sum of goal allocations
    double weighted_return;
    double weighted_risk;
    double sharpe_ratio;                                // 0 if risk or total value is 0
    std::map<AssetClass, double> aggregate_allocation;  // Capital-weighted goal weights
    double diversification_score;                       // 0 concentrated, 1 equal weights

    AggregateStats();
};

// Herfindahl-based score over non-zero weights:
//   1 - (HHI - 1/n) / (1 - 1/n)
// 0.0 for an empty or single-asset allocation.
double diversification_score(const std::map<AssetClass, double>& allocation);

// Roll goal portfolios up to household level. Portfolios whose goal is not
// in `goal_allocations` are skipped.
AggregateStats aggregate_household(const std::vector<AllocationResult>& portfolios,
                                   const GoalAllocations& goal_allocations,
                                   double risk_free_rate = DEFAULT_RISK_FREE_RATE);

// Plain-text advice for low location efficiency (< 0.7), low diversification
// (< 0.6), high tax drag (> 1.5%) or low Sharpe ratio (< 0.5). A single
// "well optimized" message when none apply.
std::vector<std::string> build_recommendations(const AggregateStats& stats,
                                               const TaxMetrics& tax_metrics);

} // namespace goalcalc

#endif // GOALCALC_HOUSEHOLD_HPP
