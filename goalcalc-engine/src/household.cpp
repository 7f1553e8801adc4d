#include "household.hpp"
#include <iomanip>
#include <sstream>

namespace goalcalc {

namespace {

constexpr double MIN_LOCATION_EFFICIENCY = 0.7;
constexpr double MIN_DIVERSIFICATION = 0.6;
constexpr double MAX_TAX_DRAG = 0.015;
constexpr double MIN_SHARPE = 0.5;

std::string format_percent(double fraction, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << fraction * 100.0 << "%";
    return oss.str();
}

} // anonymous namespace

AggregateStats::AggregateStats()
    : total_value(0.0), weighted_return(0.0), weighted_risk(0.0),
      sharpe_ratio(0.0), diversification_score(0.0) {}

double diversification_score(const std::map<AssetClass, double>& allocation) {
    double hhi = 0.0;
    size_t n = 0;
    for (const auto& [asset, w] : allocation) {
        if (w > 0.0) {
            hhi += w * w;
            ++n;
        }
    }
    if (n <= 1) {
        return 0.0;
    }
    const double min_hhi = 1.0 / static_cast<double>(n);
    return 1.0 - (hhi - min_hhi) / (1.0 - min_hhi);
}

AggregateStats aggregate_household(const std::vector<AllocationResult>& portfolios,
                                   const GoalAllocations& goal_allocations,
                                   double risk_free_rate) {
    AggregateStats stats;
    for (const auto& [id, amount] : goal_allocations) {
        stats.total_value += amount;
    }
    if (stats.total_value <= 0.0) {
        return stats;
    }

    for (const auto& portfolio : portfolios) {
        auto it = goal_allocations.find(portfolio.goal_id);
        if (it == goal_allocations.end()) {
            continue;
        }
        const double share = it->second / stats.total_value;
        stats.weighted_return += share * portfolio.expected_return;
        stats.weighted_risk += share * portfolio.expected_risk;
        for (const auto& [asset, w] : portfolio.weights) {
            stats.aggregate_allocation[asset] += share * w;
        }
    }

    stats.sharpe_ratio = stats.weighted_risk > 0.0
        ? (stats.weighted_return - risk_free_rate) / stats.weighted_risk
        : 0.0;
    stats.diversification_score = diversification_score(stats.aggregate_allocation);
    return stats;
}

std::vector<std::string> build_recommendations(const AggregateStats& stats,
                                               const TaxMetrics& tax_metrics) {
    std::vector<std::string> recommendations;

    if (tax_metrics.location_efficiency < MIN_LOCATION_EFFICIENCY) {
        recommendations.push_back(
            "Asset location efficiency is " + format_percent(tax_metrics.location_efficiency, 1) +
            ". Consider moving tax-inefficient assets (bonds, TIPS) to tax-deferred accounts.");
    }
    if (stats.diversification_score < MIN_DIVERSIFICATION) {
        recommendations.push_back(
            "Diversification score is " + format_percent(stats.diversification_score, 1) +
            ". Consider adding more asset classes to reduce concentration risk.");
    }
    if (tax_metrics.estimated_tax_drag > MAX_TAX_DRAG) {
        recommendations.push_back(
            "Estimated tax drag is " + format_percent(tax_metrics.estimated_tax_drag, 2) +
            " annually. Consider holding more tax-efficient assets in taxable accounts.");
    }
    if (stats.sharpe_ratio < MIN_SHARPE) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << stats.sharpe_ratio;
        recommendations.push_back(
            "Sharpe ratio is " + oss.str() +
            ". Risk-adjusted returns could be improved through better diversification.");
    }

    if (recommendations.empty()) {
        recommendations.push_back("Portfolio is well optimized. Continue monitoring quarterly.");
    }
    return recommendations;
}

} // namespace goalcalc
