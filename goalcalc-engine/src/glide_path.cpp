#include "glide_path.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace goalcalc {

namespace {

constexpr double SPLIT_TOLERANCE = 1e-9;

double clamp(double value, double low, double high) {
    return std::max(low, std::min(value, high));
}

} // anonymous namespace

// ============================================================================
// GlidePathSettings
// ============================================================================

GlidePathSettings::GlidePathSettings()
    : domestic_equity_share(0.6),
      international_equity_share(0.3),
      emerging_markets_share(0.1),
      bonds_share(0.7),
      tips_share(0.2),
      cash_share(0.1),
      essential_delta(-0.1),
      important_delta(0.0),
      aspirational_delta(0.1),
      min_equity(0.1),
      max_equity(0.9),
      horizon_years(50.0),
      risk_free_rate(0.04) {}

void GlidePathSettings::validate() const {
    double equity_sum = domestic_equity_share + international_equity_share + emerging_markets_share;
    if (std::abs(equity_sum - 1.0) > SPLIT_TOLERANCE) {
        throw std::invalid_argument("Glide path equity split must sum to 1");
    }
    double fixed_sum = bonds_share + tips_share + cash_share;
    if (std::abs(fixed_sum - 1.0) > SPLIT_TOLERANCE) {
        throw std::invalid_argument("Glide path fixed-income split must sum to 1");
    }
    if (min_equity < 0.0 || max_equity > 1.0 || min_equity > max_equity) {
        throw std::invalid_argument("Glide path equity bounds must satisfy 0 <= min <= max <= 1");
    }
    if (horizon_years <= 0.0) {
        throw std::invalid_argument("Glide path horizon must be positive");
    }
}

// ============================================================================
// AllocationResult
// ============================================================================

AllocationResult::AllocationResult()
    : allocated_amount(0.0), years_to_goal(0.0), risk_tolerance(0.0),
      expected_return(0.0), expected_risk(0.0), sharpe_ratio(0.0) {}

double AllocationResult::weight(AssetClass asset) const {
    auto it = weights.find(asset);
    return it == weights.end() ? 0.0 : it->second;
}

// ============================================================================
// Glide path
// ============================================================================

double derive_risk_tolerance(double years_to_goal, Priority priority,
                             const GlidePathSettings& settings) {
    double base;
    if (years_to_goal >= 30.0) {
        base = 0.9;
    } else if (years_to_goal >= 20.0) {
        base = 0.8;
    } else if (years_to_goal >= 15.0) {
        base = 0.7;
    } else if (years_to_goal >= 10.0) {
        base = 0.6;
    } else if (years_to_goal >= 5.0) {
        base = 0.4;
    } else if (years_to_goal >= 3.0) {
        base = 0.3;
    } else {
        base = 0.2;
    }

    double delta = 0.0;
    switch (priority) {
        case Priority::Essential: delta = settings.essential_delta; break;
        case Priority::Important: delta = settings.important_delta; break;
        case Priority::Aspirational: delta = settings.aspirational_delta; break;
    }

    return clamp(base + delta, 0.0, 1.0);
}

double equity_share(double years_to_goal, double risk_tolerance,
                    const GlidePathSettings& settings) {
    double base = clamp(1.0 - years_to_goal / settings.horizon_years,
                        settings.min_equity, settings.max_equity);
    double adjusted = base * (0.7 + risk_tolerance * 0.6);
    return clamp(adjusted, settings.min_equity, settings.max_equity);
}

std::map<AssetClass, double> glide_path_weights(double equity, const GlidePathSettings& settings) {
    const double fixed_income = 1.0 - equity;
    return {
        {AssetClass::DomesticEquity, equity * settings.domestic_equity_share},
        {AssetClass::InternationalEquity, equity * settings.international_equity_share},
        {AssetClass::EmergingMarkets, equity * settings.emerging_markets_share},
        {AssetClass::Bonds, fixed_income * settings.bonds_share},
        {AssetClass::Tips, fixed_income * settings.tips_share},
        {AssetClass::Cash, fixed_income * settings.cash_share}
    };
}

void compute_portfolio_metrics(const std::map<AssetClass, double>& weights,
                               const CapitalMarketAssumptions& cma,
                               double risk_free_rate,
                               double& expected_return,
                               double& expected_risk,
                               double& sharpe_ratio) {
    expected_return = 0.0;
    expected_risk = 0.0;
    for (const auto& [asset, w] : weights) {
        expected_return += w * cma.expected_return(asset);
        expected_risk += w * cma.volatility(asset);
    }
    sharpe_ratio = expected_risk > 0.0
        ? (expected_return - risk_free_rate) / expected_risk
        : 0.0;
}

AllocationResult build_goal_portfolio(
    const Goal& goal,
    double allocated_amount,
    const CapitalMarketAssumptions& cma,
    const GlidePathSettings& settings)
{
    AllocationResult result;
    result.goal_id = goal.id;
    result.allocated_amount = allocated_amount;
    result.years_to_goal = goal.years_to_goal;
    result.risk_tolerance = derive_risk_tolerance(goal.years_to_goal, goal.priority, settings);

    double equity = equity_share(goal.years_to_goal, result.risk_tolerance, settings);
    result.weights = glide_path_weights(equity, settings);

    compute_portfolio_metrics(result.weights, cma, settings.risk_free_rate,
                              result.expected_return, result.expected_risk,
                              result.sharpe_ratio);
    return result;
}

} // namespace goalcalc
