#include "json_writer.hpp"
#include "../statistics.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace goalcalc {
namespace io {

json asset_map_to_json(const std::map<AssetClass, double>& values, int decimals) {
    json j = json::object();
    for (const auto& [asset, value] : values) {
        j[to_code(asset)] = round_to(value, decimals);
    }
    return j;
}

json to_json(const FundingRequirements& req) {
    return {
        {"target_amount", round_currency(req.target_amount)},
        {"inflation_adjusted_target", round_currency(req.inflation_adjusted_target)},
        {"current_amount", round_currency(req.current_amount)},
        {"future_value_current", round_currency(req.future_value_current)},
        {"remaining_need", round_currency(req.remaining_need)},
        {"required_monthly_savings", round_currency(req.required_monthly_savings)},
        {"required_annual_savings", round_currency(req.required_annual_savings)},
        {"lump_sum_needed_today", round_currency(req.lump_sum_needed_today)},
        {"present_value_future_contributions",
         round_currency(req.present_value_future_contributions)},
        {"total_funding_required", round_currency(req.total_funding_required)},
        {"funding_percentage", round_currency(req.funding_percentage)},
        {"years_to_goal", req.years_to_goal},
        {"expected_return", round_rate(req.expected_return)},
        {"inflation_rate", round_rate(req.inflation_rate)},
        {"real_return", round_rate(req.real_return)}
    };
}

json to_json(const CatchUpStrategy& s) {
    return {
        {"years_behind_schedule", s.years_behind_schedule},
        {"years_remaining", s.years_remaining},
        {"expected_current_amount", round_currency(s.expected_current_amount)},
        {"actual_current_amount", round_currency(s.actual_current_amount)},
        {"shortfall", round_currency(s.shortfall)},
        {"original_required_monthly", round_currency(s.original_required_monthly)},
        {"catchup_required_monthly", round_currency(s.catchup_required_monthly)},
        {"additional_monthly_needed", round_currency(s.additional_monthly_needed)},
        {"catch_up_percentage", round_currency(s.catch_up_percentage)},
        {"feasibility", to_string(s.feasibility)},
        {"recommendation", to_string(s.recommendation)},
        {"recommendation_text", recommendation_text(s.recommendation)}
    };
}

json to_json(const ContributionTimeline& t) {
    json j = {
        {"status", to_string(t.status)},
        {"optimal_monthly_contribution", round_currency(t.optimal_monthly_contribution)},
        {"original_years", t.original_years},
        {"projected_value", round_currency(t.projected_value)},
        {"reachable", t.reachable}
    };
    if (t.reachable) {
        j["required_years"] = round_to(t.required_years, 1);
        j["additional_years"] = round_to(t.additional_years, 1);
    } else {
        j["required_years"] = nullptr;
        j["additional_years"] = nullptr;
    }
    if (t.status == TimelineStatus::Achievable) {
        j["surplus"] = round_currency(t.surplus);
    } else {
        j["shortfall"] = round_currency(t.shortfall);
    }
    return j;
}

json to_json(const RequiredContribution& r) {
    return {
        {"required_monthly_savings", round_currency(r.required_monthly)},
        {"required_annual_savings", round_currency(r.required_annual)},
        {"target_probability", round_rate(r.target_probability)},
        {"estimated_success_probability", round_rate(r.estimated_success_probability)},
        {"median_outcome", round_currency(r.median_outcome)},
        {"years_to_goal", r.years_to_goal},
        {"total_contributions", round_currency(r.total_contributions)},
        {"contribution_percentage", round_currency(r.contribution_percentage)},
        {"search_steps", r.search_steps},
        {"converged", r.converged}
    };
}

json to_json(const SimulationResult& result, bool include_distribution) {
    json j = {
        {"success_probability", round_rate(result.success_probability)},
        {"shortfall_risk", round_rate(result.shortfall_risk)},
        {"median_outcome", round_currency(result.median_outcome)},
        {"percentile_10", round_currency(result.percentile_10)},
        {"percentile_25", round_currency(result.percentile_25)},
        {"percentile_75", round_currency(result.percentile_75)},
        {"percentile_90", round_currency(result.percentile_90)},
        {"expected_value", round_currency(result.expected_value)},
        {"standard_deviation", round_currency(result.standard_deviation)},
        {"median_shortfall", round_currency(result.median_shortfall)},
        {"target_amount", round_currency(result.target_amount)},
        {"iterations", result.iterations},
        {"execution_time_ms", round_currency(result.execution_time_ms)}
    };
    if (include_distribution && !result.terminal_values.empty()) {
        json distribution = json::array();
        for (double v : result.terminal_values) {
            distribution.push_back(round_currency(v));
        }
        j["distribution"] = std::move(distribution);
    }
    return j;
}

json to_json(const AllocationResult& p) {
    return {
        {"goal_id", p.goal_id},
        {"allocated_amount", round_currency(p.allocated_amount)},
        {"years_to_goal", p.years_to_goal},
        {"risk_tolerance", round_rate(p.risk_tolerance)},
        {"weights", asset_map_to_json(p.weights, 4)},
        {"expected_return", round_rate(p.expected_return)},
        {"expected_risk", round_rate(p.expected_risk)},
        {"sharpe_ratio", round_rate(p.sharpe_ratio)}
    };
}

json to_json(const PlacementResult& placement) {
    json accounts = json::object();
    for (const auto& [id, allocation] : placement.allocations) {
        accounts[id] = {
            {"type", to_string(allocation.type)},
            {"balance", round_currency(allocation.balance)},
            {"holdings", asset_map_to_json(allocation.holdings, 2)},
            {"total", round_currency(allocation.total())}
        };
    }
    return {
        {"accounts", accounts},
        {"unplaced", asset_map_to_json(placement.unplaced, 2)},
        {"total_unplaced", round_currency(placement.total_unplaced)}
    };
}

json to_json(const TaxMetrics& metrics) {
    return {
        {"estimated_tax_drag", round_rate(metrics.estimated_tax_drag)},
        {"location_efficiency", round_rate(metrics.location_efficiency)}
    };
}

json to_json(const AggregateStats& stats) {
    return {
        {"total_value", round_currency(stats.total_value)},
        {"weighted_return", round_rate(stats.weighted_return)},
        {"weighted_risk", round_rate(stats.weighted_risk)},
        {"sharpe_ratio", round_rate(stats.sharpe_ratio)},
        {"aggregate_allocation", asset_map_to_json(stats.aggregate_allocation, 4)},
        {"diversification_score", round_rate(stats.diversification_score)}
    };
}

json allocations_to_json(const GoalAllocations& allocations,
                         const std::vector<std::string>& underfunded_goals) {
    json amounts = json::object();
    double total = 0.0;
    for (const auto& [id, amount] : allocations) {
        amounts[id] = round_currency(amount);
        total += amount;
    }
    return {
        {"allocations", amounts},
        {"total_allocated", round_currency(total)},
        {"underfunded_goals", underfunded_goals}
    };
}

json to_json(const HouseholdPlan& plan) {
    json portfolios = json::array();
    for (const auto& p : plan.portfolios) {
        portfolios.push_back(to_json(p));
    }

    json j = {
        {"total_capital", round_currency(plan.total_capital)},
        {"goal_allocations", allocations_to_json(plan.goal_allocations, plan.underfunded_goals)},
        {"goal_portfolios", portfolios},
        {"aggregate", to_json(plan.aggregate)},
        {"recommendations", plan.recommendations},
        {"execution_time_ms", round_currency(plan.execution_time_ms)}
    };

    if (!plan.contributions.empty()) {
        json contributions = json::object();
        for (const auto& [id, c] : plan.contributions) {
            contributions[id] = to_json(c);
        }
        j["required_contributions"] = contributions;
    }

    if (plan.placement_performed) {
        j["account_placement"] = to_json(plan.placement);
        j["tax_metrics"] = to_json(plan.tax_metrics);
    } else {
        j["account_placement"] = nullptr;
    }
    return j;
}

void write_json(std::ostream& os, const json& document, bool pretty_print) {
    os << (pretty_print ? document.dump(2) : document.dump()) << "\n";
}

void write_json(const std::string& filepath, const json& document, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_json(file, document, pretty_print);
}

} // namespace io
} // namespace goalcalc
