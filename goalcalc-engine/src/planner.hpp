#ifndef GOALCALC_PLANNER_HPP
#define GOALCALC_PLANNER_HPP

#include "account_placement.hpp"
#include "capital_allocator.hpp"
#include "contribution_solver.hpp"
#include "glide_path.hpp"
#include "household.hpp"
#include "market_assumptions.hpp"
#include <map>
#include <string>
#include <vector>

namespace goalcalc {

struct PlannerOptions {
    GlidePathSettings glide_path;
    SolverConfig solver;
    bool evaluate_goals;            // Run the required-contribution solver per goal
    double target_probability;      // Used when evaluate_goals is set
    std::string run_id;             // Attached to log events

    PlannerOptions();
};

struct HouseholdPlan {
    double total_capital;
    std::vector<GoalNeed> needs;
    GoalAllocations goal_allocations;
    std::vector<std::string> underfunded_goals;
    std::vector<AllocationResult> portfolios;                   // Funded goals only
    std::map<std::string, RequiredContribution> contributions;  // When evaluated
    bool placement_performed;                                   // false without accounts
    PlacementResult placement;
    TaxMetrics tax_metrics;
    AggregateStats aggregate;
    std::vector<std::string> recommendations;
    double execution_time_ms;

    HouseholdPlan();
};

// Capital allocation -> glide-path portfolio per funded goal -> optional
// required-contribution evaluation -> account placement -> aggregation ->
// tax metrics -> recommendations.
//
// Evaluation starts each goal from current_amount plus its allocation and
// uses the goal portfolio's expected return and risk.
//
// Throws InvalidInputError for invalid goals or accounts.
HouseholdPlan run_household_plan(
    const std::vector<Goal>& goals,
    const std::vector<Account>& accounts,
    double total_capital,
    const CapitalMarketAssumptions& cma,
    const PlannerOptions& options = PlannerOptions()
);

} // namespace goalcalc

#endif // GOALCALC_PLANNER_HPP
