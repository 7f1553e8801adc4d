#include "planner.hpp"
#include "logger.hpp"
#include "validation.hpp"
#include <chrono>

namespace goalcalc {

PlannerOptions::PlannerOptions()
    : evaluate_goals(false), target_probability(0.90) {}

HouseholdPlan::HouseholdPlan()
    : total_capital(0.0), placement_performed(false), execution_time_ms(0.0) {}

HouseholdPlan run_household_plan(
    const std::vector<Goal>& goals,
    const std::vector<Account>& accounts,
    double total_capital,
    const CapitalMarketAssumptions& cma,
    const PlannerOptions& options)
{
    auto start_time = std::chrono::high_resolution_clock::now();
    Logger& logger = Logger::get_instance();
    RunContext ctx(options.run_id, "plan");

    validate_goals(goals);
    validate_accounts(accounts);
    if (total_capital < 0.0) {
        throw InvalidInputError("total_capital", "must not be negative");
    }
    if (options.evaluate_goals) {
        validate_target_probability(options.target_probability);
    }
    options.glide_path.validate();

    logger.log_run_start(ctx, {
        {"goals", std::to_string(goals.size())},
        {"accounts", std::to_string(accounts.size())},
        {"total_capital", std::to_string(total_capital)}
    });

    HouseholdPlan plan;
    plan.total_capital = total_capital;

    // Goal level
    plan.needs = compute_goal_needs(goals);
    plan.goal_allocations = allocate_to_needs(plan.needs, total_capital);
    plan.underfunded_goals = find_underfunded_goals(plan.needs, plan.goal_allocations);

    for (const auto& goal : goals) {
        const double allocated = plan.goal_allocations[goal.id];
        AllocationResult portfolio = build_goal_portfolio(goal, allocated, cma, options.glide_path);

        if (options.evaluate_goals) {
            RunContext goal_ctx = ctx;
            goal_ctx.goal_id = goal.id;
            plan.contributions[goal.id] = compute_required_contribution(
                goal.target_amount, goal.current_amount + allocated, goal.years_to_goal,
                options.target_probability, portfolio.expected_return,
                portfolio.expected_risk, options.solver, goal_ctx);
        }

        if (allocated > 0.0) {
            plan.portfolios.push_back(std::move(portfolio));
        }
    }

    for (const auto& goal_id : plan.underfunded_goals) {
        RunContext goal_ctx = ctx;
        goal_ctx.goal_id = goal_id;
        logger.log_warning(goal_ctx, "Goal is funded below its need");
    }

    // Account level
    if (accounts.empty()) {
        logger.log_warning(ctx, "No accounts supplied; skipping account placement");
    } else {
        plan.placement = place_assets_in_accounts(plan.portfolios, accounts);
        plan.placement_performed = true;
        plan.tax_metrics = compute_tax_metrics(plan.placement, cma);
    }

    // Household level
    plan.aggregate = aggregate_household(plan.portfolios, plan.goal_allocations,
                                         options.glide_path.risk_free_rate);
    if (plan.placement_performed) {
        plan.recommendations = build_recommendations(plan.aggregate, plan.tax_metrics);
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    plan.execution_time_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    logger.log_run_complete(ctx, plan.execution_time_ms, {
        {"funded_goals", std::to_string(plan.portfolios.size())},
        {"underfunded_goals", std::to_string(plan.underfunded_goals.size())},
        {"total_unplaced", std::to_string(plan.placement.total_unplaced)}
    });

    return plan;
}

} // namespace goalcalc
