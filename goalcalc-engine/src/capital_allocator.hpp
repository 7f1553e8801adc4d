#ifndef GOALCALC_CAPITAL_ALLOCATOR_HPP
#define GOALCALC_CAPITAL_ALLOCATOR_HPP

#include "goal.hpp"
#include <map>
#include <string>
#include <vector>

namespace goalcalc {

// goal_id -> allocated amount
using GoalAllocations = std::map<std::string, double>;

// Amount one goal draws from the shared pool, with the keys used to order
// goals when the pool is short
struct GoalNeed {
    std::string goal_id;
    double need;
    Priority priority;
    std::string target_date;        // Empty when the goal has no date
    double years_to_goal;

    GoalNeed();
    GoalNeed(std::string id, double amount, Priority prio, std::string date,
             double years = 0.0);
};

// Running state of the prioritized walk
struct FundingState {
    double remaining;
    GoalAllocations allocations;

    FundingState();
    explicit FundingState(double capital);
};

// Capital need per goal: max(0, target - current) * funding_percentage / 100.
// Throws std::invalid_argument on duplicate goal ids.
std::vector<GoalNeed> compute_goal_needs(const std::vector<Goal>& goals);

// Monthly savings need per goal: deterministic required monthly savings
// (no inflation) scaled by funding_percentage.
std::vector<GoalNeed> compute_savings_needs(const std::vector<Goal>& goals,
                                            double expected_return);

// Order used when capital is short: priority rank, then earlier target date.
// Undated goals follow the dated ones of the same priority, nearest horizon
// first. Stable, so goals equal on every key keep their input order.
std::vector<GoalNeed> prioritize_needs(std::vector<GoalNeed> needs);

// One step of the prioritized walk. Funds the goal in full if the pool
// allows, otherwise gives it what is left (possibly 0).
FundingState fund_next_goal(const FundingState& state, const GoalNeed& need);

// Distribute `available` over precomputed needs:
//   - total need <= available: every need in full, surplus shared in
//     proportion to need (no sharing when total need is 0)
//   - otherwise: prioritized walk over prioritize_needs()
GoalAllocations allocate_to_needs(const std::vector<GoalNeed>& needs, double available);

GoalAllocations allocate_capital_to_goals(const std::vector<Goal>& goals, double total_capital);
GoalAllocations allocate_capital_to_goals(const GoalSet& goals, double total_capital);

// Ongoing-contribution variant: splits a monthly savings budget
GoalAllocations allocate_savings_to_goals(const std::vector<Goal>& goals,
                                          double total_monthly_savings,
                                          double expected_return);

// Goals whose allocation is below their need, in the order of `needs`
std::vector<std::string> find_underfunded_goals(const std::vector<GoalNeed>& needs,
                                                const GoalAllocations& allocations);

} // namespace goalcalc

#endif // GOALCALC_CAPITAL_ALLOCATOR_HPP
