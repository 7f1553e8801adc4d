#include "capital_allocator.hpp"
#include "funding_calculator.hpp"
#include <algorithm>
#include <numeric>
#include <set>
#include <stdexcept>

namespace goalcalc {

namespace {

// Allocations within half a cent of the need count as fully funded
constexpr double FUNDING_TOLERANCE = 0.005;

void check_unique_ids(const std::vector<Goal>& goals) {
    std::set<std::string> seen;
    for (const auto& goal : goals) {
        if (!seen.insert(goal.id).second) {
            throw std::invalid_argument("Duplicate goal id: " + goal.id);
        }
    }
}

double total_need(const std::vector<GoalNeed>& needs) {
    return std::accumulate(needs.begin(), needs.end(), 0.0,
                           [](double sum, const GoalNeed& n) { return sum + n.need; });
}

} // anonymous namespace

GoalNeed::GoalNeed() : need(0.0), priority(Priority::Aspirational), years_to_goal(0.0) {}

GoalNeed::GoalNeed(std::string id, double amount, Priority prio, std::string date,
                   double years)
    : goal_id(std::move(id)), need(amount), priority(prio), target_date(std::move(date)),
      years_to_goal(years) {}

FundingState::FundingState() : remaining(0.0) {}

FundingState::FundingState(double capital) : remaining(capital) {}

std::vector<GoalNeed> compute_goal_needs(const std::vector<Goal>& goals) {
    check_unique_ids(goals);

    std::vector<GoalNeed> needs;
    needs.reserve(goals.size());
    for (const auto& goal : goals) {
        needs.emplace_back(goal.id, goal.funding_need(), goal.priority, goal.target_date,
                           goal.years_to_goal);
    }
    return needs;
}

std::vector<GoalNeed> compute_savings_needs(const std::vector<Goal>& goals,
                                            double expected_return) {
    check_unique_ids(goals);

    std::vector<GoalNeed> needs;
    needs.reserve(goals.size());
    for (const auto& goal : goals) {
        double monthly = monthly_contribution_for_target(
            goal.target_amount, goal.current_amount, goal.years_to_goal, expected_return);
        needs.emplace_back(goal.id, monthly * (goal.funding_percentage / 100.0),
                           goal.priority, goal.target_date, goal.years_to_goal);
    }
    return needs;
}

std::vector<GoalNeed> prioritize_needs(std::vector<GoalNeed> needs) {
    std::stable_sort(needs.begin(), needs.end(), [](const GoalNeed& a, const GoalNeed& b) {
        int rank_a = priority_rank(a.priority);
        int rank_b = priority_rank(b.priority);
        if (rank_a != rank_b) {
            return rank_a < rank_b;
        }
        bool dated_a = !a.target_date.empty();
        bool dated_b = !b.target_date.empty();
        if (dated_a != dated_b) {
            return dated_a;
        }
        if (dated_a) {
            return a.target_date < b.target_date;
        }
        return a.years_to_goal < b.years_to_goal;
    });
    return needs;
}

FundingState fund_next_goal(const FundingState& state, const GoalNeed& need) {
    FundingState next = state;
    double granted = std::min(need.need, std::max(0.0, state.remaining));
    next.allocations[need.goal_id] = granted;
    next.remaining = state.remaining - granted;
    return next;
}

GoalAllocations allocate_to_needs(const std::vector<GoalNeed>& needs, double available) {
    const double need_sum = total_need(needs);

    if (need_sum > available) {
        std::vector<GoalNeed> ordered = prioritize_needs(needs);
        FundingState final_state = std::accumulate(
            ordered.begin(), ordered.end(), FundingState(available), fund_next_goal);
        return final_state.allocations;
    }

    GoalAllocations allocations;
    const double surplus = available - need_sum;
    for (const auto& n : needs) {
        double share = need_sum > 0.0 ? n.need / need_sum : 0.0;
        allocations[n.goal_id] = n.need + surplus * share;
    }
    return allocations;
}

GoalAllocations allocate_capital_to_goals(const std::vector<Goal>& goals, double total_capital) {
    return allocate_to_needs(compute_goal_needs(goals), total_capital);
}

GoalAllocations allocate_capital_to_goals(const GoalSet& goals, double total_capital) {
    return allocate_capital_to_goals(goals.goals(), total_capital);
}

GoalAllocations allocate_savings_to_goals(const std::vector<Goal>& goals,
                                          double total_monthly_savings,
                                          double expected_return) {
    return allocate_to_needs(compute_savings_needs(goals, expected_return),
                             total_monthly_savings);
}

std::vector<std::string> find_underfunded_goals(const std::vector<GoalNeed>& needs,
                                                const GoalAllocations& allocations) {
    std::vector<std::string> underfunded;
    for (const auto& n : needs) {
        auto it = allocations.find(n.goal_id);
        double allocated = it == allocations.end() ? 0.0 : it->second;
        if (allocated + FUNDING_TOLERANCE < n.need) {
            underfunded.push_back(n.goal_id);
        }
    }
    return underfunded;
}

} // namespace goalcalc
