#ifndef GOALCALC_FUNDING_CALCULATOR_HPP
#define GOALCALC_FUNDING_CALCULATOR_HPP

#include <string>

namespace goalcalc {

constexpr double DEFAULT_EXPECTED_RETURN = 0.07;
constexpr double DEFAULT_INFLATION_RATE = 0.03;

// Closed-form time-value-of-money results for one goal. No randomness.
struct FundingRequirements {
    double target_amount;
    double inflation_adjusted_target;           // target * (1+inflation)^years
    double current_amount;
    double future_value_current;                // current * (1+r)^years
    double remaining_need;                      // max(0, adjusted target - fv current)
    double required_monthly_savings;
    double required_annual_savings;
    double lump_sum_needed_today;               // remaining_need / (1+r)^years
    double present_value_future_contributions;
    double total_funding_required;              // current + pv of contributions
    double funding_percentage;                  // current / total * 100
    double years_to_goal;
    double expected_return;
    double inflation_rate;
    double real_return;                         // (1+r)/(1+i) - 1

    FundingRequirements();
};

FundingRequirements compute_funding_requirements(
    double target_amount,
    double current_amount,
    double years_to_goal,
    double expected_return = DEFAULT_EXPECTED_RETURN,
    double inflation_rate = DEFAULT_INFLATION_RATE
);

// Annuity payment that accumulates future_value over periods at
// periodic_rate: PMT = FV * r / ((1+r)^n - 1). Linear FV / n when the rate
// is exactly 0; the whole FV when there are no periods.
double annuity_payment(double future_value, double periodic_rate, double periods);

// Present value of a level payment stream: PMT * (1 - (1+r)^-n) / r,
// PMT * n when the rate is 0, and 0 when there are no periods.
double annuity_present_value(double payment, double periodic_rate, double periods);

// Deterministic monthly contribution that reaches target_amount when
// current savings compound monthly at expected_return/12. No inflation.
// Never negative; an over-funded goal needs 0.
double monthly_contribution_for_target(
    double target_amount,
    double current_amount,
    double years_to_goal,
    double expected_return
);

// ============================================================================
// Catch-up strategy
// ============================================================================

enum class CatchUpFeasibility {
    High,           // additional < 50% of baseline
    Medium,         // additional < 100% of baseline
    Challenging     // additional >= 100% of baseline
};

enum class CatchUpRecommendation {
    VeryFeasible,           // additional < 25% of baseline
    Feasible,               // < 50%
    Challenging,            // < 100%
    MajorRevisionNeeded     // >= 100%
};

std::string to_string(CatchUpFeasibility feasibility);
std::string to_string(CatchUpRecommendation recommendation);
std::string recommendation_text(CatchUpRecommendation recommendation);

struct CatchUpStrategy {
    double years_behind_schedule;
    double years_remaining;
    double expected_current_amount;     // Linear progress assumption
    double actual_current_amount;
    double shortfall;                   // expected - actual (negative when ahead)
    double original_required_monthly;   // Never-behind baseline from zero savings
    double catchup_required_monthly;
    double additional_monthly_needed;
    double catch_up_percentage;         // additional / baseline * 100, 0 if no baseline
    CatchUpFeasibility feasibility;
    CatchUpRecommendation recommendation;

    CatchUpStrategy();
};

CatchUpStrategy compute_catch_up_strategy(
    double target_amount,
    double current_amount,
    double years_remaining,
    double years_behind_schedule,
    double expected_return = DEFAULT_EXPECTED_RETURN
);

// ============================================================================
// Contribution timeline under a budget cap
// ============================================================================

enum class TimelineStatus {
    Achievable,
    ExtensionNeeded
};

std::string to_string(TimelineStatus status);

struct ContributionTimeline {
    TimelineStatus status;
    double optimal_monthly_contribution;
    double original_years;
    double required_years;          // Equals original_years when achievable
    double additional_years;
    double projected_value;         // Value at original_years with the capped contribution
    double surplus;                 // projected - target when achievable
    double shortfall;               // target - projected when an extension is needed
    bool reachable;                 // false when no finite timeline reaches the target

    ContributionTimeline();
};

ContributionTimeline optimize_contribution_timeline(
    double target_amount,
    double current_amount,
    double years_to_goal,
    double max_monthly_contribution,
    double expected_return = DEFAULT_EXPECTED_RETURN
);

} // namespace goalcalc

#endif // GOALCALC_FUNDING_CALCULATOR_HPP
