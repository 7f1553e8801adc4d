#include "funding_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace goalcalc {

namespace {

// Longest horizon the timeline search will consider
constexpr double MAX_TIMELINE_YEARS = 200.0;
constexpr double TIMELINE_TOLERANCE_YEARS = 0.1;

// Current savings plus a level monthly contribution, compounded monthly
double projected_value(double current_amount, double monthly_contribution,
                       double years, double expected_return) {
    double months = years * 12.0;
    double monthly_rate = expected_return / 12.0;
    double growth = std::pow(1.0 + monthly_rate, months);
    double fv_current = current_amount * growth;
    double fv_contributions = monthly_rate > 0.0
        ? monthly_contribution * (growth - 1.0) / monthly_rate
        : monthly_contribution * months;
    return fv_current + fv_contributions;
}

} // anonymous namespace

// ============================================================================
// Annuity helpers
// ============================================================================

double annuity_payment(double future_value, double periodic_rate, double periods) {
    if (periods <= 0.0) {
        return future_value;
    }
    if (periodic_rate == 0.0) {
        return future_value / periods;
    }
    return future_value * periodic_rate / (std::pow(1.0 + periodic_rate, periods) - 1.0);
}

double annuity_present_value(double payment, double periodic_rate, double periods) {
    if (periods <= 0.0) {
        return 0.0;
    }
    if (periodic_rate == 0.0) {
        return payment * periods;
    }
    return payment * (1.0 - std::pow(1.0 + periodic_rate, -periods)) / periodic_rate;
}

double monthly_contribution_for_target(
    double target_amount,
    double current_amount,
    double years_to_goal,
    double expected_return)
{
    double months = std::max(0.0, years_to_goal) * 12.0;
    double monthly_rate = expected_return / 12.0;
    double fv_current = current_amount * std::pow(1.0 + monthly_rate, months);
    double remaining = target_amount - fv_current;

    if (remaining <= 0.0) {
        return 0.0;
    }
    return annuity_payment(remaining, monthly_rate, months);
}

// ============================================================================
// Funding requirements
// ============================================================================

FundingRequirements::FundingRequirements()
    : target_amount(0.0), inflation_adjusted_target(0.0), current_amount(0.0),
      future_value_current(0.0), remaining_need(0.0), required_monthly_savings(0.0),
      required_annual_savings(0.0), lump_sum_needed_today(0.0),
      present_value_future_contributions(0.0), total_funding_required(0.0),
      funding_percentage(0.0), years_to_goal(0.0), expected_return(0.0),
      inflation_rate(0.0), real_return(0.0) {}

FundingRequirements compute_funding_requirements(
    double target_amount,
    double current_amount,
    double years_to_goal,
    double expected_return,
    double inflation_rate)
{
    FundingRequirements req;
    req.target_amount = target_amount;
    req.current_amount = current_amount;
    req.years_to_goal = years_to_goal;
    req.expected_return = expected_return;
    req.inflation_rate = inflation_rate;

    const double years = std::max(0.0, years_to_goal);

    req.real_return = (1.0 + expected_return) / (1.0 + inflation_rate) - 1.0;
    req.inflation_adjusted_target = target_amount * std::pow(1.0 + inflation_rate, years);
    req.future_value_current = current_amount * std::pow(1.0 + expected_return, years);
    req.remaining_need = std::max(0.0, req.inflation_adjusted_target - req.future_value_current);

    const double months = years * 12.0;
    const double monthly_rate = expected_return / 12.0;

    req.required_monthly_savings = annuity_payment(req.remaining_need, monthly_rate, months);
    req.required_annual_savings = annuity_payment(req.remaining_need, expected_return, years);

    req.lump_sum_needed_today = years > 0.0
        ? req.remaining_need / std::pow(1.0 + expected_return, years)
        : req.remaining_need;

    req.present_value_future_contributions =
        annuity_present_value(req.required_monthly_savings, monthly_rate, months);

    req.total_funding_required = current_amount + req.present_value_future_contributions;
    req.funding_percentage = req.total_funding_required > 0.0
        ? current_amount / req.total_funding_required * 100.0
        : 0.0;

    return req;
}

// ============================================================================
// Catch-up strategy
// ============================================================================

std::string to_string(CatchUpFeasibility feasibility) {
    switch (feasibility) {
        case CatchUpFeasibility::High: return "high";
        case CatchUpFeasibility::Medium: return "medium";
        case CatchUpFeasibility::Challenging: return "challenging";
    }
    throw std::invalid_argument("Unknown catch-up feasibility");
}

std::string to_string(CatchUpRecommendation recommendation) {
    switch (recommendation) {
        case CatchUpRecommendation::VeryFeasible: return "very_feasible";
        case CatchUpRecommendation::Feasible: return "feasible";
        case CatchUpRecommendation::Challenging: return "challenging";
        case CatchUpRecommendation::MajorRevisionNeeded: return "major_revision_needed";
    }
    throw std::invalid_argument("Unknown catch-up recommendation");
}

std::string recommendation_text(CatchUpRecommendation recommendation) {
    switch (recommendation) {
        case CatchUpRecommendation::VeryFeasible:
            return "Small increase needed - catch-up is very feasible";
        case CatchUpRecommendation::Feasible:
            return "Moderate increase needed - catch-up is feasible with some adjustment";
        case CatchUpRecommendation::Challenging:
            return "Significant increase needed - consider extending timeline or reducing target";
        case CatchUpRecommendation::MajorRevisionNeeded:
            return "Major increase needed - timeline extension or target reduction strongly recommended";
    }
    throw std::invalid_argument("Unknown catch-up recommendation");
}

CatchUpStrategy::CatchUpStrategy()
    : years_behind_schedule(0.0), years_remaining(0.0), expected_current_amount(0.0),
      actual_current_amount(0.0), shortfall(0.0), original_required_monthly(0.0),
      catchup_required_monthly(0.0), additional_monthly_needed(0.0),
      catch_up_percentage(0.0), feasibility(CatchUpFeasibility::High),
      recommendation(CatchUpRecommendation::VeryFeasible) {}

CatchUpStrategy compute_catch_up_strategy(
    double target_amount,
    double current_amount,
    double years_remaining,
    double years_behind_schedule,
    double expected_return)
{
    CatchUpStrategy s;
    s.years_behind_schedule = years_behind_schedule;
    s.years_remaining = years_remaining;
    s.actual_current_amount = current_amount;

    // Where a saver who started on time would be, assuming linear progress
    const double original_timeline = years_remaining + years_behind_schedule;
    const double expected_progress = original_timeline > 0.0
        ? years_behind_schedule / original_timeline
        : 1.0;
    s.expected_current_amount = target_amount * expected_progress;
    s.shortfall = s.expected_current_amount - current_amount;

    s.original_required_monthly = compute_funding_requirements(
        target_amount, 0.0, original_timeline, expected_return).required_monthly_savings;
    s.catchup_required_monthly = compute_funding_requirements(
        target_amount, current_amount, years_remaining, expected_return).required_monthly_savings;
    s.additional_monthly_needed = s.catchup_required_monthly - s.original_required_monthly;

    const double baseline = s.original_required_monthly;
    const double additional = s.additional_monthly_needed;

    s.catch_up_percentage = baseline > 0.0 ? additional / baseline * 100.0 : 0.0;

    if (additional < baseline * 0.5) {
        s.feasibility = CatchUpFeasibility::High;
    } else if (additional < baseline) {
        s.feasibility = CatchUpFeasibility::Medium;
    } else {
        s.feasibility = CatchUpFeasibility::Challenging;
    }

    if (additional < baseline * 0.25) {
        s.recommendation = CatchUpRecommendation::VeryFeasible;
    } else if (additional < baseline * 0.5) {
        s.recommendation = CatchUpRecommendation::Feasible;
    } else if (additional < baseline) {
        s.recommendation = CatchUpRecommendation::Challenging;
    } else {
        s.recommendation = CatchUpRecommendation::MajorRevisionNeeded;
    }

    return s;
}

// ============================================================================
// Contribution timeline
// ============================================================================

std::string to_string(TimelineStatus status) {
    switch (status) {
        case TimelineStatus::Achievable: return "achievable";
        case TimelineStatus::ExtensionNeeded: return "timeline_extension_needed";
    }
    throw std::invalid_argument("Unknown timeline status");
}

ContributionTimeline::ContributionTimeline()
    : status(TimelineStatus::Achievable), optimal_monthly_contribution(0.0),
      original_years(0.0), required_years(0.0), additional_years(0.0),
      projected_value(0.0), surplus(0.0), shortfall(0.0), reachable(true) {}

ContributionTimeline optimize_contribution_timeline(
    double target_amount,
    double current_amount,
    double years_to_goal,
    double max_monthly_contribution,
    double expected_return)
{
    ContributionTimeline t;
    t.original_years = years_to_goal;
    t.projected_value = projected_value(current_amount, max_monthly_contribution,
                                        years_to_goal, expected_return);

    if (t.projected_value >= target_amount) {
        double needed = monthly_contribution_for_target(
            target_amount, current_amount, years_to_goal, expected_return);
        t.status = TimelineStatus::Achievable;
        t.optimal_monthly_contribution = std::min(needed, max_monthly_contribution);
        t.required_years = years_to_goal;
        t.surplus = t.projected_value - target_amount;
        return t;
    }

    t.status = TimelineStatus::ExtensionNeeded;
    t.optimal_monthly_contribution = max_monthly_contribution;
    t.shortfall = target_amount - t.projected_value;

    if (max_monthly_contribution <= 0.0) {
        // Only growth of current savings can close the gap
        if (current_amount > 0.0 && expected_return > 0.0) {
            t.required_years = std::log(target_amount / current_amount) /
                               std::log(1.0 + expected_return);
        } else {
            t.reachable = false;
            t.required_years = std::numeric_limits<double>::infinity();
        }
    } else {
        double low = std::max(0.0, years_to_goal);
        double high = std::max(low * 3.0, 1.0);

        // Widen the bracket until it contains the answer
        while (projected_value(current_amount, max_monthly_contribution, high, expected_return)
                   < target_amount &&
               high < MAX_TIMELINE_YEARS) {
            low = high;
            high = std::min(high * 2.0, MAX_TIMELINE_YEARS);
        }

        if (projected_value(current_amount, max_monthly_contribution, high, expected_return)
                < target_amount) {
            t.reachable = false;
            t.required_years = std::numeric_limits<double>::infinity();
        } else {
            while (high - low > TIMELINE_TOLERANCE_YEARS) {
                double mid = (low + high) / 2.0;
                if (projected_value(current_amount, max_monthly_contribution, mid,
                                    expected_return) < target_amount) {
                    low = mid;
                } else {
                    high = mid;
                }
            }
            t.required_years = (low + high) / 2.0;
        }
    }

    t.additional_years = t.reachable ? t.required_years - years_to_goal
                                     : std::numeric_limits<double>::infinity();
    return t;
}

} // namespace goalcalc
