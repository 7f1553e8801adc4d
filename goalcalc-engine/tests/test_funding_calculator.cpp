#include <catch2/catch.hpp>
#include <cmath>
#include "funding_calculator.hpp"

using namespace goalcalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// ============================================================================
// Annuity helpers
// ============================================================================

TEST_CASE("Annuity payment", "[funding_calculator]") {
    REQUIRE_THAT(annuity_payment(100000.0, 0.07 / 12.0, 120.0),
                 WithinRel(577.7514588529, 1e-9));
    REQUIRE_THAT(annuity_payment(12000.0, 0.0, 12.0), WithinAbs(1000.0, 1e-12));
    REQUIRE(annuity_payment(5000.0, 0.01, 0.0) == 5000.0);
}

TEST_CASE("Annuity present value", "[funding_calculator]") {
    REQUIRE_THAT(annuity_present_value(100.0, 0.0, 12.0), WithinAbs(1200.0, 1e-12));
    REQUIRE(annuity_present_value(100.0, 0.01, 0.0) == 0.0);

    double pv = annuity_present_value(1000.0, 0.05, 10.0);
    REQUIRE_THAT(pv, WithinRel(1000.0 * (1.0 - std::pow(1.05, -10.0)) / 0.05, 1e-12));
}

TEST_CASE("Monthly contribution for target", "[funding_calculator]") {
    REQUIRE_THAT(monthly_contribution_for_target(100000.0, 0.0, 10.0, 0.07),
                 WithinRel(577.7514588529, 1e-9));
    REQUIRE(monthly_contribution_for_target(100000.0, 90000.0, 10.0, 0.07) == 0.0);
    REQUIRE_THAT(monthly_contribution_for_target(12000.0, 0.0, 1.0, 0.0),
                 WithinAbs(1000.0, 1e-9));
}

// ============================================================================
// Funding requirements
// ============================================================================

TEST_CASE("Funding requirements with inflation", "[funding_calculator]") {
    FundingRequirements req = compute_funding_requirements(100000.0, 20000.0, 10.0, 0.07, 0.03);

    REQUIRE_THAT(req.inflation_adjusted_target, WithinRel(134391.6379344122, 1e-9));
    REQUIRE_THAT(req.future_value_current, WithinRel(39343.0271457913, 1e-9));
    REQUIRE_THAT(req.remaining_need, WithinRel(95048.6107886209, 1e-9));
    REQUIRE_THAT(req.required_monthly_savings, WithinRel(549.1447354507, 1e-9));
    REQUIRE_THAT(req.required_annual_savings, WithinRel(6879.3810865856, 1e-9));
    REQUIRE_THAT(req.lump_sum_needed_today,
                 WithinRel(95048.6107886209 / std::pow(1.07, 10.0), 1e-9));
    REQUIRE_THAT(req.real_return, WithinRel(1.07 / 1.03 - 1.0, 1e-12));

    // Contributions discounted at the same rate recover the lump sum
    REQUIRE_THAT(req.present_value_future_contributions,
                 WithinRel(95048.6107886209 / std::pow(1.0 + 0.07 / 12.0, 120.0), 1e-9));
    REQUIRE_THAT(req.total_funding_required,
                 WithinRel(20000.0 + req.present_value_future_contributions, 1e-12));
    REQUIRE(req.funding_percentage > 0.0);
    REQUIRE(req.funding_percentage < 100.0);
}

TEST_CASE("Over-funded goal needs no savings", "[funding_calculator][boundary]") {
    FundingRequirements req = compute_funding_requirements(100000.0, 500000.0, 10.0);

    REQUIRE(req.remaining_need == 0.0);
    REQUIRE(req.required_monthly_savings <= 0.0);
    REQUIRE(req.required_annual_savings <= 0.0);
    REQUIRE(req.lump_sum_needed_today == 0.0);
    REQUIRE(req.funding_percentage == 100.0);
}

TEST_CASE("Goal due now needs the shortfall immediately", "[funding_calculator][boundary]") {
    FundingRequirements req = compute_funding_requirements(100000.0, 30000.0, 0.0);

    REQUIRE(req.inflation_adjusted_target == 100000.0);
    REQUIRE(req.remaining_need == 70000.0);
    REQUIRE(req.required_monthly_savings == 70000.0);
    REQUIRE(req.lump_sum_needed_today == 70000.0);
    REQUIRE(req.present_value_future_contributions == 0.0);
}

TEST_CASE("Zero return divides the need evenly", "[funding_calculator][boundary]") {
    FundingRequirements req = compute_funding_requirements(24000.0, 0.0, 2.0, 0.0, 0.0);
    REQUIRE_THAT(req.required_monthly_savings, WithinAbs(1000.0, 1e-9));
    REQUIRE_THAT(req.required_annual_savings, WithinAbs(12000.0, 1e-9));
}

TEST_CASE("More savings never raise the requirement", "[funding_calculator][monotonic]") {
    double previous = compute_funding_requirements(250000.0, 0.0, 15.0).required_monthly_savings;
    for (double current = 10000.0; current <= 200000.0; current += 10000.0) {
        double monthly = compute_funding_requirements(250000.0, current, 15.0).required_monthly_savings;
        REQUIRE(monthly <= previous);
        previous = monthly;
    }
}

// ============================================================================
// Catch-up strategy
// ============================================================================

TEST_CASE("Catch-up for a saver somewhat behind", "[funding_calculator][catch_up]") {
    CatchUpStrategy s = compute_catch_up_strategy(100000.0, 10000.0, 10.0, 5.0);

    REQUIRE_THAT(s.expected_current_amount, WithinRel(100000.0 / 3.0, 1e-12));
    REQUIRE_THAT(s.shortfall, WithinRel(100000.0 / 3.0 - 10000.0, 1e-12));
    REQUIRE_THAT(s.original_required_monthly, WithinRel(491.5308327572, 1e-9));
    REQUIRE_THAT(s.catchup_required_monthly, WithinRel(662.7971920965, 1e-9));
    REQUIRE_THAT(s.additional_monthly_needed,
                 WithinRel(s.catchup_required_monthly - s.original_required_monthly, 1e-12));
    REQUIRE_THAT(s.catch_up_percentage, WithinRel(34.84346208, 1e-6));
    REQUIRE(s.feasibility == CatchUpFeasibility::High);
    REQUIRE(s.recommendation == CatchUpRecommendation::Feasible);
}

TEST_CASE("Catch-up for a saver far behind", "[funding_calculator][catch_up]") {
    CatchUpStrategy s = compute_catch_up_strategy(100000.0, 0.0, 5.0, 15.0);

    REQUIRE(s.feasibility == CatchUpFeasibility::Challenging);
    REQUIRE(s.recommendation == CatchUpRecommendation::MajorRevisionNeeded);
    REQUIRE(to_string(s.recommendation) == "major_revision_needed");
    REQUIRE_FALSE(recommendation_text(s.recommendation).empty());
}

TEST_CASE("Saver ahead of schedule", "[funding_calculator][catch_up]") {
    CatchUpStrategy s = compute_catch_up_strategy(100000.0, 30000.0, 10.0, 2.0);

    REQUIRE(s.shortfall < 0.0);
    REQUIRE(s.additional_monthly_needed < 0.0);
    REQUIRE(s.feasibility == CatchUpFeasibility::High);
    REQUIRE(s.recommendation == CatchUpRecommendation::VeryFeasible);
}

TEST_CASE("Catch-up with no timeline at all", "[funding_calculator][catch_up][boundary]") {
    CatchUpStrategy s = compute_catch_up_strategy(50000.0, 20000.0, 0.0, 0.0);
    REQUIRE(s.expected_current_amount == 50000.0);
    REQUIRE(s.catchup_required_monthly == 30000.0);
}

// ============================================================================
// Contribution timeline
// ============================================================================

TEST_CASE("Timeline achievable within the cap", "[funding_calculator][timeline]") {
    ContributionTimeline t = optimize_contribution_timeline(100000.0, 0.0, 10.0, 1000.0);

    REQUIRE(t.status == TimelineStatus::Achievable);
    REQUIRE(t.reachable);
    REQUIRE_THAT(t.optimal_monthly_contribution, WithinRel(577.7514588529, 1e-9));
    REQUIRE_THAT(t.projected_value, WithinRel(173084.8074335371, 1e-9));
    REQUIRE_THAT(t.surplus, WithinRel(73084.8074335371, 1e-9));
    REQUIRE(t.required_years == 10.0);
    REQUIRE(t.additional_years == 0.0);
    REQUIRE(to_string(t.status) == "achievable");
}

TEST_CASE("Timeline needs extension under a tight cap", "[funding_calculator][timeline]") {
    ContributionTimeline t = optimize_contribution_timeline(100000.0, 0.0, 10.0, 300.0);

    REQUIRE(t.status == TimelineStatus::ExtensionNeeded);
    REQUIRE(t.reachable);
    REQUIRE(t.optimal_monthly_contribution == 300.0);
    REQUIRE_THAT(t.shortfall, WithinRel(100000.0 - 51925.4422300611, 1e-9));
    REQUIRE(t.required_years > 10.0);
    REQUIRE_THAT(t.additional_years, WithinAbs(t.required_years - 10.0, 1e-12));

    // 300/month compounds to 100k somewhere between 15 and 17 years
    REQUIRE(t.required_years > 15.0);
    REQUIRE(t.required_years < 17.0);
    REQUIRE(to_string(t.status) == "timeline_extension_needed");
}

TEST_CASE("Timeline with no contributions relies on growth", "[funding_calculator][timeline]") {
    ContributionTimeline t = optimize_contribution_timeline(100000.0, 50000.0, 5.0, 0.0);

    REQUIRE(t.status == TimelineStatus::ExtensionNeeded);
    REQUIRE_THAT(t.required_years, WithinRel(10.2447683511, 1e-9));
    REQUIRE_THAT(t.additional_years, WithinRel(5.2447683511, 1e-9));
}

TEST_CASE("Timeline with nothing to grow is unreachable", "[funding_calculator][timeline][boundary]") {
    ContributionTimeline t = optimize_contribution_timeline(100000.0, 0.0, 5.0, 0.0);

    REQUIRE(t.status == TimelineStatus::ExtensionNeeded);
    REQUIRE_FALSE(t.reachable);
    REQUIRE(std::isinf(t.required_years));
    REQUIRE(std::isinf(t.additional_years));
}
