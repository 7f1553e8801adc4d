#include <catch2/catch.hpp>
#include "glide_path.hpp"

using namespace goalcalc;
using Catch::Matchers::WithinAbs;

namespace {

double weight_sum(const std::map<AssetClass, double>& weights) {
    double sum = 0.0;
    for (const auto& [asset, w] : weights) {
        sum += w;
    }
    return sum;
}

double equity_weight(const std::map<AssetClass, double>& weights) {
    return weights.at(AssetClass::DomesticEquity) +
           weights.at(AssetClass::InternationalEquity) +
           weights.at(AssetClass::EmergingMarkets);
}

} // anonymous namespace

// ============================================================================
// Risk tolerance
// ============================================================================

TEST_CASE("Risk tolerance steps with horizon", "[glide_path]") {
    REQUIRE_THAT(derive_risk_tolerance(35.0, Priority::Important), WithinAbs(0.9, 1e-12));
    REQUIRE_THAT(derive_risk_tolerance(30.0, Priority::Important), WithinAbs(0.9, 1e-12));
    REQUIRE_THAT(derive_risk_tolerance(29.9, Priority::Important), WithinAbs(0.8, 1e-12));
    REQUIRE_THAT(derive_risk_tolerance(15.0, Priority::Important), WithinAbs(0.7, 1e-12));
    REQUIRE_THAT(derive_risk_tolerance(10.0, Priority::Important), WithinAbs(0.6, 1e-12));
    REQUIRE_THAT(derive_risk_tolerance(5.0, Priority::Important), WithinAbs(0.4, 1e-12));
    REQUIRE_THAT(derive_risk_tolerance(3.0, Priority::Important), WithinAbs(0.3, 1e-12));
    REQUIRE_THAT(derive_risk_tolerance(2.9, Priority::Important), WithinAbs(0.2, 1e-12));
    REQUIRE_THAT(derive_risk_tolerance(0.0, Priority::Important), WithinAbs(0.2, 1e-12));
}

TEST_CASE("Priority shifts risk tolerance", "[glide_path]") {
    REQUIRE_THAT(derive_risk_tolerance(20.0, Priority::Essential), WithinAbs(0.7, 1e-12));
    REQUIRE_THAT(derive_risk_tolerance(20.0, Priority::Aspirational), WithinAbs(0.9, 1e-12));
    // Clamped to [0, 1]
    REQUIRE_THAT(derive_risk_tolerance(40.0, Priority::Aspirational), WithinAbs(1.0, 1e-12));

    GlidePathSettings settings;
    settings.essential_delta = -0.5;
    REQUIRE_THAT(derive_risk_tolerance(1.0, Priority::Essential, settings), WithinAbs(0.0, 1e-12));
}

// ============================================================================
// Equity share and weights
// ============================================================================

TEST_CASE("Equity share scales the horizon base", "[glide_path]") {
    // base 0.5, scaled by 0.7 + 0.6 * 0.7
    REQUIRE_THAT(equity_share(25.0, 0.7), WithinAbs(0.56, 1e-12));
    // Long horizons hit the floor before scaling
    REQUIRE_THAT(equity_share(60.0, 0.9), WithinAbs(0.124, 1e-12));
    // Short horizons hit the ceiling after scaling
    REQUIRE_THAT(equity_share(0.0, 1.0), WithinAbs(0.9, 1e-12));
}

TEST_CASE("Weights split equity and fixed income", "[glide_path]") {
    auto weights = glide_path_weights(0.5);

    REQUIRE_THAT(weights.at(AssetClass::DomesticEquity), WithinAbs(0.30, 1e-12));
    REQUIRE_THAT(weights.at(AssetClass::InternationalEquity), WithinAbs(0.15, 1e-12));
    REQUIRE_THAT(weights.at(AssetClass::EmergingMarkets), WithinAbs(0.05, 1e-12));
    REQUIRE_THAT(weights.at(AssetClass::Bonds), WithinAbs(0.35, 1e-12));
    REQUIRE_THAT(weights.at(AssetClass::Tips), WithinAbs(0.10, 1e-12));
    REQUIRE_THAT(weights.at(AssetClass::Cash), WithinAbs(0.05, 1e-12));
}

TEST_CASE("Weights sum to one for every horizon and priority", "[glide_path][property]") {
    const Priority priorities[] = {Priority::Essential, Priority::Important, Priority::Aspirational};
    GlidePathSettings settings;

    for (Priority priority : priorities) {
        for (double years = 0.0; years <= 60.0; years += 0.5) {
            double tolerance = derive_risk_tolerance(years, priority);
            double equity = equity_share(years, tolerance);
            auto weights = glide_path_weights(equity);

            REQUIRE(weights.size() == NUM_ASSET_CLASSES);
            REQUIRE_THAT(weight_sum(weights), WithinAbs(1.0, 1e-9));
            REQUIRE(equity >= settings.min_equity - 1e-12);
            REQUIRE(equity <= settings.max_equity + 1e-12);
            for (const auto& [asset, w] : weights) {
                REQUIRE(w >= 0.0);
            }
        }
    }
}

// ============================================================================
// Goal portfolio
// ============================================================================

TEST_CASE("Goal portfolio metrics", "[glide_path]") {
    Goal retirement("retire", 1000000.0, 100000.0, 25.0, Priority::Essential, "2050-01-01");
    AllocationResult r = build_goal_portfolio(retirement, 250000.0,
                                              CapitalMarketAssumptions::defaults());

    REQUIRE(r.goal_id == "retire");
    REQUIRE(r.allocated_amount == 250000.0);
    REQUIRE_THAT(r.risk_tolerance, WithinAbs(0.7, 1e-12));
    REQUIRE_THAT(equity_weight(r.weights), WithinAbs(0.56, 1e-12));
    REQUIRE_THAT(r.expected_return, WithinAbs(0.07032, 1e-9));
    REQUIRE_THAT(r.expected_risk, WithinAbs(0.13372, 1e-9));
    REQUIRE_THAT(r.sharpe_ratio, WithinAbs((0.07032 - 0.04) / 0.13372, 1e-9));
    REQUIRE(r.weight(AssetClass::Cash) > 0.0);
}

TEST_CASE("Portfolio metrics handle zero risk", "[glide_path][boundary]") {
    std::map<AssetClass, double> empty;
    double ret = 1.0, risk = 1.0, sharpe = 1.0;
    compute_portfolio_metrics(empty, CapitalMarketAssumptions::defaults(), 0.04, ret, risk, sharpe);
    REQUIRE(ret == 0.0);
    REQUIRE(risk == 0.0);
    REQUIRE(sharpe == 0.0);
}

TEST_CASE("Portfolio metrics follow the CMA table", "[glide_path]") {
    CapitalMarketAssumptions cma = CapitalMarketAssumptions::defaults();
    cma.set(AssetClass::DomesticEquity, AssetClassAssumption(0.12, 0.18, 0.85));

    Goal goal("g", 100000.0, 0.0, 10.0, Priority::Important, "2036-01-01");
    AllocationResult base = build_goal_portfolio(goal, 1000.0, CapitalMarketAssumptions::defaults());
    AllocationResult bumped = build_goal_portfolio(goal, 1000.0, cma);

    REQUIRE(bumped.expected_return > base.expected_return);
    REQUIRE(bumped.expected_risk == base.expected_risk);
}

// ============================================================================
// Settings validation
// ============================================================================

TEST_CASE("Glide path settings validation", "[glide_path][error]") {
    GlidePathSettings settings;
    REQUIRE_NOTHROW(settings.validate());

    GlidePathSettings bad_equity = settings;
    bad_equity.domestic_equity_share = 0.7;
    REQUIRE_THROWS_AS(bad_equity.validate(), std::invalid_argument);

    GlidePathSettings bad_fixed = settings;
    bad_fixed.cash_share = 0.2;
    REQUIRE_THROWS_AS(bad_fixed.validate(), std::invalid_argument);

    GlidePathSettings bad_bounds = settings;
    bad_bounds.min_equity = 0.95;
    REQUIRE_THROWS_AS(bad_bounds.validate(), std::invalid_argument);

    GlidePathSettings bad_horizon = settings;
    bad_horizon.horizon_years = 0.0;
    REQUIRE_THROWS_AS(bad_horizon.validate(), std::invalid_argument);
}
