#include <catch2/catch.hpp>
#include <cmath>
#include <limits>
#include "validation.hpp"

using namespace goalcalc;

TEST_CASE("Error names the field", "[validation]") {
    try {
        validate_target_amount(0.0);
        FAIL("Expected InvalidInputError");
    } catch (const InvalidInputError& e) {
        REQUIRE(e.field() == "target_amount");
        REQUIRE(std::string(e.what()) == "target_amount: must be greater than 0");
    }
}

TEST_CASE("Amount and horizon bounds", "[validation]") {
    REQUIRE_NOTHROW(validate_target_amount(0.01));
    REQUIRE_THROWS_AS(validate_target_amount(-5.0), InvalidInputError);
    REQUIRE_THROWS_AS(validate_target_amount(std::numeric_limits<double>::quiet_NaN()),
                      InvalidInputError);

    REQUIRE_NOTHROW(validate_current_amount(0.0));
    REQUIRE_THROWS_AS(validate_current_amount(-0.01), InvalidInputError);

    REQUIRE_NOTHROW(validate_years_to_goal(0.0));
    REQUIRE_THROWS_AS(validate_years_to_goal(-1.0), InvalidInputError);
    REQUIRE_THROWS_AS(validate_years_to_goal(std::numeric_limits<double>::infinity()),
                      InvalidInputError);
}

TEST_CASE("Rate bounds", "[validation]") {
    REQUIRE_NOTHROW(validate_expected_return(0.0));
    REQUIRE_NOTHROW(validate_expected_return(0.20));
    REQUIRE_THROWS_AS(validate_expected_return(0.21), InvalidInputError);
    REQUIRE_THROWS_AS(validate_expected_return(-0.01), InvalidInputError);

    REQUIRE_NOTHROW(validate_volatility(0.0));
    REQUIRE_THROWS_AS(validate_volatility(1.0), InvalidInputError);

    REQUIRE_NOTHROW(validate_target_probability(0.5));
    REQUIRE_NOTHROW(validate_target_probability(0.99));
    REQUIRE_THROWS_AS(validate_target_probability(0.49), InvalidInputError);
    REQUIRE_THROWS_AS(validate_target_probability(1.0), InvalidInputError);
}

TEST_CASE("Iteration bounds", "[validation]") {
    REQUIRE_NOTHROW(validate_iterations(1000));
    REQUIRE_NOTHROW(validate_iterations(10000));
    REQUIRE_THROWS_AS(validate_iterations(999), InvalidInputError);
    REQUIRE_THROWS_AS(validate_iterations(10001), InvalidInputError);
}

TEST_CASE("Simulation inputs checked together", "[validation]") {
    REQUIRE_NOTHROW(validate_simulation_inputs(500000.0, 50000.0, 1500.0, 20.0, 0.07, 0.15, 5000));

    try {
        validate_simulation_inputs(500000.0, 50000.0, -1.0, 20.0, 0.07, 0.15, 5000);
        FAIL("Expected InvalidInputError");
    } catch (const InvalidInputError& e) {
        REQUIRE(e.field() == "monthly_contribution");
    }

    REQUIRE_THROWS_AS(validate_simulation_inputs(500000.0, 50000.0, 0.0, 20.0, 0.07, 0.15, 50),
                      InvalidInputError);
}

TEST_CASE("Goal validation", "[validation]") {
    Goal ok("g", 1000.0, 0.0, 3.0, Priority::Important, "2029-01-01");
    REQUIRE_NOTHROW(validate_goal(ok));

    Goal no_id = ok;
    no_id.id = "";
    REQUIRE_THROWS_AS(validate_goal(no_id), InvalidInputError);

    Goal bad_target = ok;
    bad_target.target_amount = 0.0;
    try {
        validate_goal(bad_target);
        FAIL("Expected InvalidInputError");
    } catch (const InvalidInputError& e) {
        REQUIRE(e.field() == "goal 'g'");
        REQUIRE(std::string(e.what()).find("target_amount") != std::string::npos);
    }

    Goal bad_pct = ok;
    bad_pct.funding_percentage = 120.0;
    REQUIRE_THROWS_AS(validate_goal(bad_pct), InvalidInputError);
}

TEST_CASE("Collections reject duplicate ids", "[validation]") {
    std::vector<Goal> goals = {
        Goal("dup", 1000.0, 0.0, 1.0, Priority::Essential, "2026-01-01"),
        Goal("dup", 2000.0, 0.0, 1.0, Priority::Essential, "2026-01-01"),
    };
    REQUIRE_THROWS_AS(validate_goals(goals), InvalidInputError);

    std::vector<Account> accounts = {
        Account("a", AccountType::Taxable, 10.0),
        Account("a", AccountType::TaxExempt, 10.0),
    };
    REQUIRE_THROWS_AS(validate_accounts(accounts), InvalidInputError);

    REQUIRE_THROWS_AS(validate_account(Account("neg", AccountType::Taxable, -1.0)),
                      InvalidInputError);
    REQUIRE_NOTHROW(validate_accounts({}));
}

TEST_CASE("InvalidInputError is an invalid_argument", "[validation]") {
    REQUIRE_THROWS_AS(validate_iterations(1), std::invalid_argument);
}
