#include <catch2/catch.hpp>
#include <sstream>
#include "goal.hpp"

using namespace goalcalc;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Enum helpers
// ============================================================================

TEST_CASE("Priority rank orders essential first", "[goal]") {
    REQUIRE(priority_rank(Priority::Essential) == 1);
    REQUIRE(priority_rank(Priority::Important) == 2);
    REQUIRE(priority_rank(Priority::Aspirational) == 3);
}

TEST_CASE("Priority parses several spellings", "[goal]") {
    REQUIRE(priority_from_string("essential") == Priority::Essential);
    REQUIRE(priority_from_string("Essential") == Priority::Essential);
    REQUIRE(priority_from_string("ESSENTIAL") == Priority::Essential);
    REQUIRE(priority_from_string("1") == Priority::Essential);
    REQUIRE(priority_from_string("important") == Priority::Important);
    REQUIRE(priority_from_string("3") == Priority::Aspirational);
    REQUIRE(to_string(Priority::Aspirational) == "aspirational");
}

TEST_CASE("Unknown priority throws", "[goal][error]") {
    REQUIRE_THROWS_AS(priority_from_string("nice-to-have"), std::invalid_argument);
    REQUIRE_THROWS_AS(priority_from_string(""), std::invalid_argument);
}

TEST_CASE("Account type parses several spellings", "[goal]") {
    REQUIRE(account_type_from_string("taxable") == AccountType::Taxable);
    REQUIRE(account_type_from_string("tax_deferred") == AccountType::TaxDeferred);
    REQUIRE(account_type_from_string("Tax-Deferred") == AccountType::TaxDeferred);
    REQUIRE(account_type_from_string("TaxDeferred") == AccountType::TaxDeferred);
    REQUIRE(account_type_from_string("401k") == AccountType::TaxDeferred);
    REQUIRE(account_type_from_string("tax_exempt") == AccountType::TaxExempt);
    REQUIRE(account_type_from_string("Roth") == AccountType::TaxExempt);
    REQUIRE_THROWS_AS(account_type_from_string("crypto"), std::invalid_argument);
    REQUIRE(to_string(AccountType::TaxDeferred) == "tax_deferred");
}

// ============================================================================
// Goal
// ============================================================================

TEST_CASE("Goal funding need scales by funding percentage", "[goal]") {
    Goal g("college", 200000.0, 50000.0, 10.0, Priority::Important, "2035-09-01");
    REQUIRE_THAT(g.funding_need(), WithinAbs(150000.0, 1e-9));

    g.funding_percentage = 50.0;
    REQUIRE_THAT(g.funding_need(), WithinAbs(75000.0, 1e-9));
}

TEST_CASE("Over-funded goal has zero need", "[goal]") {
    Goal g("car", 30000.0, 45000.0, 2.0, Priority::Aspirational, "2028-01-01");
    REQUIRE(g.funding_need() == 0.0);
}

TEST_CASE("Goal default construction", "[goal]") {
    Goal g;
    REQUIRE(g.target_amount == 0.0);
    REQUIRE(g.funding_percentage == 100.0);
    REQUIRE(g.priority == Priority::Important);
}

// ============================================================================
// GoalSet / AccountSet
// ============================================================================

TEST_CASE("GoalSet basic operations", "[goal]") {
    GoalSet set;
    REQUIRE(set.empty());

    set.add(Goal("a", 100.0, 0.0, 1.0, Priority::Essential, "2026-01-01"));
    set.add(Goal("b", 200.0, 0.0, 2.0, Priority::Important, "2027-01-01"));

    REQUIRE(set.size() == 2);
    REQUIRE(set.get(1).id == "b");
    REQUIRE(set.find("a").target_amount == 100.0);
    REQUIRE_THROWS_AS(set.get(2), std::out_of_range);
    REQUIRE_THROWS_AS(set.find("missing"), std::out_of_range);
}

TEST_CASE("GoalSet load from CSV", "[goal][csv]") {
    std::istringstream csv(
        "id,name,target_amount,current_amount,years_to_goal,priority,funding_percentage,target_date\n"
        "retire,Retirement,1000000,200000,25,essential,100,2050-01-01\n"
        "\n"
        "# comment lines are skipped\n"
        "trip,World trip,20000,5000,3,Aspirational,50,2029-06-01\n"
        "short,row,1\n");

    GoalSet set = GoalSet::load_from_csv(csv);

    REQUIRE(set.size() == 2);
    const Goal& retire = set.get(0);
    REQUIRE(retire.id == "retire");
    REQUIRE(retire.name == "Retirement");
    REQUIRE(retire.target_amount == 1000000.0);
    REQUIRE(retire.current_amount == 200000.0);
    REQUIRE(retire.years_to_goal == 25.0);
    REQUIRE(retire.priority == Priority::Essential);
    REQUIRE(retire.target_date == "2050-01-01");

    const Goal& trip = set.get(1);
    REQUIRE(trip.priority == Priority::Aspirational);
    REQUIRE(trip.funding_percentage == 50.0);
}

TEST_CASE("GoalSet CSV without optional columns uses defaults", "[goal][csv]") {
    std::istringstream csv(
        "id,name,target_amount,current_amount,years_to_goal,priority\n"
        "g1,Goal,5000,0,1,important\n");

    GoalSet set = GoalSet::load_from_csv(csv);
    REQUIRE(set.size() == 1);
    REQUIRE(set.get(0).funding_percentage == 100.0);
    REQUIRE(set.get(0).target_date.empty());
}

TEST_CASE("GoalSet CSV rejects bad numbers with line number", "[goal][csv][error]") {
    std::istringstream csv(
        "id,name,target_amount,current_amount,years_to_goal,priority\n"
        "g1,Goal,lots,0,1,important\n");

    try {
        GoalSet::load_from_csv(csv);
        FAIL("Expected runtime_error");
    } catch (const std::runtime_error& e) {
        std::string message = e.what();
        REQUIRE(message.find("target_amount") != std::string::npos);
        REQUIRE(message.find("line 2") != std::string::npos);
    }
}

TEST_CASE("GoalSet CSV rejects unknown priority", "[goal][csv][error]") {
    std::istringstream csv(
        "id,name,target_amount,current_amount,years_to_goal,priority\n"
        "g1,Goal,5000,0,1,someday\n");
    REQUIRE_THROWS_AS(GoalSet::load_from_csv(csv), std::invalid_argument);
}

TEST_CASE("Empty goals CSV returns empty GoalSet", "[goal][csv]") {
    std::istringstream csv("");
    REQUIRE(GoalSet::load_from_csv(csv).empty());
}

TEST_CASE("GoalSet load from missing file throws", "[goal][csv][error]") {
    REQUIRE_THROWS_AS(GoalSet::load_from_csv("/nonexistent/goals.csv"), std::runtime_error);
}

TEST_CASE("AccountSet load from CSV", "[goal][csv]") {
    std::istringstream csv(
        "id,name,type,balance\r\n"
        "k,401(k),tax_deferred,100000\r\n"
        "r,Roth IRA,roth,25000.50\r\n"
        "b,Brokerage,taxable,40000\r\n");

    AccountSet set = AccountSet::load_from_csv(csv);

    REQUIRE(set.size() == 3);
    REQUIRE(set.get(0).type == AccountType::TaxDeferred);
    REQUIRE(set.get(1).type == AccountType::TaxExempt);
    REQUIRE(set.get(1).name == "Roth IRA");
    REQUIRE(set.get(2).type == AccountType::Taxable);
    REQUIRE_THAT(set.total_balance(), WithinAbs(165000.50, 1e-9));
}
