#include "validation.hpp"
#include "monte_carlo.hpp"
#include <cmath>
#include <set>

namespace goalcalc {

namespace {

void require_finite(const std::string& field, double value) {
    if (!std::isfinite(value)) {
        throw InvalidInputError(field, "must be a finite number");
    }
}

} // anonymous namespace

void validate_target_amount(double target_amount) {
    require_finite("target_amount", target_amount);
    if (target_amount <= 0.0) {
        throw InvalidInputError("target_amount", "must be greater than 0");
    }
}

void validate_current_amount(double current_amount) {
    require_finite("current_amount", current_amount);
    if (current_amount < 0.0) {
        throw InvalidInputError("current_amount", "must not be negative");
    }
}

void validate_years_to_goal(double years_to_goal) {
    require_finite("years_to_goal", years_to_goal);
    if (years_to_goal < 0.0) {
        throw InvalidInputError("years_to_goal", "must not be negative");
    }
}

void validate_expected_return(double expected_return) {
    require_finite("expected_return", expected_return);
    if (expected_return < MIN_EXPECTED_RETURN || expected_return > MAX_EXPECTED_RETURN) {
        throw InvalidInputError("expected_return", "must be between 0 and 0.20");
    }
}

void validate_volatility(double return_volatility) {
    require_finite("return_volatility", return_volatility);
    if (return_volatility < 0.0 || return_volatility >= 1.0) {
        throw InvalidInputError("return_volatility", "must be in [0, 1)");
    }
}

void validate_iterations(size_t iterations) {
    if (iterations < MIN_ITERATIONS || iterations > MAX_ITERATIONS) {
        throw InvalidInputError("iterations", "must be between " +
                                std::to_string(MIN_ITERATIONS) + " and " +
                                std::to_string(MAX_ITERATIONS));
    }
}

void validate_target_probability(double target_probability) {
    require_finite("target_probability", target_probability);
    if (target_probability < MIN_TARGET_PROBABILITY ||
        target_probability > MAX_TARGET_PROBABILITY) {
        throw InvalidInputError("target_probability", "must be between 0.5 and 0.99");
    }
}

void validate_simulation_inputs(double target_amount, double current_amount,
                                double monthly_contribution, double years_to_goal,
                                double expected_return, double return_volatility,
                                size_t iterations) {
    validate_target_amount(target_amount);
    validate_current_amount(current_amount);
    require_finite("monthly_contribution", monthly_contribution);
    if (monthly_contribution < 0.0) {
        throw InvalidInputError("monthly_contribution", "must not be negative");
    }
    validate_years_to_goal(years_to_goal);
    validate_expected_return(expected_return);
    validate_volatility(return_volatility);
    validate_iterations(iterations);
}

void validate_goal(const Goal& goal) {
    if (goal.id.empty()) {
        throw InvalidInputError("goal.id", "must not be empty");
    }
    try {
        validate_target_amount(goal.target_amount);
        validate_current_amount(goal.current_amount);
        validate_years_to_goal(goal.years_to_goal);
    } catch (const InvalidInputError& e) {
        throw InvalidInputError("goal '" + goal.id + "'", e.what());
    }
    if (goal.funding_percentage < 0.0 || goal.funding_percentage > 100.0) {
        throw InvalidInputError("goal '" + goal.id + "'",
                                "funding_percentage must be between 0 and 100");
    }
}

void validate_account(const Account& account) {
    if (account.id.empty()) {
        throw InvalidInputError("account.id", "must not be empty");
    }
    if (!std::isfinite(account.balance) || account.balance < 0.0) {
        throw InvalidInputError("account '" + account.id + "'",
                                "balance must be a non-negative number");
    }
}

void validate_goals(const std::vector<Goal>& goals) {
    std::set<std::string> seen;
    for (const auto& goal : goals) {
        validate_goal(goal);
        if (!seen.insert(goal.id).second) {
            throw InvalidInputError("goal.id", "duplicate id '" + goal.id + "'");
        }
    }
}

void validate_accounts(const std::vector<Account>& accounts) {
    std::set<std::string> seen;
    for (const auto& account : accounts) {
        validate_account(account);
        if (!seen.insert(account.id).second) {
            throw InvalidInputError("account.id", "duplicate id '" + account.id + "'");
        }
    }
}

} // namespace goalcalc
