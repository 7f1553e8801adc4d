#ifndef GOALCALC_VALIDATION_HPP
#define GOALCALC_VALIDATION_HPP

#include "goal.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace goalcalc {

// Raised at the input boundary; the message names the failing field
class InvalidInputError : public std::invalid_argument {
public:
    InvalidInputError(const std::string& field, const std::string& message)
        : std::invalid_argument(field + ": " + message), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

constexpr double MIN_EXPECTED_RETURN = 0.0;
constexpr double MAX_EXPECTED_RETURN = 0.20;
constexpr double MIN_TARGET_PROBABILITY = 0.5;
constexpr double MAX_TARGET_PROBABILITY = 0.99;

void validate_target_amount(double target_amount);
void validate_current_amount(double current_amount);
void validate_years_to_goal(double years_to_goal);
void validate_expected_return(double expected_return);
void validate_volatility(double return_volatility);
void validate_iterations(size_t iterations);
void validate_target_probability(double target_probability);

// Everything compute_success_probability accepts
void validate_simulation_inputs(double target_amount, double current_amount,
                                double monthly_contribution, double years_to_goal,
                                double expected_return, double return_volatility,
                                size_t iterations);

void validate_goal(const Goal& goal);
void validate_account(const Account& account);

// Every goal, plus unique ids
void validate_goals(const std::vector<Goal>& goals);
void validate_accounts(const std::vector<Account>& accounts);

} // namespace goalcalc

#endif // GOALCALC_VALIDATION_HPP
