#include "goal.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace goalcalc {

namespace {

// Lower-case and drop separators so "Tax-Deferred", "tax_deferred" and
// "TaxDeferred" all normalize to "taxdeferred"
std::string normalize_label(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (c == '_' || c == '-' || c == ' ') {
            continue;
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

double parse_double(const std::string& cell, const char* column, size_t line) {
    try {
        size_t consumed = 0;
        double value = std::stod(cell, &consumed);
        if (consumed != cell.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid " + std::string(column) + " '" + cell +
                                 "' on line " + std::to_string(line));
    }
}

} // anonymous namespace

// ============================================================================
// Enum helpers
// ============================================================================

int priority_rank(Priority priority) {
    switch (priority) {
        case Priority::Essential: return 1;
        case Priority::Important: return 2;
        case Priority::Aspirational: return 3;
    }
    throw std::invalid_argument("Unknown priority");
}

Priority priority_from_string(const std::string& value) {
    std::string label = normalize_label(value);
    if (label == "essential" || label == "1") {
        return Priority::Essential;
    }
    if (label == "important" || label == "2") {
        return Priority::Important;
    }
    if (label == "aspirational" || label == "3") {
        return Priority::Aspirational;
    }
    throw std::invalid_argument("Unknown goal priority: " + value);
}

std::string to_string(Priority priority) {
    switch (priority) {
        case Priority::Essential: return "essential";
        case Priority::Important: return "important";
        case Priority::Aspirational: return "aspirational";
    }
    throw std::invalid_argument("Unknown priority");
}

AccountType account_type_from_string(const std::string& value) {
    std::string label = normalize_label(value);
    if (label == "taxable" || label == "brokerage") {
        return AccountType::Taxable;
    }
    if (label == "taxdeferred" || label == "traditional" || label == "401k" || label == "ira") {
        return AccountType::TaxDeferred;
    }
    if (label == "taxexempt" || label == "roth") {
        return AccountType::TaxExempt;
    }
    throw std::invalid_argument("Unknown account type: " + value);
}

std::string to_string(AccountType type) {
    switch (type) {
        case AccountType::Taxable: return "taxable";
        case AccountType::TaxDeferred: return "tax_deferred";
        case AccountType::TaxExempt: return "tax_exempt";
    }
    throw std::invalid_argument("Unknown account type");
}

// ============================================================================
// Goal / Account
// ============================================================================

Goal::Goal()
    : target_amount(0.0), current_amount(0.0), years_to_goal(0.0),
      priority(Priority::Important), funding_percentage(100.0) {}

Goal::Goal(std::string goal_id, double target, double current, double years,
           Priority prio, std::string date, double funding_pct)
    : id(std::move(goal_id)), name(), target_amount(target), current_amount(current),
      years_to_goal(years), priority(prio), funding_percentage(funding_pct),
      target_date(std::move(date)) {}

double Goal::funding_need() const {
    return std::max(0.0, target_amount - current_amount) * (funding_percentage / 100.0);
}

bool Goal::operator==(const Goal& other) const {
    return id == other.id &&
           name == other.name &&
           target_amount == other.target_amount &&
           current_amount == other.current_amount &&
           years_to_goal == other.years_to_goal &&
           priority == other.priority &&
           funding_percentage == other.funding_percentage &&
           target_date == other.target_date;
}

Account::Account() : type(AccountType::Taxable), balance(0.0) {}

Account::Account(std::string account_id, AccountType account_type, double account_balance)
    : id(std::move(account_id)), name(), type(account_type), balance(account_balance) {}

bool Account::operator==(const Account& other) const {
    return id == other.id && name == other.name && type == other.type &&
           balance == other.balance;
}

// ============================================================================
// GoalSet
// ============================================================================

void GoalSet::add(const Goal& goal) {
    goals_.push_back(goal);
}

void GoalSet::add(Goal&& goal) {
    goals_.push_back(std::move(goal));
}

const Goal& GoalSet::get(size_t index) const {
    if (index >= goals_.size()) {
        throw std::out_of_range("Goal index out of range");
    }
    return goals_[index];
}

const Goal& GoalSet::find(const std::string& goal_id) const {
    auto it = std::find_if(goals_.begin(), goals_.end(),
                           [&](const Goal& g) { return g.id == goal_id; });
    if (it == goals_.end()) {
        throw std::out_of_range("Goal not found: " + goal_id);
    }
    return *it;
}

size_t GoalSet::size() const {
    return goals_.size();
}

bool GoalSet::empty() const {
    return goals_.empty();
}

void GoalSet::reserve(size_t count) {
    goals_.reserve(count);
}

void GoalSet::clear() {
    goals_.clear();
}

GoalSet GoalSet::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open goals file: " + filepath);
    }
    return load_from_csv(file);
}

GoalSet GoalSet::load_from_csv(std::istream& is) {
    GoalSet set;
    CsvReader reader(is);

    auto header = reader.read_row();
    if (header.empty()) {
        return set;
    }

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.size() < 6) {
            continue;
        }
        size_t line = reader.line_number();

        Goal g;
        g.id = row[0];
        g.name = row[1];
        g.target_amount = parse_double(row[2], "target_amount", line);
        g.current_amount = parse_double(row[3], "current_amount", line);
        g.years_to_goal = parse_double(row[4], "years_to_goal", line);
        g.priority = priority_from_string(row[5]);

        // Optional trailing columns
        if (row.size() > 6 && !row[6].empty()) {
            g.funding_percentage = parse_double(row[6], "funding_percentage", line);
        }
        if (row.size() > 7) {
            g.target_date = row[7];
        }

        set.add(std::move(g));
    }

    return set;
}

// ============================================================================
// AccountSet
// ============================================================================

void AccountSet::add(const Account& account) {
    accounts_.push_back(account);
}

void AccountSet::add(Account&& account) {
    accounts_.push_back(std::move(account));
}

const Account& AccountSet::get(size_t index) const {
    if (index >= accounts_.size()) {
        throw std::out_of_range("Account index out of range");
    }
    return accounts_[index];
}

size_t AccountSet::size() const {
    return accounts_.size();
}

bool AccountSet::empty() const {
    return accounts_.empty();
}

double AccountSet::total_balance() const {
    double total = 0.0;
    for (const auto& a : accounts_) {
        total += a.balance;
    }
    return total;
}

AccountSet AccountSet::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open accounts file: " + filepath);
    }
    return load_from_csv(file);
}

AccountSet AccountSet::load_from_csv(std::istream& is) {
    AccountSet set;
    CsvReader reader(is);

    auto header = reader.read_row();
    if (header.empty()) {
        return set;
    }

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.size() < 4) {
            continue;
        }

        Account a;
        a.id = row[0];
        a.name = row[1];
        a.type = account_type_from_string(row[2]);
        a.balance = parse_double(row[3], "balance", reader.line_number());
        set.add(std::move(a));
    }

    return set;
}

} // namespace goalcalc
