#ifndef GOALCALC_GOAL_HPP
#define GOALCALC_GOAL_HPP

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace goalcalc {

enum class Priority : uint8_t {
    Essential = 0,
    Important = 1,
    Aspirational = 2
};

enum class AccountType : uint8_t {
    Taxable = 0,
    TaxDeferred = 1,
    TaxExempt = 2
};

// Rank used for shortfall prioritization: Essential(1) < Important(2) < Aspirational(3)
int priority_rank(Priority priority);

// Accepts "Essential", "essential", "ESSENTIAL" or the numeric rank "1"
Priority priority_from_string(const std::string& value);
std::string to_string(Priority priority);

// Accepts "taxable", "tax_deferred", "TaxDeferred", "tax-exempt", "roth", ...
AccountType account_type_from_string(const std::string& value);
std::string to_string(AccountType type);

struct Goal {
    std::string id;
    std::string name;
    double target_amount;       // Money, > 0
    double current_amount;      // Money, >= 0
    double years_to_goal;       // >= 0
    Priority priority;
    double funding_percentage;  // 0-100, share of computed need this goal draws
    std::string target_date;    // ISO-8601 (YYYY-MM-DD), orders lexicographically

    Goal();
    Goal(std::string goal_id, double target, double current, double years,
         Priority prio, std::string date, double funding_pct = 100.0);

    // max(0, target - current) scaled by funding_percentage
    double funding_need() const;

    bool operator==(const Goal& other) const;
};

struct Account {
    std::string id;
    std::string name;
    AccountType type;
    double balance;             // Money, >= 0

    Account();
    Account(std::string account_id, AccountType account_type, double account_balance);

    bool operator==(const Account& other) const;
};

class GoalSet {
public:
    void add(const Goal& goal);
    void add(Goal&& goal);

    const Goal& get(size_t index) const;
    const Goal& find(const std::string& goal_id) const;
    size_t size() const;
    bool empty() const;

    const std::vector<Goal>& goals() const { return goals_; }
    std::vector<Goal>& goals() { return goals_; }

    void reserve(size_t count);
    void clear();

    // Columns: id,name,target_amount,current_amount,years_to_goal,priority,
    //          funding_percentage,target_date
    static GoalSet load_from_csv(const std::string& filepath);
    static GoalSet load_from_csv(std::istream& is);

private:
    std::vector<Goal> goals_;
};

class AccountSet {
public:
    void add(const Account& account);
    void add(Account&& account);

    const Account& get(size_t index) const;
    size_t size() const;
    bool empty() const;

    const std::vector<Account>& accounts() const { return accounts_; }

    double total_balance() const;

    // Columns: id,name,type,balance
    static AccountSet load_from_csv(const std::string& filepath);
    static AccountSet load_from_csv(std::istream& is);

private:
    std::vector<Account> accounts_;
};

} // namespace goalcalc

#endif // GOALCALC_GOAL_HPP
