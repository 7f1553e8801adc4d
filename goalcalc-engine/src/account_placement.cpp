#include "account_placement.hpp"
#include "logger.hpp"
#include <algorithm>
#include <numeric>
#include <set>
#include <stdexcept>

namespace goalcalc {

namespace {

// Residuals below a cent are rounding noise
constexpr double RESIDUAL_TOLERANCE = 0.01;

constexpr double TAX_EXEMPT_LOCATION_SCORE = 0.9;

} // anonymous namespace

// ============================================================================
// Result types
// ============================================================================

AccountAllocation::AccountAllocation() : type(AccountType::Taxable), balance(0.0) {}

AccountAllocation::AccountAllocation(std::string id, AccountType account_type,
                                     double account_balance)
    : account_id(std::move(id)), type(account_type), balance(account_balance) {}

double AccountAllocation::total() const {
    double sum = 0.0;
    for (const auto& [asset, amount] : holdings) {
        sum += amount;
    }
    return sum;
}

PlacementResult::PlacementResult() : total_unplaced(0.0) {}

PlacementState::PlacementState() = default;

PlacementState::PlacementState(AssetAmounts pool) : remaining(std::move(pool)) {}

TaxMetrics::TaxMetrics() : estimated_tax_drag(0.0), location_efficiency(0.0) {}

// ============================================================================
// Ordering
// ============================================================================

int tax_inefficiency_rank(AssetClass asset) {
    switch (asset) {
        case AssetClass::Bonds: return 5;
        case AssetClass::Tips: return 4;
        case AssetClass::InternationalEquity: return 3;
        case AssetClass::EmergingMarkets: return 3;
        case AssetClass::DomesticEquity: return 2;
        case AssetClass::Cash: return 1;
    }
    throw std::invalid_argument("Unknown asset class");
}

std::vector<AssetClass> placement_order(AccountType type) {
    const auto& all = all_asset_classes();
    switch (type) {
        case AccountType::TaxDeferred: {
            std::vector<AssetClass> order(all.begin(), all.end());
            std::stable_sort(order.begin(), order.end(), [](AssetClass a, AssetClass b) {
                return tax_inefficiency_rank(a) > tax_inefficiency_rank(b);
            });
            return order;
        }
        case AccountType::TaxExempt:
            return {AssetClass::EmergingMarkets, AssetClass::InternationalEquity,
                    AssetClass::DomesticEquity};
        case AccountType::Taxable:
            return std::vector<AssetClass>(all.begin(), all.end());
    }
    throw std::invalid_argument("Unknown account type");
}

// ============================================================================
// Placement
// ============================================================================

AssetAmounts aggregate_target_amounts(const std::vector<AllocationResult>& portfolios) {
    AssetAmounts totals;
    for (const auto& portfolio : portfolios) {
        for (const auto& [asset, w] : portfolio.weights) {
            totals[asset] += portfolio.allocated_amount * w;
        }
    }
    return totals;
}

PlacementState place_into_account(const PlacementState& state, const Account& account,
                                  const std::vector<AssetClass>& order) {
    PlacementState next = state;
    AccountAllocation allocation(account.id, account.type, account.balance);
    double available = account.balance;

    for (AssetClass asset : order) {
        if (available <= 0.0) {
            break;
        }
        auto it = next.remaining.find(asset);
        if (it == next.remaining.end() || it->second <= 0.0) {
            continue;
        }
        double amount = std::min(it->second, available);
        allocation.holdings[asset] += amount;
        it->second -= amount;
        available -= amount;
    }

    next.allocations[account.id] = std::move(allocation);
    return next;
}

PlacementResult place_assets_in_accounts(const AssetAmounts& targets,
                                         const std::vector<Account>& accounts) {
    if (accounts.empty()) {
        throw std::invalid_argument("Account placement requires at least one account");
    }
    std::set<std::string> seen;
    for (const auto& account : accounts) {
        if (!seen.insert(account.id).second) {
            throw std::invalid_argument("Duplicate account id: " + account.id);
        }
    }

    PlacementState state(targets);
    for (AccountType pass : {AccountType::TaxDeferred, AccountType::TaxExempt,
                             AccountType::Taxable}) {
        const std::vector<AssetClass> order = placement_order(pass);
        for (const auto& account : accounts) {
            if (account.type == pass) {
                state = place_into_account(state, account, order);
            }
        }
    }

    PlacementResult result;
    result.allocations = std::move(state.allocations);

    std::map<std::string, double> residual_by_code;
    for (const auto& [asset, amount] : state.remaining) {
        if (amount > RESIDUAL_TOLERANCE) {
            result.unplaced[asset] = amount;
            result.total_unplaced += amount;
            residual_by_code[to_code(asset)] = amount;
        }
    }

    if (result.total_unplaced > 0.0) {
        Logger::get_instance().log_placement_residual(result.total_unplaced, residual_by_code);
    }

    return result;
}

PlacementResult place_assets_in_accounts(const std::vector<AllocationResult>& portfolios,
                                         const std::vector<Account>& accounts) {
    return place_assets_in_accounts(aggregate_target_amounts(portfolios), accounts);
}

// ============================================================================
// Tax metrics
// ============================================================================

TaxMetrics compute_tax_metrics(const PlacementResult& placement,
                               const CapitalMarketAssumptions& cma) {
    TaxMetrics metrics;
    double total_placed = 0.0;
    double total_drag = 0.0;
    double weighted_score = 0.0;

    for (const auto& [id, allocation] : placement.allocations) {
        for (const auto& [asset, amount] : allocation.holdings) {
            const double tax_eff = cma.tax_efficiency(asset);
            double score = 0.0;
            switch (allocation.type) {
                case AccountType::Taxable:
                    total_drag += (1.0 - tax_eff) * cma.expected_return(asset) * amount;
                    score = tax_eff;
                    break;
                case AccountType::TaxDeferred:
                    score = 1.0 - tax_eff;
                    break;
                case AccountType::TaxExempt:
                    score = TAX_EXEMPT_LOCATION_SCORE;
                    break;
            }
            weighted_score += score * amount;
            total_placed += amount;
        }
    }

    if (total_placed > 0.0) {
        metrics.estimated_tax_drag = total_drag / total_placed;
        metrics.location_efficiency = weighted_score / total_placed;
    }
    return metrics;
}

} // namespace goalcalc
