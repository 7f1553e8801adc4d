#ifndef GOALCALC_ACCOUNT_PLACEMENT_HPP
#define GOALCALC_ACCOUNT_PLACEMENT_HPP

#include "glide_path.hpp"
#include "goal.hpp"
#include "market_assumptions.hpp"
#include <map>
#include <string>
#include <vector>

namespace goalcalc {

// Amount per asset class
using AssetAmounts = std::map<AssetClass, double>;

// Proposed holdings for one account. Sum of holdings never exceeds balance.
struct AccountAllocation {
    std::string account_id;
    AccountType type;
    double balance;
    AssetAmounts holdings;

    AccountAllocation();
    AccountAllocation(std::string id, AccountType account_type, double account_balance);

    double total() const;
};

struct PlacementResult {
    std::map<std::string, AccountAllocation> allocations;   // One per input account
    AssetAmounts unplaced;                                  // Requested but not placed
    double total_unplaced;

    PlacementResult();
};

// Running state threaded through the three placement passes
struct PlacementState {
    AssetAmounts remaining;                                 // Pool still to place
    std::map<std::string, AccountAllocation> allocations;

    PlacementState();
    explicit PlacementState(AssetAmounts pool);
};

// Tax-inefficiency rank used by the tax-deferred pass (higher = less efficient):
// bonds 5, TIPS 4, international and emerging 3, domestic 2, cash 1
int tax_inefficiency_rank(AssetClass asset);

// Asset order for each account type's pass
std::vector<AssetClass> placement_order(AccountType type);

// Sum of allocated_amount x weight per asset class across goal portfolios
AssetAmounts aggregate_target_amounts(const std::vector<AllocationResult>& portfolios);

// Fill one account from the pool in `order`, never exceeding the account
// balance or an asset's remaining amount. Returns the new state.
PlacementState place_into_account(const PlacementState& state, const Account& account,
                                  const std::vector<AssetClass>& order);

// Tax-deferred accounts first (least tax-efficient assets), then tax-exempt
// (emerging, international, domestic equity), then taxable (remaining, in
// asset order). Throws std::invalid_argument for an empty account list or
// duplicate account ids. A residual is logged at WARN.
PlacementResult place_assets_in_accounts(const AssetAmounts& targets,
                                         const std::vector<Account>& accounts);

PlacementResult place_assets_in_accounts(const std::vector<AllocationResult>& portfolios,
                                         const std::vector<Account>& accounts);

struct TaxMetrics {
    double estimated_tax_drag;          // Annual, as a fraction of placed value
    double location_efficiency;         // 0-1

    TaxMetrics();
};

// Tax drag counts taxable accounts only: (1 - tax_eff) * return * amount.
// Location efficiency scores tax-deferred holdings 1 - tax_eff, tax-exempt
// 0.9 and taxable tax_eff, weighted by amount. Both are 0 when nothing is placed.
TaxMetrics compute_tax_metrics(const PlacementResult& placement,
                               const CapitalMarketAssumptions& cma);

} // namespace goalcalc

#endif // GOALCALC_ACCOUNT_PLACEMENT_HPP
