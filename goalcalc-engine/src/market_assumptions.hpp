#ifndef GOALCALC_MARKET_ASSUMPTIONS_HPP
#define GOALCALC_MARKET_ASSUMPTIONS_HPP

#include <array>
#include <cstdint>
#include <istream>
#include <string>

namespace goalcalc {

// The six sleeves a goal portfolio is split into by the glide path
enum class AssetClass : uint8_t {
    DomesticEquity = 0,
    InternationalEquity = 1,
    EmergingMarkets = 2,
    Bonds = 3,
    Tips = 4,
    Cash = 5
};

constexpr size_t NUM_ASSET_CLASSES = 6;

// All asset classes in declaration order
const std::array<AssetClass, NUM_ASSET_CLASSES>& all_asset_classes();

// Codes: us_stocks, international_stocks, emerging_markets, bonds, tips, cash
std::string to_code(AssetClass asset);
AssetClass asset_class_from_code(const std::string& code);

// Annualized assumptions for one asset class
struct AssetClassAssumption {
    double expected_return;
    double volatility;
    double tax_efficiency;      // 1.0 = fully tax-exempt growth

    AssetClassAssumption();
    AssetClassAssumption(double ret, double vol, double tax_eff);

    bool operator==(const AssetClassAssumption& other) const;
};

// CapitalMarketAssumptions: the CMA table, one record per AssetClass.
// Passed by value/reference into every computation that needs it.
class CapitalMarketAssumptions {
public:
    // All records zeroed; use defaults() for the reference table
    CapitalMarketAssumptions();

    static CapitalMarketAssumptions defaults();

    // Throws std::invalid_argument unless 0 <= return < 1, 0 < volatility < 1,
    // 0 <= tax_efficiency <= 1
    void set(AssetClass asset, const AssetClassAssumption& assumption);
    const AssetClassAssumption& get(AssetClass asset) const;

    double expected_return(AssetClass asset) const { return get(asset).expected_return; }
    double volatility(AssetClass asset) const { return get(asset).volatility; }
    double tax_efficiency(AssetClass asset) const { return get(asset).tax_efficiency; }

    // Load from CSV: expects columns asset_class,expected_return,volatility,tax_efficiency.
    // Rows override the defaults; classes not listed keep their reference values.
    static CapitalMarketAssumptions load_from_csv(const std::string& filepath);
    static CapitalMarketAssumptions load_from_csv(std::istream& is);

    bool operator==(const CapitalMarketAssumptions& other) const;

private:
    std::array<AssetClassAssumption, NUM_ASSET_CLASSES> records_;
};

} // namespace goalcalc

#endif // GOALCALC_MARKET_ASSUMPTIONS_HPP
