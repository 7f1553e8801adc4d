#include "market_assumptions.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace goalcalc {

// ============================================================================
// AssetClass codes
// ============================================================================

const std::array<AssetClass, NUM_ASSET_CLASSES>& all_asset_classes() {
    static const std::array<AssetClass, NUM_ASSET_CLASSES> classes = {
        AssetClass::DomesticEquity,
        AssetClass::InternationalEquity,
        AssetClass::EmergingMarkets,
        AssetClass::Bonds,
        AssetClass::Tips,
        AssetClass::Cash
    };
    return classes;
}

std::string to_code(AssetClass asset) {
    switch (asset) {
        case AssetClass::DomesticEquity: return "us_stocks";
        case AssetClass::InternationalEquity: return "international_stocks";
        case AssetClass::EmergingMarkets: return "emerging_markets";
        case AssetClass::Bonds: return "bonds";
        case AssetClass::Tips: return "tips";
        case AssetClass::Cash: return "cash";
    }
    throw std::invalid_argument("Unknown asset class");
}

AssetClass asset_class_from_code(const std::string& code) {
    std::string lower = code;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (AssetClass asset : all_asset_classes()) {
        if (to_code(asset) == lower) {
            return asset;
        }
    }
    throw std::invalid_argument("Unknown asset class code: " + code);
}

// ============================================================================
// AssetClassAssumption
// ============================================================================

AssetClassAssumption::AssetClassAssumption()
    : expected_return(0.0), volatility(0.0), tax_efficiency(0.0) {}

AssetClassAssumption::AssetClassAssumption(double ret, double vol, double tax_eff)
    : expected_return(ret), volatility(vol), tax_efficiency(tax_eff) {}

bool AssetClassAssumption::operator==(const AssetClassAssumption& other) const {
    return expected_return == other.expected_return &&
           volatility == other.volatility &&
           tax_efficiency == other.tax_efficiency;
}

// ============================================================================
// CapitalMarketAssumptions
// ============================================================================

CapitalMarketAssumptions::CapitalMarketAssumptions() {
    records_.fill(AssetClassAssumption());
}

CapitalMarketAssumptions CapitalMarketAssumptions::defaults() {
    CapitalMarketAssumptions cma;
    cma.set(AssetClass::DomesticEquity, AssetClassAssumption(0.10, 0.18, 0.85));
    cma.set(AssetClass::InternationalEquity, AssetClassAssumption(0.09, 0.20, 0.80));
    cma.set(AssetClass::EmergingMarkets, AssetClassAssumption(0.095, 0.24, 0.72));
    cma.set(AssetClass::Bonds, AssetClassAssumption(0.04, 0.06, 0.60));
    cma.set(AssetClass::Tips, AssetClassAssumption(0.035, 0.06, 0.65));
    cma.set(AssetClass::Cash, AssetClassAssumption(0.02, 0.01, 0.70));
    return cma;
}

void CapitalMarketAssumptions::set(AssetClass asset, const AssetClassAssumption& assumption) {
    const std::string code = to_code(asset);
    if (assumption.expected_return < 0.0 || assumption.expected_return >= 1.0) {
        throw std::invalid_argument("Expected return for " + code + " must be in [0, 1)");
    }
    if (assumption.volatility <= 0.0 || assumption.volatility >= 1.0) {
        throw std::invalid_argument("Volatility for " + code + " must be in (0, 1)");
    }
    if (assumption.tax_efficiency < 0.0 || assumption.tax_efficiency > 1.0) {
        throw std::invalid_argument("Tax efficiency for " + code + " must be in [0, 1]");
    }
    records_[static_cast<size_t>(asset)] = assumption;
}

const AssetClassAssumption& CapitalMarketAssumptions::get(AssetClass asset) const {
    size_t index = static_cast<size_t>(asset);
    if (index >= NUM_ASSET_CLASSES) {
        throw std::out_of_range("Asset class index out of range");
    }
    return records_[index];
}

CapitalMarketAssumptions CapitalMarketAssumptions::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open capital market assumptions file: " + filepath);
    }
    return load_from_csv(file);
}

CapitalMarketAssumptions CapitalMarketAssumptions::load_from_csv(std::istream& is) {
    CapitalMarketAssumptions cma = defaults();
    CsvReader reader(is);

    // Skip header row
    if (reader.has_more()) {
        reader.read_row();
    }

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;

        if (row.size() < 4) {
            throw std::runtime_error(
                "CMA CSV requires columns: asset_class,expected_return,volatility,tax_efficiency");
        }

        AssetClass asset = asset_class_from_code(row[0]);
        cma.set(asset, AssetClassAssumption(std::stod(row[1]), std::stod(row[2]),
                                            std::stod(row[3])));
    }

    return cma;
}

bool CapitalMarketAssumptions::operator==(const CapitalMarketAssumptions& other) const {
    return records_ == other.records_;
}

} // namespace goalcalc
