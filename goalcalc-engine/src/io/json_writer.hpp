#ifndef GOALCALC_IO_JSON_WRITER_HPP
#define GOALCALC_IO_JSON_WRITER_HPP

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include "../contribution_solver.hpp"
#include "../funding_calculator.hpp"
#include "../planner.hpp"
#include "../success_probability.hpp"

namespace goalcalc {
namespace io {

// Result serialization. Currency is rounded to 2 decimals and rates and
// probabilities to 4; the numeric core itself never rounds.

nlohmann::json to_json(const FundingRequirements& req);
nlohmann::json to_json(const CatchUpStrategy& strategy);
nlohmann::json to_json(const ContributionTimeline& timeline);
nlohmann::json to_json(const RequiredContribution& result);

// The distribution is included only when include_distribution is set and
// the result kept its terminal values
nlohmann::json to_json(const SimulationResult& result, bool include_distribution = false);

nlohmann::json to_json(const AllocationResult& portfolio);
nlohmann::json to_json(const PlacementResult& placement);
nlohmann::json to_json(const TaxMetrics& metrics);
nlohmann::json to_json(const AggregateStats& stats);
nlohmann::json to_json(const HouseholdPlan& plan);

// goal_id -> amount, with the list of goals funded below need
nlohmann::json allocations_to_json(const GoalAllocations& allocations,
                                   const std::vector<std::string>& underfunded_goals);

// Asset-class keyed amounts or weights, using asset codes as keys
nlohmann::json asset_map_to_json(const std::map<AssetClass, double>& values, int decimals);

void write_json(std::ostream& os, const nlohmann::json& document, bool pretty_print = true);

// Throws std::runtime_error if the file cannot be opened
void write_json(const std::string& filepath, const nlohmann::json& document,
                bool pretty_print = true);

} // namespace io
} // namespace goalcalc

#endif // GOALCALC_IO_JSON_WRITER_HPP
