#ifndef GOALCALC_CONFIG_HPP
#define GOALCALC_CONFIG_HPP

#include "logger.hpp"
#include "market_assumptions.hpp"
#include "planner.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace goalcalc {

/**
 * @brief Exception thrown when the engine config cannot be read or is invalid
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

struct SimulationSettings {
    size_t iterations;
    bool has_seed;          // false: draw a fresh seed per run
    uint64_t seed;

    SimulationSettings();
};

/**
 * @brief Engine configuration loaded from JSON
 *
 * Example:
 *   @code
 *   {
 *     "capital_market_assumptions": {
 *       "us_stocks": {"expected_return": 0.10, "volatility": 0.18, "tax_efficiency": 0.85}
 *     },
 *     "glide_path": {"essential_delta": -0.1, "risk_free_rate": 0.04},
 *     "simulation": {"iterations": 5000, "seed": 42},
 *     "solver": {"search_iterations": 1000, "tolerance": 10.0},
 *     "planner": {"target_probability": 0.9, "evaluate_goals": true},
 *     "logging": {"level": "INFO", "json": true, "file": "goalcalc.log"},
 *     "inputs": {"goals": "${DATA_DIR}/goals.csv", "accounts": "accounts.csv"}
 *   }
 *   @endcode
 *
 * Every section is optional; missing values keep their defaults.
 */
struct EngineConfig {
    CapitalMarketAssumptions cma;
    SimulationSettings simulation;
    PlannerOptions planner;         // Carries glide path and solver settings
    LoggerConfig logging;
    std::string goals_path;
    std::string accounts_path;

    EngineConfig();
};

/**
 * @brief Parses an engine configuration from a JSON file
 *
 * Input paths are resolved relative to the config file's directory.
 *
 * @throws ConfigParseError if the file cannot be read or the config is invalid
 */
EngineConfig parse_engine_config_from_file(const std::string& file_path);

/**
 * @brief Parses an engine configuration from a JSON string
 *
 * @throws ConfigParseError if the JSON is malformed or a value is out of range
 */
EngineConfig parse_engine_config_from_string(const std::string& json_string);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a relative path against the directory of the config file
 *
 * Absolute and empty paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace goalcalc

#endif // GOALCALC_CONFIG_HPP
