#include "config.hpp"
#include "validation.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace goalcalc {

namespace {

template <typename T>
void read_optional(const json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section.at(key).get<T>();
    }
}

void parse_cma(const json& section, CapitalMarketAssumptions& cma) {
    for (auto it = section.begin(); it != section.end(); ++it) {
        AssetClass asset = asset_class_from_code(it.key());
        AssetClassAssumption record = cma.get(asset);
        read_optional(it.value(), "expected_return", record.expected_return);
        read_optional(it.value(), "volatility", record.volatility);
        read_optional(it.value(), "tax_efficiency", record.tax_efficiency);
        cma.set(asset, record);
    }
}

void parse_glide_path(const json& section, GlidePathSettings& settings) {
    read_optional(section, "domestic_equity_share", settings.domestic_equity_share);
    read_optional(section, "international_equity_share", settings.international_equity_share);
    read_optional(section, "emerging_markets_share", settings.emerging_markets_share);
    read_optional(section, "bonds_share", settings.bonds_share);
    read_optional(section, "tips_share", settings.tips_share);
    read_optional(section, "cash_share", settings.cash_share);
    read_optional(section, "essential_delta", settings.essential_delta);
    read_optional(section, "important_delta", settings.important_delta);
    read_optional(section, "aspirational_delta", settings.aspirational_delta);
    read_optional(section, "min_equity", settings.min_equity);
    read_optional(section, "max_equity", settings.max_equity);
    read_optional(section, "horizon_years", settings.horizon_years);
    read_optional(section, "risk_free_rate", settings.risk_free_rate);
    settings.validate();
}

void parse_solver(const json& section, SolverConfig& solver) {
    read_optional(section, "search_iterations", solver.search_iterations);
    read_optional(section, "verification_iterations", solver.verification_iterations);
    read_optional(section, "tolerance", solver.tolerance);
    read_optional(section, "max_steps", solver.max_steps);
    read_optional(section, "max_bracket_expansions", solver.max_bracket_expansions);
    read_optional(section, "seed", solver.seed);

    validate_iterations(solver.search_iterations);
    validate_iterations(solver.verification_iterations);
    if (solver.tolerance <= 0.0) {
        throw InvalidInputError("solver.tolerance", "must be greater than 0");
    }
    if (solver.max_steps == 0) {
        throw InvalidInputError("solver.max_steps", "must be at least 1");
    }
}

void parse_logging(const json& section, LoggerConfig& logging) {
    if (section.contains("level")) {
        logging.min_level = string_to_level(section.at("level").get<std::string>());
    }
    read_optional(section, "json", logging.enable_json);
    read_optional(section, "console", logging.enable_console);
    if (section.contains("file")) {
        logging.log_file_path = expand_environment_variables(section.at("file").get<std::string>());
        logging.enable_file = !logging.log_file_path.empty();
    }
}

} // anonymous namespace

SimulationSettings::SimulationSettings()
    : iterations(DEFAULT_ITERATIONS), has_seed(false), seed(0) {}

EngineConfig::EngineConfig() : cma(CapitalMarketAssumptions::defaults()) {}

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++;

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                // Unterminated reference, leave it as written
                pos = start + 1;
                continue;
            }
            pos++;
        }

        if (var_name.empty()) {
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    if (path.empty()) {
        return path;
    }
    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }
    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

EngineConfig parse_engine_config_from_string(const std::string& json_string) {
    EngineConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Engine config must be a JSON object");
        }

        if (j.contains("capital_market_assumptions")) {
            parse_cma(j["capital_market_assumptions"], config.cma);
        }

        if (j.contains("glide_path")) {
            parse_glide_path(j["glide_path"], config.planner.glide_path);
        }

        if (j.contains("simulation")) {
            const json& sim = j["simulation"];
            read_optional(sim, "iterations", config.simulation.iterations);
            validate_iterations(config.simulation.iterations);
            if (sim.contains("seed")) {
                config.simulation.seed = sim["seed"].get<uint64_t>();
                config.simulation.has_seed = true;
                config.planner.solver.seed = config.simulation.seed;
            }
        }

        if (j.contains("solver")) {
            parse_solver(j["solver"], config.planner.solver);
        }

        if (j.contains("planner")) {
            const json& planner = j["planner"];
            read_optional(planner, "target_probability", config.planner.target_probability);
            read_optional(planner, "evaluate_goals", config.planner.evaluate_goals);
            validate_target_probability(config.planner.target_probability);
        }

        if (j.contains("logging")) {
            parse_logging(j["logging"], config.logging);
        }

        if (j.contains("inputs")) {
            const json& inputs = j["inputs"];
            if (inputs.contains("goals")) {
                config.goals_path = expand_environment_variables(inputs["goals"].get<std::string>());
            }
            if (inputs.contains("accounts")) {
                config.accounts_path =
                    expand_environment_variables(inputs["accounts"].get<std::string>());
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigParseError(std::string("JSON range error: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigParseError(std::string("Invalid config value: ") + e.what());
    }

    return config;
}

EngineConfig parse_engine_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    EngineConfig config = parse_engine_config_from_string(buffer.str());

    config.goals_path = resolve_relative_path(config.goals_path, file_path);
    config.accounts_path = resolve_relative_path(config.accounts_path, file_path);
    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

} // namespace goalcalc
