#include <iostream>
#include <fstream>
#include <optional>
#include <string>
#include <vector>
#include <cstdlib>
#include "goal.hpp"
#include "market_assumptions.hpp"
#include "monte_carlo.hpp"
#include "success_probability.hpp"
#include "contribution_solver.hpp"
#include "funding_calculator.hpp"
#include "capital_allocator.hpp"
#include "planner.hpp"
#include "validation.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"

namespace {

const char* const COMMANDS[] = {
    "funding", "probability", "required", "catch-up", "timeline", "allocate", "plan"
};

struct CLIArgs {
    std::string command;
    std::string config_path;
    std::string goals_path;
    std::string accounts_path;
    std::string cma_path;
    std::string output_path;
    std::string distribution_path;
    std::optional<double> target;
    std::optional<double> current;
    std::optional<double> years;
    std::optional<double> contribution;
    std::optional<double> capital;
    std::optional<double> savings;
    std::optional<double> max_monthly;
    std::optional<double> years_behind;
    std::optional<double> probability;
    std::optional<size_t> iterations;
    std::optional<uint64_t> seed;
    double expected_return = goalcalc::DEFAULT_EXPECTED_RETURN;
    double volatility = 0.15;
    double inflation = goalcalc::DEFAULT_INFLATION_RATE;
    bool evaluate = false;
    bool verbose = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "GoalCalc Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " <command> [options]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  funding       Deterministic funding requirements for one goal\n";
    std::cerr << "  probability   Monte Carlo probability of reaching a goal\n";
    std::cerr << "  required      Monthly contribution needed for a target probability\n";
    std::cerr << "  catch-up      Catch-up plan for a goal that is behind schedule\n";
    std::cerr << "  timeline      Timeline needed under a monthly contribution cap\n";
    std::cerr << "  allocate      Split capital (or monthly savings) across goals\n";
    std::cerr << "  plan          Full household plan: allocation, portfolios, placement\n\n";
    std::cerr << "Goal options:\n";
    std::cerr << "  --target <amount>           Goal target amount\n";
    std::cerr << "  --current <amount>          Current savings (default: 0)\n";
    std::cerr << "  --years <years>             Years to goal (years remaining for catch-up)\n";
    std::cerr << "  --contribution <amount>     Monthly contribution (probability)\n";
    std::cerr << "  --return <rate>             Expected annual return (default: 0.07)\n";
    std::cerr << "  --volatility <rate>         Annual return volatility (default: 0.15)\n";
    std::cerr << "  --inflation <rate>          Inflation rate (default: 0.03)\n";
    std::cerr << "  --probability <p>           Target success probability (required, plan)\n";
    std::cerr << "  --years-behind <years>      Years behind schedule (catch-up)\n";
    std::cerr << "  --max-monthly <amount>      Monthly contribution cap (timeline)\n\n";
    std::cerr << "Household options:\n";
    std::cerr << "  --goals <path>              CSV file with goals\n";
    std::cerr << "  --accounts <path>           CSV file with accounts (plan)\n";
    std::cerr << "  --capital <amount>          Capital to allocate\n";
    std::cerr << "  --savings <amount>          Monthly savings to allocate (allocate)\n";
    std::cerr << "  --cma <path>                CSV file with capital market assumptions\n";
    std::cerr << "  --evaluate                  Solve required contributions per goal (plan)\n\n";
    std::cerr << "Simulation options:\n";
    std::cerr << "  --iterations <count>        Monte Carlo paths (1000-10000, default: 5000)\n";
    std::cerr << "  --seed <value>              Random seed for reproducibility\n";
    std::cerr << "  --distribution <path>       Parquet file for the terminal-value distribution\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --config <path>             JSON engine configuration\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --verbose                   Log run events at INFO level\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  " << program_name << " probability --target 500000 --current 50000 \\\n";
    std::cerr << "      --contribution 1500 --years 20 --seed 42\n\n";
    std::cerr << "  " << program_name << " plan --goals data/goals.csv --accounts data/accounts.csv \\\n";
    std::cerr << "      --capital 250000 --output plan.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool is_command(const std::string& value) {
    for (const char* command : COMMANDS) {
        if (value == command) {
            return true;
        }
    }
    return false;
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (i == 1 && is_command(arg)) {
            args.command = arg;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--goals" && i + 1 < argc) {
            args.goals_path = argv[++i];
        } else if (arg == "--accounts" && i + 1 < argc) {
            args.accounts_path = argv[++i];
        } else if (arg == "--cma" && i + 1 < argc) {
            args.cma_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--distribution" && i + 1 < argc) {
            args.distribution_path = argv[++i];
        } else if (arg == "--target" && i + 1 < argc) {
            args.target = std::stod(argv[++i]);
        } else if (arg == "--current" && i + 1 < argc) {
            args.current = std::stod(argv[++i]);
        } else if (arg == "--years" && i + 1 < argc) {
            args.years = std::stod(argv[++i]);
        } else if (arg == "--contribution" && i + 1 < argc) {
            args.contribution = std::stod(argv[++i]);
        } else if (arg == "--capital" && i + 1 < argc) {
            args.capital = std::stod(argv[++i]);
        } else if (arg == "--savings" && i + 1 < argc) {
            args.savings = std::stod(argv[++i]);
        } else if (arg == "--max-monthly" && i + 1 < argc) {
            args.max_monthly = std::stod(argv[++i]);
        } else if (arg == "--years-behind" && i + 1 < argc) {
            args.years_behind = std::stod(argv[++i]);
        } else if (arg == "--probability" && i + 1 < argc) {
            args.probability = std::stod(argv[++i]);
        } else if (arg == "--return" && i + 1 < argc) {
            args.expected_return = std::stod(argv[++i]);
        } else if (arg == "--volatility" && i + 1 < argc) {
            args.volatility = std::stod(argv[++i]);
        } else if (arg == "--inflation" && i + 1 < argc) {
            args.inflation = std::stod(argv[++i]);
        } else if (arg == "--iterations" && i + 1 < argc) {
            args.iterations = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--seed" && i + 1 < argc) {
            args.seed = std::stoull(argv[++i]);
        } else if (arg == "--evaluate") {
            args.evaluate = true;
        } else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool require(const std::optional<double>& value, const char* flag, const std::string& command) {
    if (!value) {
        std::cerr << "Error: " << flag << " is required for " << command << "\n";
        return false;
    }
    return true;
}

bool require_file(const std::string& path, const char* flag, const std::string& command) {
    if (path.empty()) {
        std::cerr << "Error: " << flag << " is required for " << command << "\n";
        return false;
    }
    if (!file_exists(path)) {
        std::cerr << "Error: File not found: " << path << "\n";
        return false;
    }
    return true;
}

// Presence checks only; value ranges are checked by goalcalc's validators
bool validate_args(const CLIArgs& args) {
    bool valid = true;
    const std::string& cmd = args.command;

    if (cmd.empty()) {
        std::cerr << "Error: A command is required\n";
        return false;
    }

    if (cmd == "funding" || cmd == "probability" || cmd == "required" ||
        cmd == "catch-up" || cmd == "timeline") {
        valid &= require(args.target, "--target", cmd);
        valid &= require(args.years, "--years", cmd);
    }
    if (cmd == "probability") {
        valid &= require(args.contribution, "--contribution", cmd);
    }
    if (cmd == "catch-up") {
        valid &= require(args.years_behind, "--years-behind", cmd);
    }
    if (cmd == "timeline") {
        valid &= require(args.max_monthly, "--max-monthly", cmd);
    }
    if (cmd == "allocate") {
        if (args.goals_path.empty()) {
            // Goals may come from the config file
            if (args.config_path.empty()) {
                std::cerr << "Error: --goals is required for allocate\n";
                valid = false;
            }
        } else {
            valid &= require_file(args.goals_path, "--goals", cmd);
        }
        if (!args.capital && !args.savings) {
            std::cerr << "Error: --capital or --savings is required for allocate\n";
            valid = false;
        }
    }
    if (cmd == "plan") {
        if (!args.goals_path.empty()) {
            valid &= require_file(args.goals_path, "--goals", cmd);
        } else if (args.config_path.empty()) {
            std::cerr << "Error: --goals is required for plan\n";
            valid = false;
        }
        if (!args.accounts_path.empty()) {
            valid &= require_file(args.accounts_path, "--accounts", cmd);
        }
        valid &= require(args.capital, "--capital", cmd);
    }
    if (!args.config_path.empty() && !file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }
    if (!args.cma_path.empty() && !file_exists(args.cma_path)) {
        std::cerr << "Error: CMA file not found: " << args.cma_path << "\n";
        valid = false;
    }
    return valid;
}

void emit(const CLIArgs& args, const nlohmann::json& document) {
    if (args.output_path.empty()) {
        goalcalc::io::write_json(std::cout, document);
    } else {
        goalcalc::io::write_json(args.output_path, document);
        std::cerr << "Output written to: " << args.output_path << "\n";
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    try {
        if (!parse_args(argc, argv, args)) {
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid numeric argument (" << e.what() << ")\n";
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    try {
        goalcalc::EngineConfig config;
        if (!args.config_path.empty()) {
            config = goalcalc::parse_engine_config_from_file(args.config_path);
        }
        if (args.verbose) {
            config.logging.min_level = goalcalc::LogLevel::INFO;
        }
        goalcalc::Logger::get_instance().configure(config.logging);

        if (!args.cma_path.empty()) {
            config.cma = goalcalc::CapitalMarketAssumptions::load_from_csv(args.cma_path);
        }

        // CLI flags override the config file
        size_t iterations = args.iterations.value_or(config.simulation.iterations);
        uint64_t seed = args.seed ? *args.seed
                      : config.simulation.has_seed ? config.simulation.seed
                      : goalcalc::random_seed();
        config.planner.solver.seed = seed;
        if (args.probability) {
            config.planner.target_probability = *args.probability;
        }
        if (args.evaluate) {
            config.planner.evaluate_goals = true;
        }
        std::string goals_path = args.goals_path.empty() ? config.goals_path : args.goals_path;
        std::string accounts_path =
            args.accounts_path.empty() ? config.accounts_path : args.accounts_path;

        const std::string& cmd = args.command;
        const double current = args.current.value_or(0.0);

        if (cmd == "funding") {
            goalcalc::validate_target_amount(*args.target);
            goalcalc::validate_current_amount(current);
            goalcalc::validate_years_to_goal(*args.years);
            goalcalc::validate_expected_return(args.expected_return);
            goalcalc::FundingRequirements req = goalcalc::compute_funding_requirements(
                *args.target, current, *args.years, args.expected_return, args.inflation);
            emit(args, goalcalc::io::to_json(req));

        } else if (cmd == "probability") {
            goalcalc::validate_simulation_inputs(*args.target, current, *args.contribution,
                                                 *args.years, args.expected_return,
                                                 args.volatility, iterations);
            goalcalc::SimulationParams params(current, *args.contribution, *args.years,
                                              args.expected_return, args.volatility,
                                              iterations);
            bool keep_paths = !args.distribution_path.empty();
            goalcalc::SimulationResult result = goalcalc::compute_success_probability(
                *args.target, params, goalcalc::SuccessConfig(seed, keep_paths));

            std::cerr << "Success probability: " << result.success_probability
                      << " (" << result.iterations << " paths, "
                      << result.execution_time_ms << " ms)\n";

            if (keep_paths) {
                goalcalc::ParquetWriter::write_distribution(result, args.distribution_path);
                std::cerr << "Distribution written to: " << args.distribution_path << "\n";
            }
            emit(args, goalcalc::io::to_json(result));

        } else if (cmd == "required") {
            double probability = config.planner.target_probability;
            goalcalc::validate_simulation_inputs(*args.target, current, 0.0, *args.years,
                                                 args.expected_return, args.volatility,
                                                 iterations);
            goalcalc::validate_target_probability(probability);
            goalcalc::SolverConfig solver = config.planner.solver;
            solver.verification_iterations = iterations;
            goalcalc::RequiredContribution result = goalcalc::compute_required_contribution(
                *args.target, current, *args.years, probability, args.expected_return,
                args.volatility, solver, goalcalc::RunContext("", "required"));
            emit(args, goalcalc::io::to_json(result));

        } else if (cmd == "catch-up") {
            goalcalc::validate_target_amount(*args.target);
            goalcalc::validate_current_amount(current);
            goalcalc::validate_years_to_goal(*args.years);
            goalcalc::validate_years_to_goal(*args.years_behind);
            goalcalc::validate_expected_return(args.expected_return);
            goalcalc::CatchUpStrategy strategy = goalcalc::compute_catch_up_strategy(
                *args.target, current, *args.years, *args.years_behind, args.expected_return);
            emit(args, goalcalc::io::to_json(strategy));

        } else if (cmd == "timeline") {
            goalcalc::validate_target_amount(*args.target);
            goalcalc::validate_current_amount(current);
            goalcalc::validate_years_to_goal(*args.years);
            goalcalc::validate_expected_return(args.expected_return);
            if (*args.max_monthly < 0.0) {
                throw goalcalc::InvalidInputError("max_monthly", "must not be negative");
            }
            goalcalc::ContributionTimeline timeline = goalcalc::optimize_contribution_timeline(
                *args.target, current, *args.years, *args.max_monthly, args.expected_return);
            emit(args, goalcalc::io::to_json(timeline));

        } else if (cmd == "allocate") {
            std::cerr << "Loading goals from " << goals_path << "..." << std::flush;
            goalcalc::GoalSet goals = goalcalc::GoalSet::load_from_csv(goals_path);
            std::cerr << " loaded " << goals.size() << " goals\n";
            goalcalc::validate_goals(goals.goals());

            std::vector<goalcalc::GoalNeed> needs;
            double available;
            if (args.savings) {
                goalcalc::validate_expected_return(args.expected_return);
                needs = goalcalc::compute_savings_needs(goals.goals(), args.expected_return);
                available = *args.savings;
            } else {
                needs = goalcalc::compute_goal_needs(goals.goals());
                available = *args.capital;
            }
            if (available < 0.0) {
                throw goalcalc::InvalidInputError(args.savings ? "savings" : "capital",
                                                  "must not be negative");
            }
            goalcalc::GoalAllocations allocations = goalcalc::allocate_to_needs(needs, available);
            nlohmann::json document = goalcalc::io::allocations_to_json(
                allocations, goalcalc::find_underfunded_goals(needs, allocations));
            document["basis"] = args.savings ? "monthly_savings" : "capital";
            emit(args, document);

        } else if (cmd == "plan") {
            std::cerr << "Loading goals from " << goals_path << "..." << std::flush;
            goalcalc::GoalSet goals = goalcalc::GoalSet::load_from_csv(goals_path);
            std::cerr << " loaded " << goals.size() << " goals\n";

            goalcalc::AccountSet accounts;
            if (!accounts_path.empty()) {
                std::cerr << "Loading accounts from " << accounts_path << "..." << std::flush;
                accounts = goalcalc::AccountSet::load_from_csv(accounts_path);
                std::cerr << " loaded " << accounts.size() << " accounts\n";
            }

            goalcalc::HouseholdPlan plan = goalcalc::run_household_plan(
                goals.goals(), accounts.accounts(), *args.capital, config.cma, config.planner);

            std::cerr << "Plan complete: " << plan.portfolios.size() << " funded goals, "
                      << plan.underfunded_goals.size() << " underfunded, "
                      << plan.execution_time_ms << " ms\n";
            emit(args, goalcalc::io::to_json(plan));
        }

        goalcalc::Logger::get_instance().flush();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
