#include <catch2/catch.hpp>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <unistd.h>
#include <vector>
#include "logger.hpp"

using namespace goalcalc;
using json = nlohmann::json;

namespace {

std::string temp_log_path(const std::string& tag) {
    return "/tmp/goalcalc_logger_" + tag + "_" + std::to_string(getpid()) + ".log";
}

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream file(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

// Routes the singleton to a fresh file and restores defaults afterwards
class ScopedFileLogger {
public:
    ScopedFileLogger(const std::string& path, LogLevel level, bool json_output)
        : path_(path) {
        std::remove(path_.c_str());
        LoggerConfig config;
        config.min_level = level;
        config.enable_console = false;
        config.enable_file = true;
        config.log_file_path = path_;
        config.enable_json = json_output;
        Logger::get_instance().configure(config);
    }

    ~ScopedFileLogger() {
        Logger::get_instance().configure(LoggerConfig());
        std::remove(path_.c_str());
    }

    std::vector<std::string> lines() {
        Logger::get_instance().flush();
        return read_lines(path_);
    }

private:
    std::string path_;
};

} // anonymous namespace

TEST_CASE("Log level names", "[logger]") {
    REQUIRE(level_to_string(LogLevel::DEBUG) == "DEBUG");
    REQUIRE(level_to_string(LogLevel::ERROR) == "ERROR");
    REQUIRE(string_to_level("info") == LogLevel::INFO);
    REQUIRE(string_to_level("Warning") == LogLevel::WARN);
    REQUIRE(string_to_level("ERROR") == LogLevel::ERROR);
    REQUIRE(string_to_level("verbose") == LogLevel::INFO);
}

TEST_CASE("Default configuration", "[logger]") {
    LoggerConfig config;
    REQUIRE(config.min_level == LogLevel::WARN);
    REQUIRE(config.enable_console);
    REQUIRE_FALSE(config.enable_file);
    REQUIRE(config.enable_json);
}

TEST_CASE("JSON lines carry context fields", "[logger]") {
    ScopedFileLogger scoped(temp_log_path("json"), LogLevel::DEBUG, true);

    RunContext ctx("req-1", "required");
    ctx.goal_id = "retirement";
    Logger::get_instance().log_run_start(ctx, {{"target", "500000"}});
    Logger::get_instance().log_solver_step(ctx, 100.0, 200.0, 0.87654);
    Logger::get_instance().log_solver_result(ctx, 1523.456, 0.9012, 12, true);

    auto lines = scoped.lines();
    REQUIRE(lines.size() == 3);

    json start = json::parse(lines[0]);
    REQUIRE(start["event"] == "run_start");
    REQUIRE(start["level"] == "INFO");
    REQUIRE(start["run_id"] == "req-1");
    REQUIRE(start["operation"] == "required");
    REQUIRE(start["goal_id"] == "retirement");
    REQUIRE(start["param.target"] == "500000");
    REQUIRE(start.contains("timestamp"));

    json step = json::parse(lines[1]);
    REQUIRE(step["level"] == "DEBUG");
    REQUIRE(step["low"] == "100.00");
    REQUIRE(step["probability"] == "0.8765");

    json result = json::parse(lines[2]);
    REQUIRE(result["required_monthly"] == "1523.46");
    REQUIRE(result["steps"] == "12");
    REQUIRE(result["converged"] == "true");
}

TEST_CASE("Messages below the minimum level are dropped", "[logger]") {
    ScopedFileLogger scoped(temp_log_path("level"), LogLevel::WARN, true);

    Logger::get_instance().log_info("quiet", {});
    Logger::get_instance().log_simulation_complete("success_probability", 5000, 0.9, 12.5);
    Logger::get_instance().log_warning(RunContext("r", "plan"), "Goal is funded below its need");
    Logger::get_instance().log_solver_result(RunContext(), 10.0, 0.5, 64, false);

    auto lines = scoped.lines();
    REQUIRE(lines.size() == 2);
    REQUIRE(json::parse(lines[0])["warning"] == "Goal is funded below its need");
    REQUIRE(json::parse(lines[1])["converged"] == "false");
}

TEST_CASE("Placement residual lists each asset", "[logger]") {
    ScopedFileLogger scoped(temp_log_path("residual"), LogLevel::WARN, true);

    Logger::get_instance().log_placement_residual(150.0, {{"bonds", 100.0}, {"cash", 50.0}});

    auto lines = scoped.lines();
    REQUIRE(lines.size() == 1);
    json entry = json::parse(lines[0]);
    REQUIRE(entry["level"] == "WARN");
    REQUIRE(entry["total_unplaced"] == "150.00");
    REQUIRE(entry["unplaced.bonds"] == "100.00");
    REQUIRE(entry["unplaced.cash"] == "50.00");
}

TEST_CASE("Special characters are escaped", "[logger]") {
    ScopedFileLogger scoped(temp_log_path("escape"), LogLevel::ERROR, true);

    Logger::get_instance().log_error(RunContext(), "bad \"value\"\n\tat line 3");

    auto lines = scoped.lines();
    REQUIRE(lines.size() == 1);
    REQUIRE(json::parse(lines[0])["error_message"] == "bad \"value\"\n\tat line 3");
}

TEST_CASE("Plain text output", "[logger]") {
    ScopedFileLogger scoped(temp_log_path("text"), LogLevel::INFO, false);

    Logger::get_instance().log_info("Loaded goals", {{"count", "4"}});

    auto lines = scoped.lines();
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[INFO] Loaded goals") != std::string::npos);
    REQUIRE(lines[0].find("count=4") != std::string::npos);
}

TEST_CASE("Minimum level can be changed at runtime", "[logger]") {
    Logger& logger = Logger::get_instance();
    LogLevel original = logger.get_min_level();

    logger.set_min_level(LogLevel::ERROR);
    REQUIRE(logger.get_min_level() == LogLevel::ERROR);

    logger.set_min_level(original);
    REQUIRE(logger.get_min_level() == original);
}
