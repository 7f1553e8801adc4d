/**
 * @file logger.hpp
 * @brief Structured logging for the goal engine with JSON output
 *
 * The Logger provides:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-lines or plain-text output to stderr and/or a file
 * - Context tracking (run id, operation, goal id, step)
 * - Events for simulation, solver and placement milestones
 *
 * Library code logs at WARN and above by default; the CLI lowers the level
 * with --verbose.
 */

#ifndef GOALCALC_LOGGER_HPP
#define GOALCALC_LOGGER_HPP

#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace goalcalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-step detail (solver bisection steps)
    INFO,    ///< Run start/complete, simulation summaries
    WARN,    ///< Non-fatal issues (unplaced assets, unconverged search)
    ERROR    ///< Failures reported to the caller
};

std::string level_to_string(LogLevel level);

/**
 * @brief Parse log level from string, INFO when unrecognized
 */
LogLevel string_to_level(const std::string& level_str);

/**
 * @brief Context attached to run-level events
 */
struct RunContext {
    std::string run_id;              ///< Caller-supplied identifier for the request
    std::string operation;           ///< plan, probability, required, ...
    std::string goal_id;             ///< Goal being evaluated, if any
    size_t step;                     ///< Search step or goal index

    RunContext() : step(0) {}

    RunContext(const std::string& id, const std::string& op)
        : run_id(id), operation(op), step(0) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::WARN),
          enable_console(true),
          enable_file(false),
          log_file_path("goalcalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::INFO;
 *   Logger::get_instance().configure(config);
 *
 *   RunContext ctx("req-17", "plan");
 *   Logger::get_instance().log_run_start(ctx, {{"goals", "3"}});
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings; reopens the log file if enabled
     */
    void configure(const LoggerConfig& config);

    void log_run_start(
        const RunContext& ctx,
        const std::map<std::string, std::string>& parameters
    );

    void log_run_complete(
        const RunContext& ctx,
        double execution_time_ms,
        const std::map<std::string, std::string>& summary
    );

    /**
     * @brief Log completion of one Monte Carlo batch
     */
    void log_simulation_complete(
        const std::string& operation,
        size_t iterations,
        double success_probability,
        double execution_time_ms
    );

    /**
     * @brief Log one bisection step of the required-contribution search (DEBUG)
     */
    void log_solver_step(
        const RunContext& ctx,
        double low,
        double high,
        double probability
    );

    void log_solver_result(
        const RunContext& ctx,
        double required_monthly,
        double estimated_probability,
        size_t steps,
        bool converged
    );

    /**
     * @brief Log target assets that did not fit in any account (WARN)
     */
    void log_placement_residual(
        double total_unplaced,
        const std::map<std::string, double>& unplaced_by_asset
    );

    void log_error(const RunContext& ctx, const std::string& error_message);

    void log_warning(const RunContext& ctx, const std::string& warning_message);

    void log_info(const std::string& message, const std::map<std::string, std::string>& fields);

    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    std::mutex mutex_;

    void log(LogLevel level, const std::string& message, std::map<std::string, std::string> fields);
    void add_context(const RunContext& ctx, std::map<std::string, std::string>& fields) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    void write_output(const std::string& output);
};

} // namespace goalcalc

#endif // GOALCALC_LOGGER_HPP
