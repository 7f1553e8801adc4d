/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace goalcalc {

namespace {

std::string format_number(double value, int precision = 6) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

} // anonymous namespace

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel string_to_level(const std::string& level_str) {
    std::string upper = level_str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_run_start(
    const RunContext& ctx,
    const std::map<std::string, std::string>& parameters
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_start";
    add_context(ctx, fields);
    for (const auto& [key, value] : parameters) {
        fields["param." + key] = value;
    }
    log(LogLevel::INFO, "Starting " + ctx.operation, std::move(fields));
}

void Logger::log_run_complete(
    const RunContext& ctx,
    double execution_time_ms,
    const std::map<std::string, std::string>& summary
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_complete";
    add_context(ctx, fields);
    fields["execution_time_ms"] = format_number(execution_time_ms, 2);
    for (const auto& [key, value] : summary) {
        fields["result." + key] = value;
    }
    log(LogLevel::INFO, "Completed " + ctx.operation, std::move(fields));
}

void Logger::log_simulation_complete(
    const std::string& operation,
    size_t iterations,
    double success_probability,
    double execution_time_ms
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "simulation_complete";
    fields["operation"] = operation;
    fields["iterations"] = std::to_string(iterations);
    fields["success_probability"] = format_number(success_probability, 4);
    fields["execution_time_ms"] = format_number(execution_time_ms, 2);
    log(LogLevel::DEBUG, "Monte Carlo batch complete", std::move(fields));
}

void Logger::log_solver_step(
    const RunContext& ctx,
    double low,
    double high,
    double probability
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "solver_step";
    add_context(ctx, fields);
    fields["low"] = format_number(low, 2);
    fields["high"] = format_number(high, 2);
    fields["probability"] = format_number(probability, 4);
    log(LogLevel::DEBUG, "Bisection step", std::move(fields));
}

void Logger::log_solver_result(
    const RunContext& ctx,
    double required_monthly,
    double estimated_probability,
    size_t steps,
    bool converged
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "solver_result";
    add_context(ctx, fields);
    fields["required_monthly"] = format_number(required_monthly, 2);
    fields["estimated_success_probability"] = format_number(estimated_probability, 4);
    fields["steps"] = std::to_string(steps);
    fields["converged"] = converged ? "true" : "false";
    log(converged ? LogLevel::INFO : LogLevel::WARN,
        converged ? "Required contribution found"
                  : "Required contribution search stopped at step limit",
        std::move(fields));
}

void Logger::log_placement_residual(
    double total_unplaced,
    const std::map<std::string, double>& unplaced_by_asset
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "placement_residual";
    fields["total_unplaced"] = format_number(total_unplaced, 2);
    for (const auto& [asset, amount] : unplaced_by_asset) {
        fields["unplaced." + asset] = format_number(amount, 2);
    }
    log(LogLevel::WARN, "Target assets exceed account balances", std::move(fields));
}

void Logger::log_error(const RunContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    add_context(ctx, fields);
    fields["error_message"] = error_message;
    log(LogLevel::ERROR, "Engine error", std::move(fields));
}

void Logger::log_warning(const RunContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    add_context(ctx, fields);
    fields["warning"] = warning_message;
    log(LogLevel::WARN, warning_message, std::move(fields));
}

void Logger::log_info(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::INFO, message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    std::map<std::string, std::string> fields
) {
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        fields["timestamp"] = get_timestamp();
        fields["level"] = level_to_string(level);
        fields["message"] = message;
        output = format_json(fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

void Logger::add_context(const RunContext& ctx, std::map<std::string, std::string>& fields) const {
    if (!ctx.run_id.empty()) fields["run_id"] = ctx.run_id;
    if (!ctx.operation.empty()) fields["operation"] = ctx.operation;
    if (!ctx.goal_id.empty()) fields["goal_id"] = ctx.goal_id;
    fields["step"] = std::to_string(ctx.step);
}

// UTC, ISO-8601 with milliseconds
std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    long millis = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000);

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    char stamp[40];
    std::snprintf(stamp, sizeof(stamp), "%s.%03ldZ", buffer, millis);
    return stamp;
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    nlohmann::json line = nlohmann::json::object();
    for (const auto& field : fields) {
        line[field.first] = field.second;
    }
    // Invalid UTF-8 in a goal name must not abort logging
    return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void Logger::write_output(const std::string& output) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace goalcalc
