/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace reisim {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // Default configuration
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

    // Open log file if enabled
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_run_start(
    const RunContext& ctx,
    size_t num_simulations,
    uint64_t seed,
    const std::string& seed_source,
    size_t num_variables
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_start";
    add_context(ctx, fields);
    fields["num_simulations"] = std::to_string(num_simulations);
    fields["random_seed"] = std::to_string(seed);
    fields["seed_source"] = seed_source;
    fields["num_variables"] = std::to_string(num_variables);

    log(LogLevel::INFO, "Starting simulation run", std::move(fields));
}

void Logger::log_trial_excluded(
    const RunContext& ctx,
    size_t trial_index,
    const std::string& reason
) {
    if (!is_enabled(LogLevel::DEBUG)) {
        return;
    }

    std::map<std::string, std::string> fields;
    fields["event"] = "trial_excluded";
    add_context(ctx, fields);
    fields["trial_index"] = std::to_string(trial_index);
    fields["reason"] = reason;

    log(LogLevel::DEBUG, "Trial excluded", std::move(fields));
}

void Logger::log_degraded_run(
    const RunContext& ctx,
    size_t excluded_trials,
    size_t total_trials,
    double threshold
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "degraded_run";
    add_context(ctx, fields);
    fields["excluded_trials"] = std::to_string(excluded_trials);
    fields["total_trials"] = std::to_string(total_trials);
    fields["excluded_fraction"] = std::to_string(
        total_trials > 0 ? static_cast<double>(excluded_trials) / static_cast<double>(total_trials) : 0.0
    );
    fields["threshold"] = std::to_string(threshold);

    log(LogLevel::WARN, "Excluded trial fraction exceeds threshold", std::move(fields));
}

void Logger::log_run_complete(
    const RunContext& ctx,
    size_t included_trials,
    size_t excluded_trials,
    double execution_time_ms
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_complete";
    add_context(ctx, fields);
    fields["included_trials"] = std::to_string(included_trials);
    fields["excluded_trials"] = std::to_string(excluded_trials);
    fields["execution_time_ms"] = std::to_string(execution_time_ms);
    fields["throughput_trials_per_sec"] = std::to_string(
        execution_time_ms > 0 ? ((included_trials + excluded_trials) * 1000.0 / execution_time_ms) : 0
    );

    log(LogLevel::INFO, "Simulation run completed", std::move(fields));
}

void Logger::log_sensitivity_complete(
    const RunContext& ctx,
    size_t num_variables,
    size_t evaluations,
    double execution_time_ms
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "sensitivity_complete";
    add_context(ctx, fields);
    fields["num_variables"] = std::to_string(num_variables);
    fields["evaluations"] = std::to_string(evaluations);
    fields["execution_time_ms"] = std::to_string(execution_time_ms);

    log(LogLevel::INFO, "Sensitivity analysis completed", std::move(fields));
}

void Logger::log_error(
    const RunContext& ctx,
    const std::string& error_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    add_context(ctx, fields);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Run error", std::move(fields));
}

void Logger::log_warning(
    const RunContext& ctx,
    const std::string& warning_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    add_context(ctx, fields);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, std::move(fields));
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

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::add_context(const RunContext& ctx, std::map<std::string, std::string>& fields) const {
    if (!ctx.run_id.empty()) {
        fields["run_id"] = ctx.run_id;
    }
    if (!ctx.mode.empty()) {
        fields["mode"] = ctx.mode;
    }
    if (!ctx.evaluator.empty()) {
        fields["evaluator"] = ctx.evaluator;
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    std::map<std::string, std::string> fields
) {
    // Skip if below minimum level
    if (!is_enabled(level)) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        fields["timestamp"] = get_timestamp();
        fields["level"] = level_to_string(level);
        fields["message"] = message;
        output = format_json(fields);
    } else {
        // Plain text format
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

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                        << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
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

} // namespace reisim
