/**
 * @file logger.hpp
 * @brief Structured logging for simulation runs with JSON output
 *
 * One process-wide Logger writes run events as JSON lines (or plain text)
 * to stderr and optionally a file. Every event carries the RunContext of the
 * Monte Carlo or sensitivity run that emitted it. Trial exclusions are DEBUG,
 * degraded runs WARN.
 */

#ifndef REISIM_LOGGER_HPP
#define REISIM_LOGGER_HPP

#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace reisim {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (individual excluded trials)
    INFO,    ///< Informational messages (run start/end)
    WARN,    ///< Warning messages (degraded runs)
    ERROR    ///< Error messages (failures, exceptions)
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Context attached to every event of one run
 */
struct RunContext {
    std::string run_id;              ///< Identifier derived from the seed
    std::string mode;                ///< "monte-carlo" or "sensitivity"
    std::string evaluator;           ///< Evaluator name (e.g. rental_property)

    RunContext()
        : run_id(""), mode(""), evaluator("") {}

    RunContext(const std::string& id, const std::string& run_mode)
        : run_id(id), mode(run_mode), evaluator("") {}
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
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("reisim.log"),
          enable_json(true) {}
};

/**
 * @brief Run event logger
 *
 * Process-wide and thread-safe: events may be emitted from parallel trial
 * loops.
 *
 * Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "reisim.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   RunContext ctx("run-42", "monte-carlo");
 *   logger.log_run_start(ctx, 10000, 42, "request", 3);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * @param config Logger configuration
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the start of a Monte Carlo run
     *
     * @param ctx Run context
     * @param num_simulations Requested trial count
     * @param seed Resolved run seed
     * @param seed_source "request" or "entropy"
     * @param num_variables Number of sampled variables
     */
    void log_run_start(
        const RunContext& ctx,
        size_t num_simulations,
        uint64_t seed,
        const std::string& seed_source,
        size_t num_variables
    );

    /**
     * @brief Log a trial or metric excluded from aggregation (DEBUG)
     */
    void log_trial_excluded(
        const RunContext& ctx,
        size_t trial_index,
        const std::string& reason
    );

    /**
     * @brief Log a run whose excluded fraction exceeded the threshold (WARN)
     */
    void log_degraded_run(
        const RunContext& ctx,
        size_t excluded_trials,
        size_t total_trials,
        double threshold
    );

    /**
     * @brief Log the completion of a Monte Carlo run
     */
    void log_run_complete(
        const RunContext& ctx,
        size_t included_trials,
        size_t excluded_trials,
        double execution_time_ms
    );

    /**
     * @brief Log the completion of a sensitivity analysis
     */
    void log_sensitivity_complete(
        const RunContext& ctx,
        size_t num_variables,
        size_t evaluations,
        double execution_time_ms
    );

    /**
     * @brief Log error with context
     */
    void log_error(
        const RunContext& ctx,
        const std::string& error_message
    );

    /**
     * @brief Log warning message
     */
    void log_warning(
        const RunContext& ctx,
        const std::string& warning_message
    );

    /**
     * @brief Flush all log outputs
     */
    void flush();

    /**
     * @brief Set minimum log level
     */
    void set_min_level(LogLevel level);

    /**
     * @brief Get current log level
     */
    LogLevel get_min_level() const;

    bool is_enabled(LogLevel level) const { return level >= get_min_level(); }

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    // Helper methods
    void log(LogLevel level, const std::string& message, std::map<std::string, std::string> fields);
    void add_context(const RunContext& ctx, std::map<std::string, std::string>& fields) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace reisim

#endif // REISIM_LOGGER_HPP
