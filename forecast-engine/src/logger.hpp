/**
 * @file logger.hpp
 * @brief Structured logging for the forecast engine with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Context tracking (question, sub-question, decomposition depth, phase)
 * - Events for decomposition, unit outcomes, synthesis and aggregation
 *
 * Design Pattern: Singleton logger with structured event emission.
 * Writes are serialized; decomposition units log from worker threads.
 */

#ifndef FORECAST_LOGGER_HPP
#define FORECAST_LOGGER_HPP

#include "forecast_types.hpp"
#include <string>
#include <map>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include <ostream>
#include <fstream>
#include <sstream>
#include <iomanip>

namespace forecast {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (per-unit outcomes, synthesis details)
    INFO,    ///< Informational messages (decomposition start/end, aggregation)
    WARN,    ///< Warning messages (degraded synthesis, excluded branches)
    ERROR    ///< Error messages (failures, rejected requests)
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
 * @brief Forecast context attached to every log event
 */
struct ForecastContext {
    std::string question_id;         ///< Question being forecast
    std::string sub_question_id;     ///< Sub-question (empty at the top level)
    size_t depth;                    ///< Decomposition depth
    std::string phase;               ///< Current phase (decompose, synthesize, aggregate)

    ForecastContext()
        : question_id(""), sub_question_id(""), depth(0), phase("") {}

    ForecastContext(const std::string& question, const std::string& phase_)
        : question_id(question), sub_question_id(""), depth(0), phase(phase_) {}
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
          log_file_path("forecast.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "forecast.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   ForecastContext ctx("q-1234", "decompose");
 *   logger.log_decomposition_start(ctx, 3, 3, RecursionGuard(0, 2));
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
     * @brief Log the start of a decomposition step
     *
     * @param ctx Forecast context
     * @param unit_count Number of sub-questions scheduled
     * @param worker_count Worker pool size for this step
     * @param guard Recursion guard of the decomposing question
     */
    void log_decomposition_start(
        const ForecastContext& ctx,
        size_t unit_count,
        size_t worker_count,
        const RecursionGuard& guard
    );

    /**
     * @brief Log the outcome of one sub-forecast unit
     */
    void log_unit_result(
        const ForecastContext& ctx,
        const PartialResult& result
    );

    /**
     * @brief Log the end of a decomposition step with outcome counts
     */
    void log_decomposition_complete(
        const ForecastContext& ctx,
        const std::vector<PartialResult>& results,
        double elapsed_ms
    );

    /**
     * @brief Log a decomposition request rejected by the depth guard
     */
    void log_recursion_rejected(
        const ForecastContext& ctx,
        const RecursionGuard& guard
    );

    /**
     * @brief Log a CDF synthesis (WARN when degraded, DEBUG otherwise)
     *
     * @param ctx Forecast context
     * @param outcome_count Length of the produced CDF
     * @param degraded True if the fallback distribution was used
     * @param reason Fallback reason (empty when not degraded)
     */
    void log_synthesis(
        const ForecastContext& ctx,
        size_t outcome_count,
        bool degraded,
        const std::string& reason
    );

    /**
     * @brief Log an aggregate forecast
     */
    void log_aggregation(
        const ForecastContext& ctx,
        const AggregateForecast& forecast
    );

    /**
     * @brief Log error with context
     *
     * @param ctx Forecast context
     * @param error_message Error message
     * @param detail Optional detail (e.g. the sub-question title)
     */
    void log_error(
        const ForecastContext& ctx,
        const std::string& error_message,
        const std::string& detail = ""
    );

    /**
     * @brief Log warning message
     */
    void log_warning(
        const ForecastContext& ctx,
        const std::string& warning_message
    );

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

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
    void add_context(std::map<std::string, std::string>& fields, const ForecastContext& ctx) const;
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace forecast

#endif // FORECAST_LOGGER_HPP
