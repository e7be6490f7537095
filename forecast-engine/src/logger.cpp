/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <algorithm>

namespace forecast {

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

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log_decomposition_start(
    const ForecastContext& ctx,
    size_t unit_count,
    size_t worker_count,
    const RecursionGuard& guard
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "decomposition_start";
    add_context(fields, ctx);
    fields["unit_count"] = std::to_string(unit_count);
    fields["worker_count"] = std::to_string(worker_count);
    fields["current_depth"] = std::to_string(guard.current_depth);
    fields["max_depth"] = std::to_string(guard.max_depth);

    log(LogLevel::INFO, "Starting decomposition", fields);
}

void Logger::log_unit_result(
    const ForecastContext& ctx,
    const PartialResult& result
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "unit_result";
    add_context(fields, ctx);
    fields["sub_question_id"] = result.sub_question_id;
    fields["status"] = status_to_string(result.status);
    fields["duration_ms"] = std::to_string(result.duration_ms);
    fields["degraded"] = result.degraded ? "true" : "false";

    if (result.error) {
        fields["error_kind"] = error_kind_to_string(*result.error);
        fields["error"] = result.error_message;
    }

    LogLevel level = LogLevel::DEBUG;
    if (result.status == PartialResult::Status::TIMED_OUT) {
        level = LogLevel::WARN;
    } else if (result.status == PartialResult::Status::FAILED) {
        level = LogLevel::ERROR;
    }

    log(level, "Sub-forecast unit finished", fields);
}

void Logger::log_decomposition_complete(
    const ForecastContext& ctx,
    const std::vector<PartialResult>& results,
    double elapsed_ms
) {
    size_t ok = 0;
    size_t timed_out = 0;
    size_t failed = 0;
    for (const auto& result : results) {
        switch (result.status) {
            case PartialResult::Status::OK: ok++; break;
            case PartialResult::Status::TIMED_OUT: timed_out++; break;
            case PartialResult::Status::FAILED: failed++; break;
        }
    }

    std::map<std::string, std::string> fields;
    fields["event"] = "decomposition_complete";
    add_context(fields, ctx);
    fields["unit_count"] = std::to_string(results.size());
    fields["ok_count"] = std::to_string(ok);
    fields["timed_out_count"] = std::to_string(timed_out);
    fields["failed_count"] = std::to_string(failed);
    fields["elapsed_ms"] = std::to_string(elapsed_ms);

    log(ok == results.size() ? LogLevel::INFO : LogLevel::WARN, "Decomposition completed", fields);
}

void Logger::log_recursion_rejected(
    const ForecastContext& ctx,
    const RecursionGuard& guard
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "recursion_rejected";
    add_context(fields, ctx);
    fields["current_depth"] = std::to_string(guard.current_depth);
    fields["max_depth"] = std::to_string(guard.max_depth);

    log(LogLevel::ERROR, "Decomposition rejected by depth guard", fields);
}

void Logger::log_synthesis(
    const ForecastContext& ctx,
    size_t outcome_count,
    bool degraded,
    const std::string& reason
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "synthesis";
    add_context(fields, ctx);
    fields["outcome_count"] = std::to_string(outcome_count);
    fields["degraded"] = degraded ? "true" : "false";
    if (!reason.empty()) {
        fields["reason"] = reason;
    }

    if (degraded) {
        log(LogLevel::WARN, "Synthesis fell back to uniform distribution", fields);
    } else {
        log(LogLevel::DEBUG, "Synthesized CDF", fields);
    }
}

void Logger::log_aggregation(
    const ForecastContext& ctx,
    const AggregateForecast& forecast
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "aggregation";
    add_context(fields, ctx);
    fields["kind"] = kind_to_string(forecast.kind);
    fields["contributing_count"] = std::to_string(forecast.contributing_count);
    fields["excluded_count"] = std::to_string(forecast.excluded_count);
    fields["degraded"] = forecast.degraded ? "true" : "false";

    if (forecast.kind == QuestionKind::BINARY) {
        fields["probability"] = std::to_string(forecast.probability());
    } else if (forecast.kind == QuestionKind::NUMERIC) {
        fields["outcome_count"] = std::to_string(forecast.cdf().size());
    } else {
        fields["category_count"] = std::to_string(forecast.categories().size());
    }

    // Warnings
    if (!forecast.warnings.empty()) {
        fields["warning_count"] = std::to_string(forecast.warnings.size());
        for (size_t i = 0; i < std::min(forecast.warnings.size(), size_t(5)); ++i) {
            fields["warning_" + std::to_string(i)] = forecast.warnings[i];
        }
    }

    log(forecast.degraded ? LogLevel::WARN : LogLevel::INFO, "Aggregated forecast", fields);
}

void Logger::log_error(
    const ForecastContext& ctx,
    const std::string& error_message,
    const std::string& detail
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    add_context(fields, ctx);
    fields["error_message"] = error_message;

    if (!detail.empty()) {
        fields["detail"] = detail;
    }

    log(LogLevel::ERROR, "Forecast error", fields);
}

void Logger::log_warning(
    const ForecastContext& ctx,
    const std::string& warning_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    add_context(fields, ctx);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
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

void Logger::add_context(std::map<std::string, std::string>& fields, const ForecastContext& ctx) const {
    fields["question_id"] = ctx.question_id;
    fields["depth"] = std::to_string(ctx.depth);
    if (!ctx.sub_question_id.empty()) {
        fields["sub_question_id"] = ctx.sub_question_id;
    }
    if (!ctx.phase.empty()) {
        fields["phase"] = ctx.phase;
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
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
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace forecast
