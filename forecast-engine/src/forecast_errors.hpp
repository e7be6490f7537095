/**
 * @file forecast_errors.hpp
 * @brief Exception taxonomy for forecast synthesis and decomposition
 *
 * Structural violations (bad input shape, exhausted recursion budget,
 * total aggregation failure) are raised as typed exceptions. Local
 * numerical glitches are never raised; they produce a degraded result.
 */

#ifndef FORECAST_ERRORS_HPP
#define FORECAST_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <cstddef>

namespace forecast {

/**
 * @brief Base exception for all forecast engine errors
 */
class ForecastError : public std::runtime_error {
public:
    explicit ForecastError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised for malformed or out-of-bound input
 *
 * Examples: non-monotonic percentiles, a value outside a closed bound,
 * a non-positive value under log scale.
 */
class ValidationError : public ForecastError {
public:
    explicit ValidationError(const std::string& message)
        : ForecastError("Validation failed: " + message) {}
};

/**
 * @brief Raised by a spawn callback or external executor when a call runs out of time
 *
 * The coordinator records it as PartialResult::Status::TIMED_OUT.
 */
class TimeoutFailure : public ForecastError {
public:
    explicit TimeoutFailure(const std::string& message)
        : ForecastError("Timed out: " + message) {}
};

/**
 * @brief Raised by an external executor for an unrecoverable (non-timeout) failure
 */
class ExternalCallError : public ForecastError {
public:
    explicit ExternalCallError(const std::string& message)
        : ForecastError("External call failed: " + message) {}
};

/**
 * @brief Raised when no contributing result carries usable signal
 */
class AggregationError : public ForecastError {
public:
    explicit AggregationError(const std::string& message)
        : ForecastError("Aggregation failed: " + message) {}
};

/**
 * @brief Raised when a decomposition request would exceed the depth budget
 */
class RecursionLimitExceeded : public ForecastError {
public:
    RecursionLimitExceeded(size_t current_depth, size_t max_depth)
        : ForecastError("Recursion limit exceeded: depth " + std::to_string(current_depth) +
                        " >= max depth " + std::to_string(max_depth)),
          current_depth_(current_depth), max_depth_(max_depth) {}

    size_t current_depth() const { return current_depth_; }
    size_t max_depth() const { return max_depth_; }

private:
    size_t current_depth_;
    size_t max_depth_;
};

/**
 * @brief Raised when a configuration file or string cannot be parsed
 */
class ConfigParseError : public ForecastError {
public:
    explicit ConfigParseError(const std::string& message)
        : ForecastError("Config error: " + message) {}
};

} // namespace forecast

#endif // FORECAST_ERRORS_HPP
