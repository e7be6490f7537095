/**
 * @file external_executor.hpp
 * @brief Interface for the rate-limited external call primitive
 *
 * Spawn callbacks reach LLM agents, research tools and market data through
 * an executor that owns rate limiting, retries and caching. This library
 * only consumes the interface: it never retries, and it relies on the
 * executor to honor the deadline and to distinguish a timeout
 * (TimeoutFailure) from a hard failure (ExternalCallError).
 */

#ifndef FORECAST_EXTERNAL_EXECUTOR_HPP
#define FORECAST_EXTERNAL_EXECUTOR_HPP

#include "cancellation_token.hpp"
#include <chrono>
#include <map>
#include <string>

namespace forecast {

/**
 * @brief One external request
 */
struct ExternalCall {
    std::string operation;                          ///< Tool or endpoint name
    std::string payload;                            ///< Request body (usually JSON)
    std::map<std::string, std::string> metadata;    ///< Free-form tags (question id, depth, ...)
    std::chrono::steady_clock::time_point deadline; ///< Call must finish before this point

    ExternalCall() : deadline(std::chrono::steady_clock::time_point::max()) {}
    ExternalCall(const std::string& operation_, const std::string& payload_)
        : operation(operation_), payload(payload_),
          deadline(std::chrono::steady_clock::time_point::max()) {}
};

/**
 * @brief Response of a successful external request
 */
struct ExternalCallResult {
    std::string payload;   ///< Response body
    bool cache_hit;        ///< Served from the executor's cache
    int attempts;          ///< Attempts the executor made, including retries

    ExternalCallResult() : cache_hit(false), attempts(1) {}
};

/**
 * @brief Abstract rate-limited, retrying, cache-aware executor
 *
 * Implementations must be thread-safe; units on different worker threads
 * call them concurrently.
 */
class IRateLimitedExecutor {
public:
    virtual ~IRateLimitedExecutor() = default;

    /**
     * @brief Perform a call
     *
     * @param call Request with its deadline
     * @param cancel Token of the requesting unit; implementations should stop early once it is set
     * @return Response
     *
     * @throws TimeoutFailure If the deadline passes or the call is cancelled
     * @throws ExternalCallError For unrecoverable failures after retries
     */
    virtual ExternalCallResult call(const ExternalCall& call, const CancellationToken& cancel) = 0;
};

} // namespace forecast

#endif // FORECAST_EXTERNAL_EXECUTOR_HPP
