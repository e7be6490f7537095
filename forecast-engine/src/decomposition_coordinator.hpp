/**
 * @file decomposition_coordinator.hpp
 * @brief Bounded, concurrent fan-out of sub-questions
 *
 * The DecompositionCoordinator handles:
 * - Depth enforcement before any scheduling (RecursionLimitExceeded)
 * - Parallel execution of sub-forecast units on a bounded worker pool
 * - Per-unit timeouts that never affect sibling units
 * - Cooperative cancellation with a bounded grace period
 * - Collection of PartialResults in request order
 *
 * Design Pattern: Fan-out/fan-in over an injected spawn callback. The
 * callback performs the actual forecasting (LLM, research, nested
 * decomposition) and is the only part that blocks.
 */

#ifndef FORECAST_DECOMPOSITION_COORDINATOR_HPP
#define FORECAST_DECOMPOSITION_COORDINATOR_HPP

#include "cancellation_token.hpp"
#include "forecast_types.hpp"
#include "logger.hpp"
#include "sub_forecast_aggregator.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <vector>

namespace forecast {

/**
 * @brief Coordinator configuration
 */
struct CoordinatorConfig {
    size_t max_workers;                       ///< Fan-out cap per decomposition (default: 4)
    std::chrono::milliseconds unit_timeout;   ///< Time budget of one unit (default: 120 s)
    std::chrono::milliseconds cancel_grace;   ///< Wait for cancelled units before giving up (default: 2 s)
    size_t max_depth;                         ///< Depth budget of the root guard (default: 1)

    CoordinatorConfig()
        : max_workers(4),
          unit_timeout(std::chrono::milliseconds(120000)),
          cancel_grace(std::chrono::milliseconds(2000)),
          max_depth(1) {}
};

/**
 * @brief Everything a unit needs besides its sub-question
 */
struct UnitContext {
    RecursionGuard guard;                            ///< Guard for a nested decomposition
    CancellationToken cancel;                        ///< Set when the unit should stop
    std::chrono::steady_clock::time_point deadline;  ///< Unit is timed out after this point
    std::string parent_question_id;

    UnitContext() : deadline(std::chrono::steady_clock::time_point::max()) {}
};

/**
 * @brief Forecasts one sub-question
 *
 * Returns a PartialResult, or throws: TimeoutFailure maps to TIMED_OUT,
 * any other exception to FAILED with its message preserved.
 */
using SpawnFunction = std::function<PartialResult(const SubQuestion&, const UnitContext&)>;

/**
 * @brief Unit outcome counters across decompositions
 */
struct CoordinatorStats {
    size_t decompositions;
    size_t rejected_count;     ///< Requests refused by the depth guard
    size_t ok_count;
    size_t timed_out_count;
    size_t failed_count;
    size_t cancelled_count;    ///< Subset of failed_count
    size_t detached_threads;
    double total_elapsed_ms;

    CoordinatorStats()
        : decompositions(0), rejected_count(0), ok_count(0), timed_out_count(0),
          failed_count(0), cancelled_count(0), detached_threads(0), total_elapsed_ms(0.0) {}
};

/**
 * @brief Runs sub-questions in parallel under depth, fan-out and time bounds
 *
 * Usage Example:
 *   @code
 *   CoordinatorConfig config;
 *   config.max_workers = 3;
 *   config.unit_timeout = std::chrono::seconds(60);
 *
 *   DecompositionCoordinator coordinator(config);
 *
 *   Question question("q-42", QuestionKind::BINARY);
 *   question.sub_questions = {
 *       SubQuestion("a", QuestionKind::BINARY, 0.5),
 *       SubQuestion("b", QuestionKind::BINARY, 0.5)
 *   };
 *
 *   auto spawn = [](const SubQuestion& sq, const UnitContext& ctx) {
 *       return PartialResult::ok(sq.id, ask_forecaster(sq, ctx.cancel));
 *   };
 *
 *   std::vector<PartialResult> results =
 *       coordinator.decompose(question, coordinator.root_guard(), spawn);
 *   @endcode
 */
class DecompositionCoordinator {
public:
    /**
     * @throws ValidationError If the configuration is out of range
     */
    explicit DecompositionCoordinator(
        const CoordinatorConfig& config = CoordinatorConfig(),
        Logger* logger = nullptr
    );

    /**
     * @brief Fan out all sub-questions and collect their results
     *
     * @param question Question whose sub_questions are forecast
     * @param guard Depth budget of @p question
     * @param spawn Unit callback
     * @param cancel Parent cancellation token
     * @return One PartialResult per sub-question, in request order
     *
     * @throws RecursionLimitExceeded If guard.current_depth >= guard.max_depth (spawn is never called)
     * @throws ValidationError If the sub-question list is empty, ids repeat, or a weight is negative
     */
    std::vector<PartialResult> decompose(
        const Question& question,
        const RecursionGuard& guard,
        const SpawnFunction& spawn,
        const CancellationToken& cancel = CancellationToken()
    );

    /**
     * @brief decompose() followed by aggregation over question.kind
     *
     * @throws AggregationError If every unit failed or timed out
     */
    AggregateForecast decompose_and_aggregate(
        const Question& question,
        const RecursionGuard& guard,
        const SpawnFunction& spawn,
        const SubForecastAggregator& aggregator,
        const CancellationToken& cancel = CancellationToken()
    );

    /**
     * @brief Guard for a top-level question under this configuration
     */
    RecursionGuard root_guard() const { return RecursionGuard(0, config_.max_depth); }

    const CoordinatorConfig& config() const { return config_; }

    CoordinatorStats get_stats() const;
    void reset_stats();

private:
    CoordinatorConfig config_;
    Logger* logger_;

    mutable std::mutex stats_mutex_;
    CoordinatorStats stats_;

    void validate_request(const Question& question) const;
    void record(const std::vector<PartialResult>& results, size_t detached, double elapsed_ms);
};

} // namespace forecast

#endif // FORECAST_DECOMPOSITION_COORDINATOR_HPP
