/**
 * @file sub_forecast_aggregator.hpp
 * @brief Combines sub-forecast results into one AggregateForecast
 *
 * Only OK results contribute. Their weights are renormalized over the OK
 * subset, so failed and timed-out branches leave the denominator instead of
 * counting as zero. Degraded markers propagate to the aggregate.
 */

#ifndef FORECAST_SUB_FORECAST_AGGREGATOR_HPP
#define FORECAST_SUB_FORECAST_AGGREGATOR_HPP

#include "forecast_types.hpp"
#include "logger.hpp"
#include <string>
#include <vector>

namespace forecast {

/**
 * @brief How binary probabilities are combined
 */
enum class BinaryAggregation {
    WEIGHTED_AVERAGE,   ///< Sum of w_i * p_i
    GEOMETRIC_MEAN,     ///< exp(sum of w_i * ln p_i)
    MEDIAN              ///< Unweighted median
};

inline std::string aggregation_to_string(BinaryAggregation method) {
    switch (method) {
        case BinaryAggregation::WEIGHTED_AVERAGE: return "weighted_average";
        case BinaryAggregation::GEOMETRIC_MEAN: return "geometric_mean";
        case BinaryAggregation::MEDIAN: return "median";
        default: return "unknown";
    }
}

/**
 * @brief Parse an aggregation method name
 *
 * @throws ValidationError If the name is not recognized
 */
BinaryAggregation string_to_aggregation(const std::string& name);

/**
 * @brief Aggregator configuration
 */
struct AggregatorConfig {
    BinaryAggregation method;        ///< Binary combination rule (default: weighted average)
    double probability_floor;        ///< Binary output clamped to [floor, 1 - floor] (default: 0.001)
    double categorical_tolerance;    ///< Allowed deviation of category sum from 1 (default: 1e-6)
    double min_gap_fraction;         ///< Minimum CDF gap share used when repairing numeric aggregates

    AggregatorConfig()
        : method(BinaryAggregation::WEIGHTED_AVERAGE),
          probability_floor(0.001),
          categorical_tolerance(1e-6),
          min_gap_fraction(0.01) {}
};

/**
 * @brief Pure, synchronous aggregation of PartialResults
 *
 * Usage Example:
 *   @code
 *   std::vector<PartialResult> results = {
 *       PartialResult::ok("a", 0.3),
 *       PartialResult::timed_out("b", "unit exceeded 30000 ms"),
 *       PartialResult::ok("c", 0.7)
 *   };
 *
 *   SubForecastAggregator aggregator;
 *   AggregateForecast forecast = aggregator.aggregate(results, QuestionKind::BINARY);
 *   // forecast.probability() == 0.5, forecast.excluded_count == 1
 *   @endcode
 */
class SubForecastAggregator {
public:
    /**
     * @throws ValidationError If the configuration is out of range
     */
    explicit SubForecastAggregator(
        const AggregatorConfig& config = AggregatorConfig(),
        Logger* logger = nullptr
    );

    /**
     * @brief Aggregate results for a question of the given kind
     *
     * @param results Results in request order
     * @param kind Kind of the parent question
     * @param ctx Log context
     * @return Combined forecast
     *
     * @throws AggregationError If no result is OK
     * @throws ValidationError If an OK value does not match @p kind, CDF
     *         lengths differ, or weights are negative or all zero
     */
    AggregateForecast aggregate(
        const std::vector<PartialResult>& results,
        QuestionKind kind,
        const ForecastContext& ctx = ForecastContext()
    ) const;

    const AggregatorConfig& config() const { return config_; }

private:
    AggregatorConfig config_;
    Logger* logger_;

    std::vector<double> normalized_weights(const std::vector<const PartialResult*>& ok) const;

    double aggregate_binary(
        const std::vector<const PartialResult*>& ok,
        const std::vector<double>& weights
    ) const;

    ContinuousCDF aggregate_numeric(
        const std::vector<const PartialResult*>& ok,
        const std::vector<double>& weights
    ) const;

    CategoricalDistribution aggregate_categorical(
        const std::vector<const PartialResult*>& ok,
        const std::vector<double>& weights,
        std::vector<std::string>& warnings
    ) const;
};

} // namespace forecast

#endif // FORECAST_SUB_FORECAST_AGGREGATOR_HPP
