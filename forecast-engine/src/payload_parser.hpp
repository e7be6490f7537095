/**
 * @file payload_parser.hpp
 * @brief Validation of agent JSON at the engine boundary
 *
 * Forecasting agents answer with loosely structured JSON. These functions
 * turn it into typed values (or raise ValidationError) before anything
 * reaches synthesis or aggregation, and render the final AggregateForecast
 * for the submission layer.
 */

#ifndef FORECAST_PAYLOAD_PARSER_HPP
#define FORECAST_PAYLOAD_PARSER_HPP

#include "distribution_synthesizer.hpp"
#include "forecast_types.hpp"
#include "mixture_distribution.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <variant>
#include <vector>

namespace forecast {

struct BinaryPayload {
    double probability;

    BinaryPayload() : probability(0.5) {}
};

struct NumericPayload {
    std::vector<PercentileEstimate> percentiles;   ///< Sorted by percentile
};

struct MixturePayload {
    std::vector<MixtureComponent> components;
    bool use_lognormal;

    MixturePayload() : use_lognormal(false) {}
};

struct CategoricalPayload {
    CategoricalDistribution probabilities;
};

/**
 * @brief One agent answer, tagged by shape
 */
using ForecastPayload = std::variant<BinaryPayload, NumericPayload, MixturePayload, CategoricalPayload>;

/// Tolerance on the sum of explicit sub-question weights
constexpr double SUB_QUESTION_WEIGHT_TOLERANCE = 0.01;

/**
 * @brief Parse percentile estimates
 *
 * Accepts an array of {"percentile": p, "value": v} (p as a fraction, or as
 * a percentage when above 1) or an object keyed by percentage
 * ({"10": 20, "50": 50, "90": 80}).
 *
 * @return Estimates sorted by percentile
 * @throws ValidationError On any other shape or a duplicate percentile
 */
std::vector<PercentileEstimate> parse_percentiles(const nlohmann::json& j);

/**
 * @brief Parse question bounds
 *
 * Keys: lower / lower_bound, upper / upper_bound, lower_open /
 * open_lower_bound, upper_open / open_upper_bound, log_scale,
 * outcome_count / cdf_size.
 *
 * @throws ValidationError On wrong types or malformed bounds
 */
DistributionBounds parse_bounds(
    const nlohmann::json& j,
    size_t default_outcome_count = DEFAULT_OUTCOME_COUNT
);

/**
 * @brief Parse proposed sub-questions
 *
 * A missing id becomes "sq_<index>", a missing kind is binary. When every
 * sub-question carries a weight the weights must sum to 1 +/- 0.01.
 *
 * @throws ValidationError On malformed entries
 */
std::vector<SubQuestion> parse_sub_questions(
    const nlohmann::json& j,
    size_t default_outcome_count = DEFAULT_OUTCOME_COUNT
);

/**
 * @brief Parse one agent answer for a question of the given kind
 *
 * Binary: {"probability": p} or a bare number.
 * Numeric: {"percentiles": ...} or {"components": [...], "use_lognormal": b}.
 * Categorical: {"probabilities": {"A": 0.4, ...}}.
 *
 * @throws ValidationError If the shape does not match @p kind
 */
ForecastPayload parse_forecast_payload(const nlohmann::json& j, QuestionKind kind);

/**
 * @brief Convert a payload to a ForecastValue
 *
 * Numeric payloads are synthesized into a CDF and need @p bounds.
 * Categorical probabilities are normalized to sum to 1.
 *
 * @throws ValidationError On malformed payloads or missing bounds
 */
ForecastValue to_forecast_value(
    const ForecastPayload& payload,
    const std::optional<DistributionBounds>& bounds,
    const DistributionSynthesizer& synthesizer,
    const ForecastContext& ctx = ForecastContext()
);

/**
 * @brief Parse and convert an agent answer for a sub-question
 *
 * Validation problems become a FAILED result with ErrorKind::VALIDATION
 * rather than an exception, so a spawn callback can return it directly.
 */
PartialResult payload_to_result(
    const SubQuestion& sub_question,
    const nlohmann::json& j,
    const DistributionSynthesizer& synthesizer
);

/**
 * @brief Hand-off document for the submission layer
 */
nlohmann::json aggregate_to_json(const AggregateForecast& forecast);

} // namespace forecast

#endif // FORECAST_PAYLOAD_PARSER_HPP
