/**
 * @file mixture_distribution.hpp
 * @brief Scenario-mixture CDFs for numeric questions
 *
 * Each scenario is described by its mode and 10th/90th percentiles and is
 * modelled as a normal, skew-normal or log-normal distribution. The
 * weighted mixture is evaluated on the question grid and finished with the
 * same anchoring and repair as percentile synthesis.
 */

#ifndef FORECAST_MIXTURE_DISTRIBUTION_HPP
#define FORECAST_MIXTURE_DISTRIBUTION_HPP

#include "distribution_synthesizer.hpp"
#include "forecast_types.hpp"
#include <string>
#include <vector>

namespace forecast {

/**
 * @brief One scenario of a mixture forecast
 */
struct MixtureComponent {
    std::string scenario;   ///< Scenario label ("Base case", "Upside", ...)
    double mode;            ///< Most likely value
    double p10;             ///< 10th percentile
    double p90;             ///< 90th percentile
    double weight;          ///< Mixture weight in [0,1]

    MixtureComponent() : mode(0.0), p10(0.0), p90(0.0), weight(0.0) {}
    MixtureComponent(const std::string& scenario_, double mode_, double p10_, double p90_, double weight_)
        : scenario(scenario_), mode(mode_), p10(p10_), p90(p90_), weight(weight_) {}
};

/**
 * @brief Shape chosen for a component
 */
enum class ComponentShape {
    NORMAL,
    SKEW_NORMAL,
    LOG_NORMAL
};

inline std::string shape_to_string(ComponentShape shape) {
    switch (shape) {
        case ComponentShape::NORMAL: return "NORMAL";
        case ComponentShape::SKEW_NORMAL: return "SKEW_NORMAL";
        case ComponentShape::LOG_NORMAL: return "LOG_NORMAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Fitted parameters of one component
 */
struct ComponentFit {
    ComponentShape shape;
    double location;   ///< Normal/skew-normal location, or log-normal mu
    double scale;      ///< Normal/skew-normal scale, or log-normal sigma
    double alpha;      ///< Skew-normal shape (0 otherwise)

    ComponentFit() : shape(ComponentShape::NORMAL), location(0.0), scale(1.0), alpha(0.0) {}
};

/// Standard normal 90th percentile
constexpr double Z_90 = 1.2815515655446004;

/// Mode offset (as a share of p90 - p10) below which a component is treated as symmetric
constexpr double SYMMETRY_THRESHOLD = 0.1;

/// Tolerance on the sum of mixture weights
constexpr double WEIGHT_SUM_TOLERANCE = 0.01;

/**
 * @brief Fit a single component
 *
 * @throws ValidationError If p10 >= p90 or the mode lies outside [p10, p90]
 */
ComponentFit fit_component(const MixtureComponent& component, bool use_lognormal);

/**
 * @brief CDF of a fitted component at @p x
 */
double component_cdf(const ComponentFit& fit, double x);

/**
 * @brief Standard normal CDF
 */
double normal_cdf(double z);

/**
 * @brief Check component shapes and weights
 *
 * @throws ValidationError If the list is empty, a component is malformed,
 *         a weight lies outside [0,1], or weights do not sum to 1 +/- 0.01
 */
void validate_mixture(const std::vector<MixtureComponent>& components);

/**
 * @brief Build a CDF from a scenario mixture
 *
 * Both bounds are required. Under bounds.log_scale the grid is log-spaced.
 *
 * @param components Mixture scenarios
 * @param bounds Question bounds (lower and upper must be set)
 * @param use_lognormal Model components with positive p10 as log-normal
 * @param synthesizer Supplies policy and post-processing
 * @param ctx Log context
 * @return Report with a CDF of bounds.outcome_count points (degraded on numerical failure)
 *
 * @throws ValidationError If components or bounds are malformed
 */
SynthesisReport synthesize_mixture(
    const std::vector<MixtureComponent>& components,
    const DistributionBounds& bounds,
    bool use_lognormal,
    const DistributionSynthesizer& synthesizer,
    const ForecastContext& ctx = ForecastContext()
);

} // namespace forecast

#endif // FORECAST_MIXTURE_DISTRIBUTION_HPP
