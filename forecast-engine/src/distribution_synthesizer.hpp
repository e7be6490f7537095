/**
 * @file distribution_synthesizer.hpp
 * @brief Converts sparse percentile estimates into a submittable CDF
 *
 * The DistributionSynthesizer handles:
 * - Validation of percentile estimates against question bounds
 * - Piecewise-linear interpolation in value (or log-value) space
 * - Tail extrapolation, clamped at closed bounds, limited overshoot at open ones
 * - Discretization to exactly outcome_count points
 * - Endpoint anchoring, bucket mass capping and minimum-gap repair
 *
 * Malformed input raises ValidationError. Internal numerical failures
 * never raise: they produce a uniform distribution marked degraded, so the
 * caller can always submit something.
 */

#ifndef FORECAST_DISTRIBUTION_SYNTHESIZER_HPP
#define FORECAST_DISTRIBUTION_SYNTHESIZER_HPP

#include "forecast_types.hpp"
#include "logger.hpp"
#include <string>
#include <vector>

namespace forecast {

/**
 * @brief Policy constants for CDF synthesis
 */
struct SynthesisPolicy {
    double min_gap_fraction;          ///< Minimum gap as a share of 1/(outcome_count - 1) (default: 0.01)
    double tail_overshoot_fraction;   ///< Open-side tail extension as a share of domain width (default: 0.1)
    double closed_bound_floor;        ///< First value at a closed lower bound; last is 1 - this (default: 1e-6)
    double open_bound_floor;          ///< Minimum tail mass kept at an open end (default: 0.001)
    bool enable_mass_cap;             ///< Limit the mass of any single bucket (default: true)
    double max_bucket_mass;           ///< Cap per bucket; 0 selects default_bucket_mass_cap()

    SynthesisPolicy()
        : min_gap_fraction(0.01),
          tail_overshoot_fraction(0.1),
          closed_bound_floor(1e-6),
          open_bound_floor(0.001),
          enable_mass_cap(true),
          max_bucket_mass(0.0) {}
};

/**
 * @brief CDF plus diagnostics of how it was produced
 */
struct SynthesisReport {
    ContinuousCDF cdf;
    bool degraded;                 ///< Uniform fallback was used
    std::string fallback_reason;   ///< Why the fallback was used
    double domain_lower;           ///< Value at the first CDF point (value units)
    double domain_upper;           ///< Value at the last CDF point (value units)

    SynthesisReport() : degraded(false), domain_lower(0.0), domain_upper(0.0) {}
};

/**
 * @brief Turns percentile estimates into a validated ContinuousCDF
 *
 * Pure and synchronous; a single instance may be shared between threads.
 *
 * Usage Example:
 *   @code
 *   DistributionBounds bounds(0.0, 100.0);
 *   std::vector<PercentileEstimate> estimates = {{0.1, 20.0}, {0.5, 50.0}, {0.9, 80.0}};
 *
 *   DistributionSynthesizer synthesizer;
 *   ContinuousCDF cdf = synthesizer.synthesize(estimates, bounds);  // 201 points
 *   @endcode
 */
class DistributionSynthesizer {
public:
    /**
     * @param policy Synthesis policy constants
     * @param logger Logger instance (optional, uses default if nullptr)
     *
     * @throws ValidationError If the policy constants are out of range
     */
    explicit DistributionSynthesizer(
        const SynthesisPolicy& policy = SynthesisPolicy(),
        Logger* logger = nullptr
    );

    /**
     * @brief Synthesize a CDF from percentile estimates
     *
     * @param estimates Percentile estimates ordered by percentile
     * @param bounds Question bounds and resolution
     * @return CDF of exactly bounds.outcome_count points (degraded on numerical failure)
     *
     * @throws ValidationError If the estimates or bounds are malformed
     */
    ContinuousCDF synthesize(
        const std::vector<PercentileEstimate>& estimates,
        const DistributionBounds& bounds
    ) const;

    /**
     * @brief Synthesize and report how the CDF was produced
     */
    SynthesisReport synthesize_report(
        const std::vector<PercentileEstimate>& estimates,
        const DistributionBounds& bounds,
        const ForecastContext& ctx = ForecastContext()
    ) const;

    /**
     * @brief Anchor, cap and repair a raw discretized CDF
     *
     * Shared with mixture synthesis. Falls back to uniform (degraded) if
     * the raw sequence cannot be repaired.
     */
    SynthesisReport finalize(
        const std::vector<double>& raw,
        const DistributionBounds& bounds,
        const ForecastContext& ctx = ForecastContext()
    ) const;

    /**
     * @brief Uniform CDF across the effective bounds, marked degraded
     */
    ContinuousCDF uniform_fallback(const DistributionBounds& bounds) const;

    /**
     * @brief Minimum gap this policy enforces for a given resolution
     */
    double min_gap(size_t outcome_count) const;

    const SynthesisPolicy& policy() const { return policy_; }

    /**
     * @throws ValidationError If any policy constant is out of range
     */
    static void validate_policy(const SynthesisPolicy& policy);

    /**
     * @throws ValidationError If the bounds are malformed
     */
    static void validate_bounds(const DistributionBounds& bounds);

private:
    SynthesisPolicy policy_;
    Logger* logger_;

    void validate_estimates(
        const std::vector<PercentileEstimate>& estimates,
        const DistributionBounds& bounds
    ) const;

    std::vector<double> discretize(
        const std::vector<PercentileEstimate>& estimates,
        const DistributionBounds& bounds,
        double& domain_lower,
        double& domain_upper
    ) const;

    SynthesisReport fallback_report(
        const DistributionBounds& bounds,
        const std::string& reason,
        const ForecastContext& ctx
    ) const;
};

} // namespace forecast

#endif // FORECAST_DISTRIBUTION_SYNTHESIZER_HPP
