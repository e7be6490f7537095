/**
 * @file distribution_synthesizer.cpp
 * @brief Implementation of percentile-to-CDF synthesis
 */

#include "distribution_synthesizer.hpp"
#include "cdf_repair.hpp"
#include "forecast_errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace forecast {

namespace {

/**
 * @brief Local numerical failure; converted to the uniform fallback, never raised to callers
 */
class NumericalFailure : public ForecastError {
public:
    explicit NumericalFailure(const std::string& message)
        : ForecastError(message) {}
};

struct Knot {
    double t;   ///< Position in transformed space
    double p;   ///< Cumulative probability at t
};

double to_space(double value, bool log_scale) {
    return log_scale ? std::log(value) : value;
}

double from_space(double t, bool log_scale) {
    return log_scale ? std::exp(t) : t;
}

// F(t): 0 below the first knot, linear between knots, last p above the last knot
double evaluate(const std::vector<Knot>& knots, double t) {
    if (t < knots.front().t) {
        return 0.0;
    }
    if (t >= knots.back().t) {
        return knots.back().p;
    }
    auto upper = std::upper_bound(
        knots.begin(), knots.end(), t,
        [](double value, const Knot& knot) { return value < knot.t; });
    const Knot& hi = *upper;
    const Knot& lo = *(upper - 1);
    double w = (t - lo.t) / (hi.t - lo.t);
    return lo.p + w * (hi.p - lo.p);
}

} // namespace

DistributionSynthesizer::DistributionSynthesizer(
    const SynthesisPolicy& policy,
    Logger* logger
)
    : policy_(policy),
      logger_(logger ? logger : &Logger::get_instance()) {
    validate_policy(policy_);
}

void DistributionSynthesizer::validate_policy(const SynthesisPolicy& policy) {
    if (!(policy.min_gap_fraction > 0.0 && policy.min_gap_fraction < 1.0)) {
        throw ValidationError("min_gap_fraction must be in (0,1), got " +
                              std::to_string(policy.min_gap_fraction));
    }
    if (!(policy.tail_overshoot_fraction >= 0.0 && policy.tail_overshoot_fraction < 1.0)) {
        throw ValidationError("tail_overshoot_fraction must be in [0,1), got " +
                              std::to_string(policy.tail_overshoot_fraction));
    }
    if (!(policy.closed_bound_floor >= 0.0 && policy.closed_bound_floor < 0.5)) {
        throw ValidationError("closed_bound_floor must be in [0,0.5), got " +
                              std::to_string(policy.closed_bound_floor));
    }
    if (!(policy.open_bound_floor > 0.0 && policy.open_bound_floor < 0.5)) {
        throw ValidationError("open_bound_floor must be in (0,0.5), got " +
                              std::to_string(policy.open_bound_floor));
    }
    if (!(policy.max_bucket_mass >= 0.0 && policy.max_bucket_mass <= 1.0)) {
        throw ValidationError("max_bucket_mass must be in [0,1], got " +
                              std::to_string(policy.max_bucket_mass));
    }
}

void DistributionSynthesizer::validate_bounds(const DistributionBounds& bounds) {
    if (bounds.outcome_count < 2 || bounds.outcome_count > MAX_OUTCOME_COUNT) {
        throw ValidationError("outcome_count must be in [2," + std::to_string(MAX_OUTCOME_COUNT) +
                              "], got " + std::to_string(bounds.outcome_count));
    }
    if (bounds.lower && !std::isfinite(*bounds.lower)) {
        throw ValidationError("lower bound is not finite");
    }
    if (bounds.upper && !std::isfinite(*bounds.upper)) {
        throw ValidationError("upper bound is not finite");
    }
    if (bounds.lower && bounds.upper && *bounds.lower >= *bounds.upper) {
        std::ostringstream msg;
        msg << "lower bound " << *bounds.lower << " must be below upper bound " << *bounds.upper;
        throw ValidationError(msg.str());
    }
    if (bounds.log_scale) {
        if ((bounds.lower && *bounds.lower <= 0.0) || (bounds.upper && *bounds.upper <= 0.0)) {
            throw ValidationError("log-scale bounds must be positive");
        }
    }
}

double DistributionSynthesizer::min_gap(size_t outcome_count) const {
    return minimum_gap(outcome_count, policy_.min_gap_fraction);
}

ContinuousCDF DistributionSynthesizer::synthesize(
    const std::vector<PercentileEstimate>& estimates,
    const DistributionBounds& bounds
) const {
    return synthesize_report(estimates, bounds).cdf;
}

SynthesisReport DistributionSynthesizer::synthesize_report(
    const std::vector<PercentileEstimate>& estimates,
    const DistributionBounds& bounds,
    const ForecastContext& ctx
) const {
    validate_bounds(bounds);
    validate_estimates(estimates, bounds);

    double domain_lower = 0.0;
    double domain_upper = 0.0;
    std::vector<double> raw;
    try {
        raw = discretize(estimates, bounds, domain_lower, domain_upper);
    } catch (const NumericalFailure& e) {
        return fallback_report(bounds, e.what(), ctx);
    }

    SynthesisReport report = finalize(raw, bounds, ctx);
    if (!report.degraded) {
        report.domain_lower = domain_lower;
        report.domain_upper = domain_upper;
    }
    return report;
}

void DistributionSynthesizer::validate_estimates(
    const std::vector<PercentileEstimate>& estimates,
    const DistributionBounds& bounds
) const {
    if (estimates.size() < 2) {
        throw ValidationError("at least 2 percentile estimates required, got " +
                              std::to_string(estimates.size()));
    }

    for (size_t i = 0; i < estimates.size(); ++i) {
        const PercentileEstimate& e = estimates[i];
        if (!std::isfinite(e.percentile) || !std::isfinite(e.value)) {
            throw ValidationError("estimate " + std::to_string(i) + " is not finite");
        }
        if (e.percentile <= 0.0 || e.percentile >= 1.0) {
            throw ValidationError("percentile " + std::to_string(e.percentile) +
                                  " outside (0,1)");
        }
        if (i > 0) {
            if (e.percentile <= estimates[i - 1].percentile) {
                throw ValidationError("percentiles must be strictly increasing at index " +
                                      std::to_string(i));
            }
            if (e.value <= estimates[i - 1].value) {
                std::ostringstream msg;
                msg << "values must be strictly increasing: " << estimates[i - 1].value
                    << " at p" << estimates[i - 1].percentile * 100 << " then " << e.value
                    << " at p" << e.percentile * 100;
                throw ValidationError(msg.str());
            }
        }
        if (bounds.lower && !bounds.lower_open && e.value < *bounds.lower) {
            std::ostringstream msg;
            msg << "value " << e.value << " below closed lower bound " << *bounds.lower;
            throw ValidationError(msg.str());
        }
        if (bounds.upper && !bounds.upper_open && e.value > *bounds.upper) {
            std::ostringstream msg;
            msg << "value " << e.value << " above closed upper bound " << *bounds.upper;
            throw ValidationError(msg.str());
        }
        if (bounds.log_scale && e.value <= 0.0) {
            throw ValidationError("log-scale value must be positive, got " +
                                  std::to_string(e.value));
        }
    }
}

std::vector<double> DistributionSynthesizer::discretize(
    const std::vector<PercentileEstimate>& estimates,
    const DistributionBounds& bounds,
    double& domain_lower,
    double& domain_upper
) const {
    const bool log_scale = bounds.log_scale;

    std::vector<Knot> inner;
    inner.reserve(estimates.size());
    for (const auto& e : estimates) {
        Knot knot{to_space(e.value, log_scale), e.percentile};
        if (!std::isfinite(knot.t)) {
            throw NumericalFailure("non-finite transformed value");
        }
        if (!inner.empty() && knot.t <= inner.back().t) {
            throw NumericalFailure("duplicate transformed values");
        }
        inner.push_back(knot);
    }

    // Tail slopes (value per unit probability) from the outermost segments
    const Knot& first = inner.front();
    const Knot& second = inner[1];
    const Knot& last = inner.back();
    const Knot& penultimate = inner[inner.size() - 2];
    double slope_left = (second.t - first.t) / (second.p - first.p);
    double slope_right = (last.t - penultimate.t) / (last.p - penultimate.p);

    double natural_lower = first.t - slope_left * first.p;
    double natural_upper = last.t + slope_right * (1.0 - last.p);

    double a = bounds.lower ? to_space(*bounds.lower, log_scale) : natural_lower;
    double b = bounds.upper ? to_space(*bounds.upper, log_scale) : natural_upper;
    if (!std::isfinite(a) || !std::isfinite(b) || !(b > a)) {
        throw NumericalFailure("zero-width domain");
    }

    double overshoot = policy_.tail_overshoot_fraction * (b - a);
    bool lower_closed = bounds.lower && !bounds.lower_open;
    bool upper_closed = bounds.upper && !bounds.upper_open;
    double lower_limit = !bounds.lower ? natural_lower : (lower_closed ? a : a - overshoot);
    double upper_limit = !bounds.upper ? natural_upper : (upper_closed ? b : b + overshoot);

    std::vector<Knot> knots;
    knots.reserve(inner.size() + 2);

    // Mass the tail line would place past the limit collects as an atom at the limit
    if (natural_lower >= lower_limit) {
        knots.push_back({natural_lower, 0.0});
    } else if (first.t > lower_limit) {
        knots.push_back({lower_limit, first.p - (first.t - lower_limit) / slope_left});
    }
    knots.insert(knots.end(), inner.begin(), inner.end());
    if (natural_upper <= upper_limit) {
        knots.push_back({natural_upper, 1.0});
    } else if (last.t < upper_limit) {
        knots.push_back({upper_limit, last.p + (upper_limit - last.t) / slope_right});
    }

    for (size_t i = 1; i < knots.size(); ++i) {
        if (!std::isfinite(knots[i].t) || !std::isfinite(knots[i].p) ||
            !(knots[i].t > knots[i - 1].t)) {
            throw NumericalFailure("degenerate interpolation knots");
        }
    }

    const size_t n = bounds.outcome_count;
    const double step = (b - a) / static_cast<double>(n - 1);
    std::vector<double> raw(n);
    for (size_t k = 0; k < n; ++k) {
        double t = k + 1 == n ? b : a + step * static_cast<double>(k);
        raw[k] = std::clamp(evaluate(knots, t), 0.0, 1.0);
    }

    domain_lower = from_space(a, log_scale);
    domain_upper = from_space(b, log_scale);
    return raw;
}

SynthesisReport DistributionSynthesizer::finalize(
    const std::vector<double>& raw,
    const DistributionBounds& bounds,
    const ForecastContext& ctx
) const {
    const size_t n = bounds.outcome_count;
    if (raw.size() != n) {
        return fallback_report(bounds, "raw CDF has " + std::to_string(raw.size()) +
                               " points, expected " + std::to_string(n), ctx);
    }

    const bool lower_open = bounds.lower_open || !bounds.lower;
    const bool upper_open = bounds.upper_open || !bounds.upper;
    const double gap = min_gap(n);

    std::vector<double> values;
    try {
        values = anchor_endpoints(raw, lower_open, upper_open,
                                  policy_.closed_bound_floor, policy_.open_bound_floor);
        if (policy_.enable_mass_cap) {
            double cap = policy_.max_bucket_mass > 0.0
                ? policy_.max_bucket_mass
                : default_bucket_mass_cap(n);
            values = cap_bucket_mass(values, cap);
        }
        values = enforce_minimum_gap(values, gap);
    } catch (const ValidationError& e) {
        return fallback_report(bounds, e.what(), ctx);
    }

    std::vector<std::string> violations = validate_cdf(values, gap, n);
    if (!violations.empty()) {
        return fallback_report(bounds, violations.front(), ctx);
    }

    SynthesisReport report;
    report.cdf = ContinuousCDF(std::move(values));
    report.domain_lower = bounds.lower.value_or(0.0);
    report.domain_upper = bounds.upper.value_or(0.0);
    logger_->log_synthesis(ctx, n, false, "");
    return report;
}

ContinuousCDF DistributionSynthesizer::uniform_fallback(const DistributionBounds& bounds) const {
    const size_t n = std::max<size_t>(bounds.outcome_count, 2);
    const bool lower_open = bounds.lower_open || !bounds.lower;
    const bool upper_open = bounds.upper_open || !bounds.upper;

    double start = lower_open ? policy_.open_bound_floor : policy_.closed_bound_floor;
    double end = upper_open ? 1.0 - policy_.open_bound_floor : 1.0 - policy_.closed_bound_floor;

    std::vector<double> values(n);
    for (size_t k = 0; k < n; ++k) {
        values[k] = start + (end - start) * static_cast<double>(k) / static_cast<double>(n - 1);
    }
    values.back() = end;
    return ContinuousCDF(std::move(values), true);
}

SynthesisReport DistributionSynthesizer::fallback_report(
    const DistributionBounds& bounds,
    const std::string& reason,
    const ForecastContext& ctx
) const {
    SynthesisReport report;
    report.cdf = uniform_fallback(bounds);
    report.degraded = true;
    report.fallback_reason = reason;
    report.domain_lower = bounds.lower.value_or(0.0);
    report.domain_upper = bounds.upper.value_or(0.0);
    logger_->log_synthesis(ctx, report.cdf.size(), true, reason);
    return report;
}

} // namespace forecast
