/**
 * @file mixture_distribution.cpp
 * @brief Implementation of scenario-mixture CDFs
 */

#include "mixture_distribution.hpp"
#include "forecast_errors.hpp"
#include <algorithm>
#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/skew_normal.hpp>
#include <cmath>
#include <sstream>

namespace forecast {

namespace {

constexpr double MAX_ALPHA = 10.0;
constexpr double ALPHA_PER_SKEW = 5.0;

} // namespace

double normal_cdf(double z) {
    return boost::math::cdf(boost::math::normal_distribution<double>(), z);
}

ComponentFit fit_component(const MixtureComponent& component, bool use_lognormal) {
    if (!std::isfinite(component.mode) || !std::isfinite(component.p10) ||
        !std::isfinite(component.p90)) {
        throw ValidationError("component '" + component.scenario + "' has non-finite values");
    }
    if (component.p10 >= component.p90) {
        std::ostringstream msg;
        msg << "component '" << component.scenario << "': p10 (" << component.p10
            << ") must be less than p90 (" << component.p90 << ")";
        throw ValidationError(msg.str());
    }
    if (component.mode < component.p10 || component.mode > component.p90) {
        std::ostringstream msg;
        msg << "component '" << component.scenario << "': mode (" << component.mode
            << ") must be between p10 (" << component.p10 << ") and p90 ("
            << component.p90 << ")";
        throw ValidationError(msg.str());
    }

    ComponentFit fit;
    if (use_lognormal && component.p10 > 0.0) {
        double log_p10 = std::log(component.p10);
        double log_p90 = std::log(component.p90);
        fit.shape = ComponentShape::LOG_NORMAL;
        fit.location = 0.5 * (log_p10 + log_p90);
        fit.scale = (log_p90 - log_p10) / (2.0 * Z_90);
        return fit;
    }

    double width = component.p90 - component.p10;
    double midpoint = 0.5 * (component.p10 + component.p90);
    double skew_ratio = (component.mode - midpoint) / width;

    fit.location = component.mode;
    fit.scale = width / (2.0 * Z_90);
    if (std::abs(skew_ratio) < SYMMETRY_THRESHOLD) {
        fit.shape = ComponentShape::NORMAL;
    } else {
        fit.shape = ComponentShape::SKEW_NORMAL;
        fit.alpha = std::clamp(-ALPHA_PER_SKEW * skew_ratio, -MAX_ALPHA, MAX_ALPHA);
    }
    return fit;
}

double component_cdf(const ComponentFit& fit, double x) {
    switch (fit.shape) {
        case ComponentShape::NORMAL:
            return normal_cdf((x - fit.location) / fit.scale);
        case ComponentShape::SKEW_NORMAL: {
            boost::math::skew_normal_distribution<double> skew(fit.location, fit.scale, fit.alpha);
            return std::clamp(boost::math::cdf(skew, x), 0.0, 1.0);
        }
        case ComponentShape::LOG_NORMAL:
            if (x <= 0.0) {
                return 0.0;
            }
            return normal_cdf((std::log(x) - fit.location) / fit.scale);
    }
    return 0.0;
}

void validate_mixture(const std::vector<MixtureComponent>& components) {
    if (components.empty()) {
        throw ValidationError("at least one mixture component is required");
    }

    double total = 0.0;
    for (const auto& component : components) {
        if (!(component.weight >= 0.0 && component.weight <= 1.0)) {
            throw ValidationError("component '" + component.scenario + "' weight " +
                                  std::to_string(component.weight) + " outside [0,1]");
        }
        total += component.weight;
    }
    if (std::abs(total - 1.0) > WEIGHT_SUM_TOLERANCE) {
        throw ValidationError("component weights must sum to 1.0, got " + std::to_string(total));
    }
}

SynthesisReport synthesize_mixture(
    const std::vector<MixtureComponent>& components,
    const DistributionBounds& bounds,
    bool use_lognormal,
    const DistributionSynthesizer& synthesizer,
    const ForecastContext& ctx
) {
    DistributionSynthesizer::validate_bounds(bounds);
    if (!bounds.lower || !bounds.upper) {
        throw ValidationError("mixture synthesis requires both question bounds");
    }
    validate_mixture(components);

    std::vector<ComponentFit> fits;
    fits.reserve(components.size());
    double total_weight = 0.0;
    for (const auto& component : components) {
        fits.push_back(fit_component(component, use_lognormal));
        total_weight += component.weight;
    }

    const double lower = *bounds.lower;
    const double upper = *bounds.upper;
    const size_t n = bounds.outcome_count;

    std::vector<double> raw(n);
    for (size_t k = 0; k < n; ++k) {
        double location = static_cast<double>(k) / static_cast<double>(n - 1);
        double x = bounds.log_scale
            ? std::exp(std::log(lower) + location * (std::log(upper) - std::log(lower)))
            : lower + location * (upper - lower);

        double value = 0.0;
        for (size_t c = 0; c < fits.size(); ++c) {
            value += components[c].weight * component_cdf(fits[c], x);
        }
        raw[k] = value / total_weight;
    }

    return synthesizer.finalize(raw, bounds, ctx);
}

} // namespace forecast
