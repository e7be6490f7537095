/**
 * @file sub_forecast_aggregator.cpp
 * @brief Implementation of sub-forecast aggregation
 */

#include "sub_forecast_aggregator.hpp"
#include "cdf_repair.hpp"
#include "forecast_errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace forecast {

BinaryAggregation string_to_aggregation(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "weighted_average") return BinaryAggregation::WEIGHTED_AVERAGE;
    if (lower == "geometric_mean") return BinaryAggregation::GEOMETRIC_MEAN;
    if (lower == "median") return BinaryAggregation::MEDIAN;
    throw ValidationError("unknown aggregation method: " + name);
}

SubForecastAggregator::SubForecastAggregator(
    const AggregatorConfig& config,
    Logger* logger
)
    : config_(config),
      logger_(logger ? logger : &Logger::get_instance()) {
    if (!(config_.probability_floor > 0.0 && config_.probability_floor < 0.5)) {
        throw ValidationError("probability_floor must be in (0,0.5), got " +
                              std::to_string(config_.probability_floor));
    }
    if (!(config_.categorical_tolerance > 0.0)) {
        throw ValidationError("categorical_tolerance must be positive");
    }
    if (!(config_.min_gap_fraction > 0.0 && config_.min_gap_fraction < 1.0)) {
        throw ValidationError("min_gap_fraction must be in (0,1), got " +
                              std::to_string(config_.min_gap_fraction));
    }
}

AggregateForecast SubForecastAggregator::aggregate(
    const std::vector<PartialResult>& results,
    QuestionKind kind,
    const ForecastContext& ctx
) const {
    AggregateForecast forecast;
    forecast.kind = kind;

    std::vector<const PartialResult*> ok;
    std::vector<std::string> failures;
    for (const auto& result : results) {
        if (result.is_ok()) {
            ok.push_back(&result);
            continue;
        }
        std::string reason = status_to_string(result.status);
        if (!result.error_message.empty()) {
            reason += ": " + result.error_message;
        }
        forecast.warnings.push_back("excluded sub-question '" + result.sub_question_id + "' (" + reason + ")");
        failures.push_back(result.sub_question_id + " " + reason);
    }

    if (ok.empty()) {
        std::ostringstream msg;
        msg << "all " << results.size() << " sub-forecasts failed or timed out";
        for (size_t i = 0; i < failures.size() && i < 5; ++i) {
            msg << (i == 0 ? ": " : "; ") << failures[i];
        }
        logger_->log_error(ctx, msg.str());
        throw AggregationError(msg.str());
    }

    for (const PartialResult* result : ok) {
        if (value_kind(*result->value) != kind) {
            throw ValidationError("sub-question '" + result->sub_question_id + "' produced a " +
                                  kind_to_string(value_kind(*result->value)) + " value for a " +
                                  kind_to_string(kind) + " question");
        }
        if (result->degraded) {
            forecast.degraded = true;
        }
    }

    std::vector<double> weights = normalized_weights(ok);

    switch (kind) {
        case QuestionKind::BINARY:
            forecast.value = aggregate_binary(ok, weights);
            break;
        case QuestionKind::NUMERIC: {
            ContinuousCDF cdf = aggregate_numeric(ok, weights);
            forecast.value = forecast.degraded ? cdf.as_degraded() : cdf;
            break;
        }
        case QuestionKind::CATEGORICAL:
            forecast.value = aggregate_categorical(ok, weights, forecast.warnings);
            break;
    }

    forecast.contributing_count = ok.size();
    forecast.excluded_count = results.size() - ok.size();

    logger_->log_aggregation(ctx, forecast);
    return forecast;
}

std::vector<double> SubForecastAggregator::normalized_weights(
    const std::vector<const PartialResult*>& ok
) const {
    bool all_set = std::all_of(ok.begin(), ok.end(),
                               [](const PartialResult* r) { return r->weight.has_value(); });

    std::vector<double> weights(ok.size(), 1.0);
    if (all_set) {
        for (size_t i = 0; i < ok.size(); ++i) {
            double w = *ok[i]->weight;
            if (!std::isfinite(w) || w < 0.0) {
                throw ValidationError("sub-question '" + ok[i]->sub_question_id +
                                      "' has invalid weight " + std::to_string(w));
            }
            weights[i] = w;
        }
    }

    double total = 0.0;
    for (double w : weights) {
        total += w;
    }
    if (total <= 0.0) {
        throw ValidationError("weights of contributing sub-forecasts sum to zero");
    }
    for (double& w : weights) {
        w /= total;
    }
    return weights;
}

double SubForecastAggregator::aggregate_binary(
    const std::vector<const PartialResult*>& ok,
    const std::vector<double>& weights
) const {
    std::vector<double> probabilities;
    probabilities.reserve(ok.size());
    for (const PartialResult* result : ok) {
        double p = std::get<double>(*result->value);
        if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
            throw ValidationError("sub-question '" + result->sub_question_id +
                                  "' probability " + std::to_string(p) + " outside [0,1]");
        }
        probabilities.push_back(p);
    }

    const double floor = config_.probability_floor;
    double combined = 0.0;

    switch (config_.method) {
        case BinaryAggregation::WEIGHTED_AVERAGE:
            for (size_t i = 0; i < probabilities.size(); ++i) {
                combined += weights[i] * probabilities[i];
            }
            break;
        case BinaryAggregation::GEOMETRIC_MEAN: {
            double log_sum = 0.0;
            for (size_t i = 0; i < probabilities.size(); ++i) {
                log_sum += weights[i] * std::log(std::max(probabilities[i], floor));
            }
            combined = std::exp(log_sum);
            break;
        }
        case BinaryAggregation::MEDIAN: {
            std::vector<double> sorted = probabilities;
            std::sort(sorted.begin(), sorted.end());
            size_t mid = sorted.size() / 2;
            combined = sorted.size() % 2 == 1 ? sorted[mid] : 0.5 * (sorted[mid - 1] + sorted[mid]);
            break;
        }
    }

    return std::clamp(combined, floor, 1.0 - floor);
}

ContinuousCDF SubForecastAggregator::aggregate_numeric(
    const std::vector<const PartialResult*>& ok,
    const std::vector<double>& weights
) const {
    const size_t n = std::get<ContinuousCDF>(*ok.front()->value).size();
    std::vector<double> combined(n, 0.0);

    for (size_t i = 0; i < ok.size(); ++i) {
        const ContinuousCDF& cdf = std::get<ContinuousCDF>(*ok[i]->value);
        if (cdf.size() != n) {
            throw ValidationError("CDF length mismatch: sub-question '" + ok[i]->sub_question_id +
                                  "' has " + std::to_string(cdf.size()) + " points, expected " +
                                  std::to_string(n));
        }
        for (size_t k = 0; k < n; ++k) {
            combined[k] += weights[i] * cdf[k];
        }
    }

    return ContinuousCDF(enforce_minimum_gap(combined, minimum_gap(n, config_.min_gap_fraction)));
}

CategoricalDistribution SubForecastAggregator::aggregate_categorical(
    const std::vector<const PartialResult*>& ok,
    const std::vector<double>& weights,
    std::vector<std::string>& warnings
) const {
    CategoricalDistribution combined;
    for (const PartialResult* result : ok) {
        for (const auto& [key, p] : std::get<CategoricalDistribution>(*result->value)) {
            if (!std::isfinite(p) || p < 0.0) {
                throw ValidationError("sub-question '" + result->sub_question_id +
                                      "' category '" + key + "' has invalid probability " +
                                      std::to_string(p));
            }
            combined.emplace(key, 0.0);
        }
    }

    for (size_t i = 0; i < ok.size(); ++i) {
        const CategoricalDistribution& dist = std::get<CategoricalDistribution>(*ok[i]->value);
        for (const auto& [key, p] : dist) {
            combined[key] += weights[i] * p;
        }
    }

    double total = 0.0;
    for (const auto& entry : combined) {
        total += entry.second;
    }
    if (combined.empty() || total <= 0.0) {
        throw ValidationError("categorical sub-forecasts carry no probability mass");
    }
    if (std::abs(total - 1.0) > config_.categorical_tolerance) {
        warnings.push_back("renormalized category probabilities summing to " + std::to_string(total));
    }
    for (auto& entry : combined) {
        entry.second /= total;
    }
    return combined;
}

} // namespace forecast
