/**
 * @file payload_parser.cpp
 * @brief Implementation of boundary parsing and rendering
 */

#include "payload_parser.hpp"
#include "forecast_errors.hpp"
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <sstream>

using json = nlohmann::json;

namespace forecast {

namespace {

double require_number(const json& j, const std::string& what) {
    if (!j.is_number()) {
        throw ValidationError(what + " must be a number, got " + j.dump());
    }
    double value = j.get<double>();
    if (!std::isfinite(value)) {
        throw ValidationError(what + " is not finite");
    }
    return value;
}

bool require_bool(const json& j, const std::string& what) {
    if (!j.is_boolean()) {
        throw ValidationError(what + " must be a boolean, got " + j.dump());
    }
    return j.get<bool>();
}

std::string require_string(const json& j, const std::string& what) {
    if (!j.is_string()) {
        throw ValidationError(what + " must be a string, got " + j.dump());
    }
    return j.get<std::string>();
}

// First key present in j, or nullptr
const json* find_any(const json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

double percentile_from_key(const std::string& key) {
    try {
        size_t used = 0;
        double percent = std::stod(key, &used);
        if (used == key.size()) {
            return percent / 100.0;
        }
    } catch (const std::logic_error&) {
        // reported below
    }
    throw ValidationError("percentile key '" + key + "' is not a number");
}

MixtureComponent parse_component(const json& j, size_t index) {
    if (!j.is_object()) {
        throw ValidationError("mixture component " + std::to_string(index) + " must be an object");
    }
    const std::string label = "component " + std::to_string(index);

    MixtureComponent component;
    component.scenario = j.contains("scenario") ? require_string(j["scenario"], label + " scenario")
                                                : "scenario_" + std::to_string(index);

    const json* mode = find_any(j, {"mode"});
    const json* p10 = find_any(j, {"p10", "lower_bound"});
    const json* p90 = find_any(j, {"p90", "upper_bound"});
    const json* weight = find_any(j, {"weight"});
    if (!mode || !p10 || !p90 || !weight) {
        throw ValidationError(label + " needs mode, p10/lower_bound, p90/upper_bound and weight");
    }
    component.mode = require_number(*mode, label + " mode");
    component.p10 = require_number(*p10, label + " p10");
    component.p90 = require_number(*p90, label + " p90");
    component.weight = require_number(*weight, label + " weight");
    return component;
}

CategoricalDistribution normalized(const CategoricalDistribution& probabilities) {
    double total = 0.0;
    for (const auto& entry : probabilities) {
        total += entry.second;
    }
    if (!(total > 0.0)) {
        throw ValidationError("category probabilities sum to zero");
    }
    CategoricalDistribution out;
    for (const auto& [key, p] : probabilities) {
        out[key] = p / total;
    }
    return out;
}

} // namespace

std::vector<PercentileEstimate> parse_percentiles(const json& j) {
    std::vector<PercentileEstimate> estimates;

    if (j.is_array()) {
        for (size_t i = 0; i < j.size(); ++i) {
            const json& entry = j[i];
            if (!entry.is_object() || !entry.contains("percentile") || !entry.contains("value")) {
                throw ValidationError("percentile entry " + std::to_string(i) +
                                      " needs 'percentile' and 'value'");
            }
            double percentile = require_number(entry["percentile"], "percentile");
            if (percentile > 1.0) {
                percentile /= 100.0;
            }
            estimates.emplace_back(percentile, require_number(entry["value"], "percentile value"));
        }
    } else if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            estimates.emplace_back(percentile_from_key(it.key()),
                                   require_number(it.value(), "value at percentile " + it.key()));
        }
    } else {
        throw ValidationError("percentiles must be an array or an object, got " + j.dump());
    }

    std::sort(estimates.begin(), estimates.end(),
              [](const PercentileEstimate& a, const PercentileEstimate& b) {
                  return a.percentile < b.percentile;
              });
    for (size_t i = 1; i < estimates.size(); ++i) {
        if (estimates[i].percentile == estimates[i - 1].percentile) {
            throw ValidationError("duplicate percentile " +
                                  std::to_string(estimates[i].percentile * 100.0));
        }
    }
    return estimates;
}

DistributionBounds parse_bounds(const json& j, size_t default_outcome_count) {
    if (!j.is_object()) {
        throw ValidationError("bounds must be an object, got " + j.dump());
    }

    DistributionBounds bounds;
    bounds.outcome_count = default_outcome_count;

    if (const json* lower = find_any(j, {"lower", "lower_bound"})) {
        bounds.lower = require_number(*lower, "lower bound");
    }
    if (const json* upper = find_any(j, {"upper", "upper_bound"})) {
        bounds.upper = require_number(*upper, "upper bound");
    }
    if (const json* open = find_any(j, {"lower_open", "open_lower_bound"})) {
        bounds.lower_open = require_bool(*open, "lower_open");
    }
    if (const json* open = find_any(j, {"upper_open", "open_upper_bound"})) {
        bounds.upper_open = require_bool(*open, "upper_open");
    }
    if (const json* log_scale = find_any(j, {"log_scale"})) {
        bounds.log_scale = require_bool(*log_scale, "log_scale");
    }
    if (const json* count = find_any(j, {"outcome_count", "cdf_size"})) {
        double value = require_number(*count, "outcome_count");
        if (!(value >= 2.0 && value <= static_cast<double>(MAX_OUTCOME_COUNT)) || value != std::floor(value)) {
            throw ValidationError("outcome_count must be an integer in [2," +
                                  std::to_string(MAX_OUTCOME_COUNT) + "], got " + count->dump());
        }
        bounds.outcome_count = static_cast<size_t>(value);
    }

    DistributionSynthesizer::validate_bounds(bounds);
    return bounds;
}

std::vector<SubQuestion> parse_sub_questions(const json& j, size_t default_outcome_count) {
    if (!j.is_array()) {
        throw ValidationError("sub-questions must be an array, got " + j.dump());
    }

    std::vector<SubQuestion> sub_questions;
    bool all_weighted = !j.empty();
    double total_weight = 0.0;

    for (size_t i = 0; i < j.size(); ++i) {
        const json& entry = j[i];
        if (!entry.is_object()) {
            throw ValidationError("sub-question " + std::to_string(i) + " must be an object");
        }

        SubQuestion sub_question;
        sub_question.id = entry.contains("id") ? require_string(entry["id"], "sub-question id")
                                               : "sq_" + std::to_string(i);
        if (const json* title = find_any(entry, {"title", "question"})) {
            sub_question.title = require_string(*title, "sub-question title");
        }
        if (const json* context = find_any(entry, {"context"})) {
            sub_question.context = require_string(*context, "sub-question context");
        }
        if (const json* kind = find_any(entry, {"kind", "type"})) {
            sub_question.kind = string_to_kind(require_string(*kind, "sub-question kind"));
        }
        if (const json* bounds = find_any(entry, {"bounds"})) {
            sub_question.bounds = parse_bounds(*bounds, default_outcome_count);
        }
        if (sub_question.kind == QuestionKind::NUMERIC && !sub_question.bounds) {
            throw ValidationError("numeric sub-question '" + sub_question.id + "' needs bounds");
        }
        if (const json* weight = find_any(entry, {"weight"})) {
            double w = require_number(*weight, "sub-question weight");
            if (w < 0.0) {
                throw ValidationError("sub-question '" + sub_question.id + "' has negative weight");
            }
            sub_question.weight = w;
            total_weight += w;
        } else {
            all_weighted = false;
        }

        sub_questions.push_back(sub_question);
    }

    if (all_weighted && std::abs(total_weight - 1.0) > SUB_QUESTION_WEIGHT_TOLERANCE) {
        throw ValidationError("sub-question weights must sum to 1.0, got " + std::to_string(total_weight));
    }
    return sub_questions;
}

ForecastPayload parse_forecast_payload(const json& j, QuestionKind kind) {
    switch (kind) {
        case QuestionKind::BINARY: {
            BinaryPayload payload;
            const json* probability = j.is_object() ? find_any(j, {"probability"}) : &j;
            if (!probability) {
                throw ValidationError("binary answer needs 'probability'");
            }
            payload.probability = require_number(*probability, "probability");
            if (payload.probability < 0.0 || payload.probability > 1.0) {
                throw ValidationError("probability " + std::to_string(payload.probability) +
                                      " outside [0,1]");
            }
            return payload;
        }
        case QuestionKind::NUMERIC: {
            if (!j.is_object()) {
                throw ValidationError("numeric answer must be an object");
            }
            if (const json* components = find_any(j, {"components"})) {
                if (!components->is_array()) {
                    throw ValidationError("'components' must be an array");
                }
                MixturePayload payload;
                for (size_t i = 0; i < components->size(); ++i) {
                    payload.components.push_back(parse_component((*components)[i], i));
                }
                if (const json* lognormal = find_any(j, {"use_lognormal"})) {
                    payload.use_lognormal = require_bool(*lognormal, "use_lognormal");
                }
                validate_mixture(payload.components);
                return payload;
            }
            const json* percentiles = find_any(j, {"percentiles"});
            if (!percentiles) {
                throw ValidationError("numeric answer needs 'percentiles' or 'components'");
            }
            NumericPayload payload;
            payload.percentiles = parse_percentiles(*percentiles);
            return payload;
        }
        case QuestionKind::CATEGORICAL: {
            const json* probabilities = j.is_object() ? find_any(j, {"probabilities"}) : nullptr;
            if (!probabilities || !probabilities->is_object() || probabilities->empty()) {
                throw ValidationError("categorical answer needs a non-empty 'probabilities' object");
            }
            CategoricalPayload payload;
            for (auto it = probabilities->begin(); it != probabilities->end(); ++it) {
                double p = require_number(it.value(), "probability of '" + it.key() + "'");
                if (p < 0.0) {
                    throw ValidationError("probability of '" + it.key() + "' is negative");
                }
                payload.probabilities[it.key()] = p;
            }
            return payload;
        }
    }
    throw ValidationError("unsupported question kind");
}

ForecastValue to_forecast_value(
    const ForecastPayload& payload,
    const std::optional<DistributionBounds>& bounds,
    const DistributionSynthesizer& synthesizer,
    const ForecastContext& ctx
) {
    if (const auto* binary = std::get_if<BinaryPayload>(&payload)) {
        return binary->probability;
    }
    if (const auto* categorical = std::get_if<CategoricalPayload>(&payload)) {
        return normalized(categorical->probabilities);
    }

    if (!bounds) {
        throw ValidationError("numeric answer requires question bounds");
    }
    if (const auto* numeric = std::get_if<NumericPayload>(&payload)) {
        return synthesizer.synthesize_report(numeric->percentiles, *bounds, ctx).cdf;
    }
    const auto& mixture = std::get<MixturePayload>(payload);
    return synthesize_mixture(mixture.components, *bounds, mixture.use_lognormal, synthesizer, ctx).cdf;
}

PartialResult payload_to_result(
    const SubQuestion& sub_question,
    const json& j,
    const DistributionSynthesizer& synthesizer
) {
    ForecastContext ctx;
    ctx.sub_question_id = sub_question.id;
    ctx.depth = sub_question.depth;
    ctx.phase = "synthesize";

    try {
        ForecastPayload payload = parse_forecast_payload(j, sub_question.kind);
        PartialResult result = PartialResult::ok(
            sub_question.id, to_forecast_value(payload, sub_question.bounds, synthesizer, ctx));
        result.weight = sub_question.weight;
        return result;
    } catch (const ValidationError& e) {
        PartialResult result = PartialResult::failed(sub_question.id, ErrorKind::VALIDATION, e.what());
        result.weight = sub_question.weight;
        return result;
    }
}

json aggregate_to_json(const AggregateForecast& forecast) {
    json j;
    j["kind"] = kind_to_string(forecast.kind);

    switch (forecast.kind) {
        case QuestionKind::BINARY:
            j["probability"] = forecast.probability();
            break;
        case QuestionKind::NUMERIC:
            j["cdf"] = forecast.cdf().values();
            break;
        case QuestionKind::CATEGORICAL:
            j["probabilities"] = forecast.categories();
            break;
    }

    j["degraded"] = forecast.degraded;
    j["contributing_count"] = forecast.contributing_count;
    j["excluded_count"] = forecast.excluded_count;
    j["warnings"] = forecast.warnings;
    return j;
}

} // namespace forecast
