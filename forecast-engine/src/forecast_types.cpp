/**
 * @file forecast_types.cpp
 * @brief Helpers for forecast value types
 */

#include "forecast_types.hpp"
#include "forecast_errors.hpp"
#include <algorithm>
#include <cctype>

namespace forecast {

QuestionKind string_to_kind(const std::string& kind_str) {
    std::string lowered = kind_str;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "binary") return QuestionKind::BINARY;
    if (lowered == "numeric" || lowered == "discrete") return QuestionKind::NUMERIC;
    if (lowered == "categorical" || lowered == "multiple_choice") return QuestionKind::CATEGORICAL;

    throw ValidationError("Unknown question kind: " + kind_str);
}

QuestionKind value_kind(const ForecastValue& value) {
    if (std::holds_alternative<double>(value)) return QuestionKind::BINARY;
    if (std::holds_alternative<ContinuousCDF>(value)) return QuestionKind::NUMERIC;
    return QuestionKind::CATEGORICAL;
}

PartialResult PartialResult::ok(const std::string& id, ForecastValue v, bool degraded) {
    PartialResult result;
    result.sub_question_id = id;
    result.status = Status::OK;

    // A degraded CDF marks the whole result
    if (const auto* cdf = std::get_if<ContinuousCDF>(&v)) {
        degraded = degraded || cdf->is_degraded();
    }

    result.value = std::move(v);
    result.degraded = degraded;
    return result;
}

PartialResult PartialResult::timed_out(const std::string& id, const std::string& message) {
    PartialResult result;
    result.sub_question_id = id;
    result.status = Status::TIMED_OUT;
    result.error = ErrorKind::TIMEOUT;
    result.error_message = message;
    return result;
}

PartialResult PartialResult::failed(const std::string& id, ErrorKind kind, const std::string& message) {
    PartialResult result;
    result.sub_question_id = id;
    result.status = Status::FAILED;
    result.error = kind;
    result.error_message = message;
    return result;
}

} // namespace forecast
