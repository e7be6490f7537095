/**
 * @file forecast_types.hpp
 * @brief Value types shared by synthesis, aggregation and decomposition
 *
 * All cross-task data in the engine is one of these types. They are
 * passed by value (or const reference) and never mutated after
 * construction, so no locking is needed once a result has been produced.
 */

#ifndef FORECAST_TYPES_HPP
#define FORECAST_TYPES_HPP

#include <cstddef>
#include <map>
#include <utility>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace forecast {

/**
 * @brief Number of CDF points for continuous questions
 */
constexpr size_t DEFAULT_OUTCOME_COUNT = 201;

/// Largest accepted CDF resolution
constexpr size_t MAX_OUTCOME_COUNT = 100000;

/**
 * @brief Question / sub-question kind
 */
enum class QuestionKind {
    BINARY,
    NUMERIC,
    CATEGORICAL
};

inline std::string kind_to_string(QuestionKind kind) {
    switch (kind) {
        case QuestionKind::BINARY: return "binary";
        case QuestionKind::NUMERIC: return "numeric";
        case QuestionKind::CATEGORICAL: return "categorical";
        default: return "unknown";
    }
}

/**
 * @brief Parse question kind; accepts "multiple_choice" and "discrete" aliases
 *
 * @throws ValidationError on an unknown kind
 */
QuestionKind string_to_kind(const std::string& kind_str);

/**
 * @brief A claim that the outcome is at most @c value with probability @c percentile
 */
struct PercentileEstimate {
    double percentile;   ///< Cumulative probability, strictly inside (0,1)
    double value;        ///< Real-world value at that percentile

    PercentileEstimate() : percentile(0.0), value(0.0) {}
    PercentileEstimate(double percentile_, double value_)
        : percentile(percentile_), value(value_) {}
};

/**
 * @brief Range and resolution metadata for a numeric question
 *
 * Built once per question from question metadata. A side with no bound is
 * always anchored as open, whatever its @c *_open flag says.
 */
struct DistributionBounds {
    std::optional<double> lower;     ///< Lower edge of the question range (absent = unbounded)
    std::optional<double> upper;     ///< Upper edge of the question range (absent = unbounded)
    bool lower_open;                 ///< Mass may lie below @c lower
    bool upper_open;                 ///< Mass may lie above @c upper
    bool log_scale;                  ///< Interpolate in ln(value) space
    size_t outcome_count;            ///< Number of CDF points the submission format requires

    DistributionBounds()
        : lower_open(false), upper_open(false), log_scale(false),
          outcome_count(DEFAULT_OUTCOME_COUNT) {}

    DistributionBounds(double lower_, double upper_, bool lower_open_ = false,
                       bool upper_open_ = false, size_t outcome_count_ = DEFAULT_OUTCOME_COUNT)
        : lower(lower_), upper(upper_), lower_open(lower_open_), upper_open(upper_open_),
          log_scale(false), outcome_count(outcome_count_) {}
};

/**
 * @brief Fixed-length cumulative distribution in probability space
 *
 * Immutable: any adjustment builds a new instance. Structural validity
 * (length, monotonicity, minimum gap) is established by the producer,
 * see cdf_repair.hpp.
 */
class ContinuousCDF {
public:
    ContinuousCDF() : degraded_(false) {}
    explicit ContinuousCDF(std::vector<double> values, bool degraded = false)
        : values_(std::move(values)), degraded_(degraded) {}

    const std::vector<double>& values() const { return values_; }
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }
    double operator[](size_t i) const { return values_[i]; }
    double front() const { return values_.front(); }
    double back() const { return values_.back(); }

    /**
     * @brief True if this CDF came from fallback logic after a local synthesis failure
     */
    bool is_degraded() const { return degraded_; }

    /**
     * @brief Copy of this CDF carrying the degraded marker
     */
    ContinuousCDF as_degraded() const { return ContinuousCDF(values_, true); }

private:
    std::vector<double> values_;
    bool degraded_;
};

/**
 * @brief Category key -> probability (keys unique, ordered for determinism)
 */
using CategoricalDistribution = std::map<std::string, double>;

/**
 * @brief Tagged forecast value: probability, CDF, or category mapping
 */
using ForecastValue = std::variant<double, ContinuousCDF, CategoricalDistribution>;

/**
 * @brief The kind a ForecastValue holds
 */
QuestionKind value_kind(const ForecastValue& value);

/**
 * @brief One decomposition unit
 */
struct SubQuestion {
    std::string id;
    std::string title;
    std::string context;                       ///< How this relates to the parent question
    QuestionKind kind;
    std::optional<DistributionBounds> bounds;  ///< Required for numeric sub-questions
    std::optional<double> weight;              ///< Unset selects equal weighting
    size_t depth;                              ///< Set by the coordinator

    SubQuestion() : kind(QuestionKind::BINARY), depth(0) {}
    SubQuestion(const std::string& id_, QuestionKind kind_, std::optional<double> weight_ = std::nullopt)
        : id(id_), kind(kind_), weight(weight_), depth(0) {}
};

/**
 * @brief Why a unit did not produce a value
 */
enum class ErrorKind {
    VALIDATION,
    TIMEOUT,
    EXTERNAL_FAILURE,
    RECURSION_LIMIT,
    CANCELLED,
    INTERNAL
};

inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return "VALIDATION";
        case ErrorKind::TIMEOUT: return "TIMEOUT";
        case ErrorKind::EXTERNAL_FAILURE: return "EXTERNAL_FAILURE";
        case ErrorKind::RECURSION_LIMIT: return "RECURSION_LIMIT";
        case ErrorKind::CANCELLED: return "CANCELLED";
        case ErrorKind::INTERNAL: return "INTERNAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Outcome of one sub-forecast attempt
 */
struct PartialResult {
    enum class Status {
        OK,
        TIMED_OUT,
        FAILED
    };

    std::string sub_question_id;
    Status status;
    std::optional<ForecastValue> value;   ///< Present only when status == OK
    std::optional<ErrorKind> error;
    std::string error_message;
    std::optional<double> weight;         ///< Copied from the SubQuestion
    bool degraded;                        ///< Value came from fallback logic
    double duration_ms;

    PartialResult() : status(Status::FAILED), degraded(false), duration_ms(0.0) {}

    bool is_ok() const { return status == Status::OK && value.has_value(); }

    static PartialResult ok(const std::string& id, ForecastValue v, bool degraded = false);
    static PartialResult timed_out(const std::string& id, const std::string& message);
    static PartialResult failed(const std::string& id, ErrorKind kind, const std::string& message);
};

inline std::string status_to_string(PartialResult::Status status) {
    switch (status) {
        case PartialResult::Status::OK: return "OK";
        case PartialResult::Status::TIMED_OUT: return "TIMED_OUT";
        case PartialResult::Status::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Final combined forecast, ready for the submission layer
 */
struct AggregateForecast {
    QuestionKind kind;
    ForecastValue value;
    bool degraded;                       ///< Any contributing result was degraded
    size_t contributing_count;           ///< OK results used
    size_t excluded_count;               ///< TIMED_OUT / FAILED results left out
    std::vector<std::string> warnings;

    AggregateForecast()
        : kind(QuestionKind::BINARY), value(0.5), degraded(false),
          contributing_count(0), excluded_count(0) {}

    double probability() const { return std::get<double>(value); }
    const ContinuousCDF& cdf() const { return std::get<ContinuousCDF>(value); }
    const CategoricalDistribution& categories() const { return std::get<CategoricalDistribution>(value); }
};

/**
 * @brief Depth budget passed by value down the decomposition chain
 */
struct RecursionGuard {
    size_t current_depth;
    size_t max_depth;

    RecursionGuard() : current_depth(0), max_depth(1) {}
    RecursionGuard(size_t current_depth_, size_t max_depth_)
        : current_depth(current_depth_), max_depth(max_depth_) {}

    bool exhausted() const { return current_depth >= max_depth; }

    /**
     * @brief Guard for the next decomposition level
     */
    RecursionGuard descend() const { return RecursionGuard(current_depth + 1, max_depth); }
};

/**
 * @brief A question proposed for decomposition, with its sub-questions
 */
struct Question {
    std::string id;
    std::string title;
    QuestionKind kind;
    std::optional<DistributionBounds> bounds;
    std::vector<SubQuestion> sub_questions;

    Question() : kind(QuestionKind::BINARY) {}
    Question(const std::string& id_, QuestionKind kind_) : id(id_), kind(kind_) {}
};

} // namespace forecast

#endif // FORECAST_TYPES_HPP
