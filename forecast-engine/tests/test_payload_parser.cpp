/**
 * @file test_payload_parser.cpp
 * @brief Unit tests for agent payload parsing and forecast rendering
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/payload_parser.hpp"
#include "../src/cdf_repair.hpp"
#include "../src/forecast_errors.hpp"
#include "../src/sub_forecast_aggregator.hpp"

using namespace forecast;
using Catch::Matchers::WithinAbs;
using json = nlohmann::json;

TEST_CASE("Percentile parsing", "[payload_parser]") {
    SECTION("Array of fractions") {
        json j = json::parse(R"([
            {"percentile": 0.9, "value": 80},
            {"percentile": 0.1, "value": 20},
            {"percentile": 0.5, "value": 50}
        ])");
        std::vector<PercentileEstimate> estimates = parse_percentiles(j);

        REQUIRE(estimates.size() == 3);
        REQUIRE(estimates[0].percentile == 0.1);
        REQUIRE(estimates[0].value == 20.0);
        REQUIRE(estimates[2].percentile == 0.9);
    }

    SECTION("Array entries above one are percentages") {
        json j = json::parse(R"([{"percentile": 25, "value": 3}, {"percentile": 75, "value": 9}])");
        std::vector<PercentileEstimate> estimates = parse_percentiles(j);

        REQUIRE_THAT(estimates[0].percentile, WithinAbs(0.25, 1e-12));
        REQUIRE_THAT(estimates[1].percentile, WithinAbs(0.75, 1e-12));
    }

    SECTION("Object keyed by percentage") {
        json j = json::parse(R"({"10": 20, "90": 80, "50": 50})");
        std::vector<PercentileEstimate> estimates = parse_percentiles(j);

        REQUIRE(estimates.size() == 3);
        REQUIRE_THAT(estimates[1].percentile, WithinAbs(0.5, 1e-12));
        REQUIRE(estimates[1].value == 50.0);
    }

    SECTION("Malformed input") {
        REQUIRE_THROWS_AS(parse_percentiles(json(42)), ValidationError);
        REQUIRE_THROWS_AS(parse_percentiles(json::parse(R"({"median": 5})")), ValidationError);
        REQUIRE_THROWS_AS(parse_percentiles(json::parse(R"([{"percentile": 0.5}])")), ValidationError);
        REQUIRE_THROWS_AS(parse_percentiles(json::parse(R"({"10": "low"})")), ValidationError);
    }

    SECTION("Duplicate percentile") {
        json j = json::parse(R"([{"percentile": 0.5, "value": 1}, {"percentile": 50, "value": 2}])");
        REQUIRE_THROWS_AS(parse_percentiles(j), ValidationError);
    }
}

TEST_CASE("Bounds parsing", "[payload_parser]") {
    SECTION("Primary keys") {
        json j = json::parse(R"({"lower": 0, "upper": 100, "lower_open": false, "upper_open": true})");
        DistributionBounds bounds = parse_bounds(j);

        REQUIRE(*bounds.lower == 0.0);
        REQUIRE(*bounds.upper == 100.0);
        REQUIRE_FALSE(bounds.lower_open);
        REQUIRE(bounds.upper_open);
        REQUIRE(bounds.outcome_count == 201);
    }

    SECTION("Aliases and resolution") {
        json j = json::parse(R"({
            "lower_bound": 1, "upper_bound": 1000,
            "open_lower_bound": true, "open_upper_bound": true,
            "log_scale": true, "cdf_size": 101
        })");
        DistributionBounds bounds = parse_bounds(j);

        REQUIRE(*bounds.lower == 1.0);
        REQUIRE(bounds.lower_open);
        REQUIRE(bounds.log_scale);
        REQUIRE(bounds.outcome_count == 101);
    }

    SECTION("Default outcome count is applied") {
        DistributionBounds bounds = parse_bounds(json::parse(R"({"lower": 0, "upper": 1})"), 51);
        REQUIRE(bounds.outcome_count == 51);
    }

    SECTION("Missing sides are unbounded") {
        DistributionBounds bounds = parse_bounds(json::parse(R"({"lower": 0})"));
        REQUIRE(bounds.lower.has_value());
        REQUIRE_FALSE(bounds.upper.has_value());
    }

    SECTION("Invalid bounds") {
        REQUIRE_THROWS_AS(parse_bounds(json::parse(R"({"lower": 10, "upper": 5})")), ValidationError);
        REQUIRE_THROWS_AS(parse_bounds(json::parse(R"({"lower": "zero"})")), ValidationError);
        REQUIRE_THROWS_AS(parse_bounds(json::parse(R"({"upper_open": "yes"})")), ValidationError);
        REQUIRE_THROWS_AS(parse_bounds(json::parse(R"({"outcome_count": 1.5})")), ValidationError);
        REQUIRE_THROWS_AS(parse_bounds(json::parse(R"({"outcome_count": 1e300})")), ValidationError);
        REQUIRE_THROWS_AS(parse_bounds(json::parse(R"({"outcome_count": 100001})")), ValidationError);
        REQUIRE_THROWS_AS(parse_bounds(json::parse("[0, 1]")), ValidationError);
    }
}

TEST_CASE("Sub-question parsing", "[payload_parser]") {
    SECTION("Ids, kinds and aliases") {
        json j = json::parse(R"([
            {"id": "rates", "title": "Will the central bank cut rates?", "kind": "binary", "weight": 0.6},
            {"question": "What will CPI be?", "type": "numeric",
             "bounds": {"lower": 0, "upper": 10}, "weight": 0.4}
        ])");
        std::vector<SubQuestion> sub_questions = parse_sub_questions(j);

        REQUIRE(sub_questions.size() == 2);
        REQUIRE(sub_questions[0].id == "rates");
        REQUIRE(sub_questions[0].kind == QuestionKind::BINARY);
        REQUIRE(sub_questions[1].id == "sq_1");
        REQUIRE(sub_questions[1].title == "What will CPI be?");
        REQUIRE(sub_questions[1].kind == QuestionKind::NUMERIC);
        REQUIRE(sub_questions[1].bounds.has_value());
        REQUIRE(*sub_questions[1].weight == 0.4);
    }

    SECTION("Missing weights are allowed") {
        json j = json::parse(R"([{"title": "a"}, {"title": "b", "weight": 0.2}])");
        std::vector<SubQuestion> sub_questions = parse_sub_questions(j);

        REQUIRE_FALSE(sub_questions[0].weight.has_value());
        REQUIRE(sub_questions[0].kind == QuestionKind::BINARY);
    }

    SECTION("Explicit weights must sum to one") {
        json j = json::parse(R"([{"title": "a", "weight": 0.5}, {"title": "b", "weight": 0.3}])");
        REQUIRE_THROWS_AS(parse_sub_questions(j), ValidationError);
    }

    SECTION("Weights within tolerance pass") {
        json j = json::parse(R"([{"weight": 0.333}, {"weight": 0.333}, {"weight": 0.333}])");
        REQUIRE_NOTHROW(parse_sub_questions(j));
    }

    SECTION("Numeric sub-question needs bounds") {
        json j = json::parse(R"([{"title": "a", "kind": "numeric"}])");
        REQUIRE_THROWS_AS(parse_sub_questions(j), ValidationError);
    }

    SECTION("Unknown kind") {
        json j = json::parse(R"([{"title": "a", "kind": "date"}])");
        REQUIRE_THROWS_AS(parse_sub_questions(j), ValidationError);
    }
}

TEST_CASE("Forecast payload parsing", "[payload_parser]") {
    SECTION("Binary object and bare number") {
        ForecastPayload payload = parse_forecast_payload(json::parse(R"({"probability": 0.3})"),
                                                         QuestionKind::BINARY);
        REQUIRE(std::get<BinaryPayload>(payload).probability == 0.3);

        payload = parse_forecast_payload(json(0.8), QuestionKind::BINARY);
        REQUIRE(std::get<BinaryPayload>(payload).probability == 0.8);
    }

    SECTION("Binary probability out of range") {
        REQUIRE_THROWS_AS(parse_forecast_payload(json::parse(R"({"probability": 1.2})"), QuestionKind::BINARY),
                          ValidationError);
        REQUIRE_THROWS_AS(parse_forecast_payload(json::parse(R"({"p": 0.2})"), QuestionKind::BINARY),
                          ValidationError);
    }

    SECTION("Numeric percentiles") {
        ForecastPayload payload = parse_forecast_payload(
            json::parse(R"({"percentiles": {"10": 20, "50": 50, "90": 80}})"), QuestionKind::NUMERIC);
        REQUIRE(std::get<NumericPayload>(payload).percentiles.size() == 3);
    }

    SECTION("Numeric mixture") {
        ForecastPayload payload = parse_forecast_payload(json::parse(R"({
            "components": [
                {"scenario": "Recession", "mode": 20, "lower_bound": 10, "upper_bound": 30, "weight": 0.3},
                {"scenario": "Baseline", "mode": 60, "p10": 45, "p90": 75, "weight": 0.7}
            ],
            "use_lognormal": false
        })"), QuestionKind::NUMERIC);

        const MixturePayload& mixture = std::get<MixturePayload>(payload);
        REQUIRE(mixture.components.size() == 2);
        REQUIRE(mixture.components[0].scenario == "Recession");
        REQUIRE(mixture.components[0].p10 == 10.0);
        REQUIRE(mixture.components[1].p90 == 75.0);
        REQUIRE_FALSE(mixture.use_lognormal);
    }

    SECTION("Mixture with bad weights") {
        json j = json::parse(R"({"components": [{"mode": 5, "p10": 1, "p90": 9, "weight": 0.4}]})");
        REQUIRE_THROWS_AS(parse_forecast_payload(j, QuestionKind::NUMERIC), ValidationError);
    }

    SECTION("Categorical") {
        ForecastPayload payload = parse_forecast_payload(
            json::parse(R"({"probabilities": {"Yes": 0.7, "No": 0.3}})"), QuestionKind::CATEGORICAL);
        REQUIRE(std::get<CategoricalPayload>(payload).probabilities.at("Yes") == 0.7);

        REQUIRE_THROWS_AS(parse_forecast_payload(json::parse(R"({"probabilities": {}})"),
                                                 QuestionKind::CATEGORICAL), ValidationError);
        REQUIRE_THROWS_AS(parse_forecast_payload(json::parse(R"({"probabilities": {"A": -0.1}})"),
                                                 QuestionKind::CATEGORICAL), ValidationError);
    }
}

TEST_CASE("Payload conversion to results", "[payload_parser]") {
    DistributionSynthesizer synthesizer;

    SECTION("Numeric answer becomes a valid CDF") {
        SubQuestion sub_question("cpi", QuestionKind::NUMERIC, 0.5);
        sub_question.bounds = DistributionBounds(0.0, 100.0);

        PartialResult result = payload_to_result(
            sub_question, json::parse(R"({"percentiles": {"10": 20, "50": 50, "90": 80}})"), synthesizer);

        REQUIRE(result.is_ok());
        REQUIRE(result.weight == 0.5);
        const ContinuousCDF& cdf = std::get<ContinuousCDF>(*result.value);
        REQUIRE(cdf.size() == 201);
        REQUIRE(is_valid_cdf(cdf.values(), synthesizer.min_gap(201), 201));
    }

    SECTION("Categorical answer is normalized") {
        SubQuestion sub_question("winner", QuestionKind::CATEGORICAL);
        PartialResult result = payload_to_result(
            sub_question, json::parse(R"({"probabilities": {"A": 2, "B": 6}})"), synthesizer);

        const CategoricalDistribution& categories = std::get<CategoricalDistribution>(*result.value);
        REQUIRE_THAT(categories.at("A"), WithinAbs(0.25, 1e-12));
        REQUIRE_THAT(categories.at("B"), WithinAbs(0.75, 1e-12));
    }

    SECTION("Malformed answer becomes a validation failure") {
        SubQuestion sub_question("rates", QuestionKind::BINARY, 0.25);
        PartialResult result = payload_to_result(sub_question, json::parse(R"({"answer": "yes"})"), synthesizer);

        REQUIRE(result.status == PartialResult::Status::FAILED);
        REQUIRE(result.error == ErrorKind::VALIDATION);
        REQUIRE(result.weight == 0.25);
    }

    SECTION("Numeric answer without bounds") {
        SubQuestion sub_question("cpi", QuestionKind::NUMERIC);
        PartialResult result = payload_to_result(
            sub_question, json::parse(R"({"percentiles": {"10": 20, "90": 80}})"), synthesizer);

        REQUIRE(result.error == ErrorKind::VALIDATION);
    }
}

TEST_CASE("Aggregate forecast rendering", "[payload_parser]") {
    SubForecastAggregator aggregator;

    SECTION("Binary") {
        std::vector<PartialResult> results = {
            PartialResult::ok("a", 0.3),
            PartialResult::timed_out("b", "unit exceeded 1000 ms")
        };
        json j = aggregate_to_json(aggregator.aggregate(results, QuestionKind::BINARY));

        REQUIRE(j["kind"] == "binary");
        REQUIRE_THAT(j["probability"].get<double>(), WithinAbs(0.3, 1e-12));
        REQUIRE(j["degraded"] == false);
        REQUIRE(j["contributing_count"] == 1);
        REQUIRE(j["excluded_count"] == 1);
        REQUIRE(j["warnings"].size() == 1);
    }

    SECTION("Categorical") {
        std::vector<PartialResult> results = {
            PartialResult::ok("a", CategoricalDistribution{{"A", 0.6}, {"B", 0.4}})
        };
        json j = aggregate_to_json(aggregator.aggregate(results, QuestionKind::CATEGORICAL));

        REQUIRE(j["kind"] == "categorical");
        REQUIRE_THAT(j["probabilities"]["A"].get<double>(), WithinAbs(0.6, 1e-12));
    }

    SECTION("Numeric") {
        DistributionSynthesizer synthesizer;
        ContinuousCDF cdf = synthesizer.synthesize({{0.1, 20.0}, {0.5, 50.0}, {0.9, 80.0}},
                                                   DistributionBounds(0.0, 100.0));
        json j = aggregate_to_json(aggregator.aggregate({PartialResult::ok("a", cdf)}, QuestionKind::NUMERIC));

        REQUIRE(j["kind"] == "numeric");
        REQUIRE(j["cdf"].size() == 201);
    }
}
