/**
 * @file decomposition_example.cpp
 * @brief Example walking a question through decomposition and aggregation
 *
 * This example shows how to:
 * - Load engine settings from a JSON config (optional first argument)
 * - Parse sub-questions proposed by a planning agent
 * - Fan the sub-questions out through the DecompositionCoordinator
 * - Turn agent answers into typed values via the payload parser
 * - Aggregate the results and render the hand-off document
 *
 * Agents are simulated by a canned executor; one of them is slow enough
 * to hit the unit timeout, so the output shows partial-failure handling.
 */

#include "../src/config_parser.hpp"
#include "../src/decomposition_coordinator.hpp"
#include "../src/external_executor.hpp"
#include "../src/forecast_errors.hpp"
#include "../src/payload_parser.hpp"
#include <iostream>
#include <map>
#include <memory>
#include <thread>

using namespace forecast;
using json = nlohmann::json;

namespace {

/**
 * @brief Stand-in for the rate-limited agent gateway
 *
 * Answers by sub-question id from a fixed table.
 */
class CannedAgentExecutor : public IRateLimitedExecutor {
public:
    void add_answer(const std::string& id, const std::string& body, std::chrono::milliseconds latency) {
        answers_[id] = std::make_pair(body, latency);
    }

    ExternalCallResult call(const ExternalCall& call, const CancellationToken& cancel) override {
        auto it = answers_.find(call.metadata.at("sub_question_id"));
        if (it == answers_.end()) {
            throw ExternalCallError("no agent answers '" + call.metadata.at("sub_question_id") + "'");
        }

        auto until = std::chrono::steady_clock::now() + it->second.second;
        while (std::chrono::steady_clock::now() < until) {
            if (cancel.is_cancelled() || std::chrono::steady_clock::now() >= call.deadline) {
                throw TimeoutFailure(call.operation + " for '" + it->first + "'");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        ExternalCallResult result;
        result.payload = it->second.first;
        return result;
    }

private:
    std::map<std::string, std::pair<std::string, std::chrono::milliseconds>> answers_;
};

SpawnFunction make_spawn(std::shared_ptr<IRateLimitedExecutor> executor,
                         std::shared_ptr<DistributionSynthesizer> synthesizer) {
    return [executor, synthesizer](const SubQuestion& sub_question, const UnitContext& ctx) {
        ExternalCall call("forecast_agent", json{{"title", sub_question.title}}.dump());
        call.deadline = ctx.deadline;
        call.metadata["sub_question_id"] = sub_question.id;
        call.metadata["parent_question_id"] = ctx.parent_question_id;

        ExternalCallResult response = executor->call(call, ctx.cancel);
        return payload_to_result(sub_question, json::parse(response.payload), *synthesizer);
    };
}

} // namespace

int main(int argc, char** argv) {
    ForecastConfig config;
    try {
        if (argc > 1) {
            config = parse_forecast_config_from_file(argv[1]);
        } else {
            config.coordinator.unit_timeout = std::chrono::milliseconds(500);
            config.coordinator.cancel_grace = std::chrono::milliseconds(200);
            config.logging.min_level = LogLevel::DEBUG;
        }
    } catch (const ConfigParseError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    Logger& logger = Logger::get_instance();
    logger.configure(config.logging);

    auto synthesizer = std::make_shared<DistributionSynthesizer>(config.synthesis);
    DecompositionCoordinator coordinator(config.coordinator);
    SubForecastAggregator aggregator(config.aggregation);

    auto executor = std::make_shared<CannedAgentExecutor>();
    executor->add_answer("sq_0", R"({"probability": 0.35})", std::chrono::milliseconds(40));
    executor->add_answer("sq_1", R"({"probability": 0.55})", std::chrono::milliseconds(80));
    executor->add_answer("sq_2", R"({"probability": 0.90})", std::chrono::milliseconds(60000));
    executor->add_answer("gdp", R"({"percentiles": {"10": 0.5, "50": 2.0, "90": 3.5}})",
                         std::chrono::milliseconds(30));
    executor->add_answer("cpi", R"({
        "components": [
            {"scenario": "Disinflation", "mode": 1.8, "p10": 1.2, "p90": 2.4, "weight": 0.6},
            {"scenario": "Sticky", "mode": 3.5, "p10": 2.8, "p90": 4.6, "weight": 0.4}
        ]
    })", std::chrono::milliseconds(50));

    SpawnFunction spawn = make_spawn(executor, synthesizer);

    try {
        // Binary question with three agent-proposed sub-questions
        Question recession("recession-2027", QuestionKind::BINARY);
        recession.title = "Will the US enter a recession before 2027?";
        recession.sub_questions = parse_sub_questions(json::parse(R"([
            {"title": "Will unemployment exceed 5%?", "weight": 0.4},
            {"title": "Will the yield curve stay inverted?", "weight": 0.3},
            {"title": "Will GDP contract for two quarters?", "weight": 0.3}
        ])"), config.default_outcome_count);

        AggregateForecast binary = coordinator.decompose_and_aggregate(
            recession, coordinator.root_guard(), spawn, aggregator);
        std::cout << recession.title << "\n" << aggregate_to_json(binary).dump(2) << "\n\n";

        // Numeric question averaging two sub-forecasts over the same range
        Question inflation("inflation-2026", QuestionKind::NUMERIC);
        inflation.title = "What will 2026 headline inflation be (%)?";
        inflation.sub_questions = parse_sub_questions(json::parse(R"([
            {"id": "gdp", "title": "Inflation implied by growth models", "kind": "numeric",
             "bounds": {"lower": -2, "upper": 10, "upper_open": true}},
            {"id": "cpi", "title": "Inflation from CPI scenarios", "kind": "numeric",
             "bounds": {"lower": -2, "upper": 10, "upper_open": true}}
        ])"), config.default_outcome_count);

        AggregateForecast numeric = coordinator.decompose_and_aggregate(
            inflation, coordinator.root_guard(), spawn, aggregator);
        json numeric_json = aggregate_to_json(numeric);
        std::cout << inflation.title << "\n"
                  << "  cdf points: " << numeric_json["cdf"].size()
                  << ", median index value: " << numeric.cdf()[numeric.cdf().size() / 2]
                  << ", degraded: " << (numeric.degraded ? "yes" : "no") << "\n";

        // A nested decomposition attempt is refused at depth 1
        try {
            coordinator.decompose(recession, coordinator.root_guard().descend(), spawn);
        } catch (const RecursionLimitExceeded& e) {
            std::cout << "\nNested decomposition refused: " << e.what() << "\n";
        }
    } catch (const ForecastError& e) {
        logger.log_error(ForecastContext("example", "main"), e.what());
        std::cerr << e.what() << std::endl;
        return 1;
    }

    CoordinatorStats stats = coordinator.get_stats();
    std::cout << "\nUnits: " << stats.ok_count << " ok, " << stats.timed_out_count << " timed out, "
              << stats.failed_count << " failed, " << stats.detached_threads << " detached\n";

    logger.flush();
    return 0;
}
