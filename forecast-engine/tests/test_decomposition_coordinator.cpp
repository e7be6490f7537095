/**
 * @file test_decomposition_coordinator.cpp
 * @brief Unit tests for DecompositionCoordinator
 *
 * Spawn callbacks capture shared state by value: a unit that outlives its
 * decomposition keeps running on a detached thread after the test returns.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/decomposition_coordinator.hpp"
#include "../src/external_executor.hpp"
#include "../src/forecast_errors.hpp"
#include <atomic>
#include <memory>
#include <thread>

using namespace forecast;
using Catch::Matchers::WithinAbs;

namespace {

/**
 * @brief Mock executor: answers every call with a fixed body after a delay
 *
 * Honors the caller's token and deadline the way a real executor must.
 */
class MockExecutor : public IRateLimitedExecutor {
public:
    MockExecutor(std::chrono::milliseconds delay, const std::string& body)
        : delay_(delay), body_(body), calls_(0) {}

    ExternalCallResult call(const ExternalCall& call, const CancellationToken& cancel) override {
        calls_++;
        if (call.operation == "unavailable") {
            throw ExternalCallError("service '" + call.operation + "' unavailable");
        }

        auto until = std::chrono::steady_clock::now() + delay_;
        while (std::chrono::steady_clock::now() < until) {
            if (cancel.is_cancelled()) {
                throw TimeoutFailure("cancelled while waiting for " + call.operation);
            }
            if (std::chrono::steady_clock::now() >= call.deadline) {
                throw TimeoutFailure(call.operation + " passed its deadline");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }

        ExternalCallResult result;
        result.payload = body_;
        return result;
    }

    int call_count() const { return calls_; }

private:
    std::chrono::milliseconds delay_;
    std::string body_;
    std::atomic<int> calls_;
};

Question binary_question(const std::vector<std::string>& ids) {
    Question question("parent", QuestionKind::BINARY);
    for (const auto& id : ids) {
        question.sub_questions.push_back(SubQuestion(id, QuestionKind::BINARY));
    }
    return question;
}

CoordinatorConfig fast_config() {
    CoordinatorConfig config;
    config.max_workers = 4;
    config.unit_timeout = std::chrono::milliseconds(2000);
    config.cancel_grace = std::chrono::milliseconds(200);
    config.max_depth = 1;
    return config;
}

/**
 * @brief Sleep in small steps until done or cancelled
 */
bool sleep_unless_cancelled(std::chrono::milliseconds duration, const CancellationToken& token) {
    auto until = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < until) {
        if (token.is_cancelled()) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

} // namespace

TEST_CASE("Recursion guard rejects before scheduling", "[coordinator]") {
    DecompositionCoordinator coordinator(fast_config());
    auto calls = std::make_shared<std::atomic<int>>(0);
    SpawnFunction spawn = [calls](const SubQuestion& sq, const UnitContext&) {
        (*calls)++;
        return PartialResult::ok(sq.id, 0.5);
    };

    Question question = binary_question({"a", "b"});

    SECTION("Depth equal to the budget is rejected") {
        REQUIRE_THROWS_AS(coordinator.decompose(question, RecursionGuard(1, 1), spawn),
                          RecursionLimitExceeded);
        REQUIRE(calls->load() == 0);
        REQUIRE(coordinator.get_stats().rejected_count == 1);
    }

    SECTION("Exception carries the depths") {
        try {
            coordinator.decompose(question, RecursionGuard(3, 2), spawn);
            FAIL("expected RecursionLimitExceeded");
        } catch (const RecursionLimitExceeded& e) {
            REQUIRE(e.current_depth() == 3);
            REQUIRE(e.max_depth() == 2);
        }
        REQUIRE(calls->load() == 0);
    }

    SECTION("Root guard follows the configured budget") {
        REQUIRE(coordinator.root_guard().current_depth == 0);
        REQUIRE(coordinator.root_guard().max_depth == 1);
        REQUIRE_NOTHROW(coordinator.decompose(question, coordinator.root_guard(), spawn));
        REQUIRE(calls->load() == 2);
    }
}

TEST_CASE("Nested decomposition stops at the depth budget", "[coordinator]") {
    CoordinatorConfig config = fast_config();
    config.max_depth = 2;
    auto coordinator = std::make_shared<DecompositionCoordinator>(config);
    auto nested_rejections = std::make_shared<std::atomic<int>>(0);

    // Every unit tries to decompose again with the guard it was given
    auto spawn = std::make_shared<SpawnFunction>();
    std::weak_ptr<SpawnFunction> self = spawn;
    *spawn = [coordinator, nested_rejections, self](const SubQuestion& sq, const UnitContext& ctx) {
        Question nested(sq.id, QuestionKind::BINARY);
        nested.sub_questions.push_back(SubQuestion(sq.id + ".x", QuestionKind::BINARY));
        auto recurse = self.lock();
        if (!recurse) {
            return PartialResult::failed(sq.id, ErrorKind::INTERNAL, "spawn released");
        }
        try {
            AggregateForecast forecast = coordinator->decompose_and_aggregate(
                nested, ctx.guard, *recurse, SubForecastAggregator(), ctx.cancel);
            return PartialResult::ok(sq.id, forecast.probability());
        } catch (const RecursionLimitExceeded&) {
            (*nested_rejections)++;
            return PartialResult::ok(sq.id, 0.25);
        }
    };

    Question question = binary_question({"a", "b"});
    std::vector<PartialResult> results = coordinator->decompose(question, coordinator->root_guard(), *spawn);

    REQUIRE(results.size() == 2);
    REQUIRE(results[0].is_ok());
    REQUIRE(results[1].is_ok());
    // Depth 0 -> 1 is allowed, depth 1 -> 2 is allowed, depth 2 -> 3 is rejected
    REQUIRE(nested_rejections->load() == 2);
    REQUIRE(coordinator->get_stats().rejected_count == 2);
}

TEST_CASE("Results are returned in request order", "[coordinator]") {
    DecompositionCoordinator coordinator(fast_config());

    // Later units finish first
    SpawnFunction spawn = [](const SubQuestion& sq, const UnitContext& ctx) {
        int delay = 40 - 10 * (sq.id[0] - 'a');
        sleep_unless_cancelled(std::chrono::milliseconds(delay), ctx.cancel);
        return PartialResult::ok(sq.id, 0.1 * (sq.id[0] - 'a' + 1));
    };

    Question question = binary_question({"a", "b", "c", "d"});
    question.sub_questions[1].weight = 0.4;
    std::vector<PartialResult> results = coordinator.decompose(question, coordinator.root_guard(), spawn);

    REQUIRE(results.size() == 4);
    for (size_t i = 0; i < results.size(); ++i) {
        REQUIRE(results[i].sub_question_id == question.sub_questions[i].id);
        REQUIRE(results[i].is_ok());
        REQUIRE(results[i].duration_ms >= 0.0);
    }
    REQUIRE_THAT(std::get<double>(*results[2].value), WithinAbs(0.3, 1e-12));
    REQUIRE(results[1].weight == 0.4);
    REQUIRE_FALSE(results[0].weight.has_value());
}

TEST_CASE("Sub-questions run concurrently up to max_workers", "[coordinator]") {
    CoordinatorConfig config = fast_config();
    config.max_workers = 2;
    DecompositionCoordinator coordinator(config);

    auto running = std::make_shared<std::atomic<int>>(0);
    auto peak = std::make_shared<std::atomic<int>>(0);
    SpawnFunction spawn = [running, peak](const SubQuestion& sq, const UnitContext& ctx) {
        int now = ++(*running);
        int seen = peak->load();
        while (now > seen && !peak->compare_exchange_weak(seen, now)) {
        }
        sleep_unless_cancelled(std::chrono::milliseconds(30), ctx.cancel);
        (*running)--;
        return PartialResult::ok(sq.id, 0.5);
    };

    std::vector<PartialResult> results =
        coordinator.decompose(binary_question({"a", "b", "c", "d", "e"}), coordinator.root_guard(), spawn);

    REQUIRE(results.size() == 5);
    REQUIRE(peak->load() <= 2);
    REQUIRE(peak->load() >= 1);
}

TEST_CASE("A slow unit times out without affecting siblings", "[coordinator]") {
    CoordinatorConfig config = fast_config();
    config.unit_timeout = std::chrono::milliseconds(100);
    config.cancel_grace = std::chrono::milliseconds(100);
    DecompositionCoordinator coordinator(config);

    SpawnFunction spawn = [](const SubQuestion& sq, const UnitContext& ctx) {
        if (sq.id == "slow") {
            if (!sleep_unless_cancelled(std::chrono::milliseconds(5000), ctx.cancel)) {
                throw TimeoutFailure("stopped after cancellation");
            }
        }
        return PartialResult::ok(sq.id, 0.6);
    };

    Question question = binary_question({"fast1", "slow", "fast2"});
    auto start = std::chrono::steady_clock::now();
    std::vector<PartialResult> results = coordinator.decompose(question, coordinator.root_guard(), spawn);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(results[0].status == PartialResult::Status::OK);
    REQUIRE(results[1].status == PartialResult::Status::TIMED_OUT);
    REQUIRE(results[2].status == PartialResult::Status::OK);
    REQUIRE(elapsed < std::chrono::milliseconds(2000));

    CoordinatorStats stats = coordinator.get_stats();
    REQUIRE(stats.ok_count == 2);
    REQUIRE(stats.timed_out_count == 1);

    SECTION("Aggregation still produces a forecast") {
        AggregateForecast forecast = SubForecastAggregator().aggregate(results, QuestionKind::BINARY);
        REQUIRE_THAT(forecast.probability(), WithinAbs(0.6, 1e-12));
        REQUIRE(forecast.excluded_count == 1);
    }
}

TEST_CASE("A unit that ignores cancellation is detached", "[coordinator]") {
    CoordinatorConfig config = fast_config();
    config.max_workers = 2;
    config.unit_timeout = std::chrono::milliseconds(50);
    config.cancel_grace = std::chrono::milliseconds(50);
    DecompositionCoordinator coordinator(config);

    SpawnFunction spawn = [](const SubQuestion& sq, const UnitContext&) {
        if (sq.id == "stuck") {
            std::this_thread::sleep_for(std::chrono::milliseconds(400));
        }
        return PartialResult::ok(sq.id, 0.5);
    };

    auto start = std::chrono::steady_clock::now();
    std::vector<PartialResult> results =
        coordinator.decompose(binary_question({"ok", "stuck"}), coordinator.root_guard(), spawn);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(results[0].is_ok());
    REQUIRE(results[1].status == PartialResult::Status::TIMED_OUT);
    REQUIRE(elapsed < std::chrono::milliseconds(350));
    REQUIRE(coordinator.get_stats().detached_threads == 1);
}

TEST_CASE("A queued unit gets its full budget behind a timed-out one", "[coordinator]") {
    CoordinatorConfig config = fast_config();
    config.max_workers = 1;
    config.unit_timeout = std::chrono::milliseconds(150);
    config.cancel_grace = std::chrono::milliseconds(20);
    DecompositionCoordinator coordinator(config);

    // "slow" ignores its token and holds the only worker past its timeout
    SpawnFunction spawn = [](const SubQuestion& sq, const UnitContext& ctx) {
        if (sq.id == "slow") {
            std::this_thread::sleep_for(std::chrono::milliseconds(450));
        } else {
            sleep_unless_cancelled(std::chrono::milliseconds(60), ctx.cancel);
        }
        return PartialResult::ok(sq.id, 0.4);
    };

    auto start = std::chrono::steady_clock::now();
    std::vector<PartialResult> results =
        coordinator.decompose(binary_question({"slow", "healthy"}), coordinator.root_guard(), spawn);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(results[0].status == PartialResult::Status::TIMED_OUT);
    REQUIRE(results[1].status == PartialResult::Status::OK);
    REQUIRE(results[1].duration_ms < 150.0);
    REQUIRE(elapsed < std::chrono::milliseconds(400));
    REQUIRE(coordinator.get_stats().detached_threads == 1);
}

TEST_CASE("Unit exceptions map to failure kinds", "[coordinator]") {
    DecompositionCoordinator coordinator(fast_config());

    SpawnFunction spawn = [](const SubQuestion& sq, const UnitContext&) -> PartialResult {
        if (sq.id == "validation") throw ValidationError("bad percentile");
        if (sq.id == "external") throw ExternalCallError("HTTP 503");
        if (sq.id == "timeout") throw TimeoutFailure("research tool");
        if (sq.id == "depth") throw RecursionLimitExceeded(2, 2);
        if (sq.id == "internal") throw std::runtime_error("boom");
        if (sq.id == "unknown") throw 42;
        PartialResult empty;
        empty.sub_question_id = sq.id;
        empty.status = PartialResult::Status::OK;
        return empty;
    };

    Question question =
        binary_question({"validation", "external", "timeout", "depth", "internal", "empty", "unknown"});
    std::vector<PartialResult> results = coordinator.decompose(question, coordinator.root_guard(), spawn);

    REQUIRE(results[0].error == ErrorKind::VALIDATION);
    REQUIRE(results[0].error_message.find("bad percentile") != std::string::npos);
    REQUIRE(results[1].error == ErrorKind::EXTERNAL_FAILURE);
    REQUIRE(results[2].status == PartialResult::Status::TIMED_OUT);
    REQUIRE(results[3].error == ErrorKind::RECURSION_LIMIT);
    REQUIRE(results[4].error == ErrorKind::INTERNAL);
    REQUIRE(results[4].error_message == "boom");
    REQUIRE(results[5].error == ErrorKind::INTERNAL);
    REQUIRE(results[6].status == PartialResult::Status::FAILED);
    REQUIRE(results[6].error == ErrorKind::INTERNAL);
    REQUIRE(results[6].error_message == "unknown exception");

    REQUIRE_THROWS_AS(
        coordinator.decompose_and_aggregate(question, coordinator.root_guard(), spawn, SubForecastAggregator()),
        AggregationError);
}

TEST_CASE("Parent cancellation stops pending and running units", "[coordinator]") {
    CoordinatorConfig config = fast_config();
    config.max_workers = 1;
    config.unit_timeout = std::chrono::milliseconds(5000);
    config.cancel_grace = std::chrono::milliseconds(200);
    DecompositionCoordinator coordinator(config);

    CancellationToken parent;
    auto started = std::make_shared<std::atomic<int>>(0);
    SpawnFunction spawn = [started](const SubQuestion& sq, const UnitContext& ctx) {
        (*started)++;
        if (!sleep_unless_cancelled(std::chrono::milliseconds(5000), ctx.cancel)) {
            return PartialResult::failed(sq.id, ErrorKind::CANCELLED, "stopped");
        }
        return PartialResult::ok(sq.id, 0.5);
    };

    std::thread canceller([parent]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        parent.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    std::vector<PartialResult> results =
        coordinator.decompose(binary_question({"a", "b", "c"}), coordinator.root_guard(), spawn, parent);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    REQUIRE(results.size() == 3);
    for (const auto& result : results) {
        REQUIRE(result.status == PartialResult::Status::FAILED);
        REQUIRE(result.error == ErrorKind::CANCELLED);
    }
    REQUIRE(started->load() == 1);
    REQUIRE(elapsed < std::chrono::milliseconds(1000));
    REQUIRE(coordinator.get_stats().cancelled_count == 3);
}

TEST_CASE("Decomposition request validation", "[coordinator]") {
    DecompositionCoordinator coordinator(fast_config());
    SpawnFunction spawn = [](const SubQuestion& sq, const UnitContext&) {
        return PartialResult::ok(sq.id, 0.5);
    };

    SECTION("Empty sub-question list") {
        Question question("parent", QuestionKind::BINARY);
        REQUIRE_THROWS_AS(coordinator.decompose(question, coordinator.root_guard(), spawn), ValidationError);
    }

    SECTION("Duplicate ids") {
        REQUIRE_THROWS_AS(coordinator.decompose(binary_question({"a", "a"}), coordinator.root_guard(), spawn),
                          ValidationError);
    }

    SECTION("Negative weight") {
        Question question = binary_question({"a", "b"});
        question.sub_questions[0].weight = -0.5;
        REQUIRE_THROWS_AS(coordinator.decompose(question, coordinator.root_guard(), spawn), ValidationError);
    }

    SECTION("Invalid configuration") {
        CoordinatorConfig config;
        config.max_workers = 0;
        REQUIRE_THROWS_AS(DecompositionCoordinator(config), ValidationError);
    }
}

TEST_CASE("Units receive their context", "[coordinator]") {
    CoordinatorConfig config = fast_config();
    config.max_depth = 3;
    DecompositionCoordinator coordinator(config);

    SpawnFunction spawn = [](const SubQuestion& sq, const UnitContext& ctx) {
        if (ctx.guard.current_depth != 2 || ctx.guard.max_depth != 3) {
            throw std::runtime_error("wrong guard");
        }
        if (sq.depth != 2 || ctx.parent_question_id != "parent") {
            throw std::runtime_error("wrong unit metadata");
        }
        if (ctx.deadline == std::chrono::steady_clock::time_point::max()) {
            throw std::runtime_error("missing deadline");
        }
        return PartialResult::ok(sq.id, 0.5);
    };

    std::vector<PartialResult> results =
        coordinator.decompose(binary_question({"a"}), RecursionGuard(1, 3), spawn);

    REQUIRE(results[0].is_ok());
}

TEST_CASE("Units call a rate-limited executor", "[coordinator]") {
    CoordinatorConfig config = fast_config();
    config.unit_timeout = std::chrono::milliseconds(150);
    config.cancel_grace = std::chrono::milliseconds(100);
    DecompositionCoordinator coordinator(config);

    auto executor = std::make_shared<MockExecutor>(std::chrono::milliseconds(20), "0.7");
    auto slow_executor = std::make_shared<MockExecutor>(std::chrono::milliseconds(3000), "0.1");

    SpawnFunction spawn = [executor, slow_executor](const SubQuestion& sq, const UnitContext& ctx) {
        ExternalCall call(sq.id == "down" ? "unavailable" : "forecast", "{\"id\":\"" + sq.id + "\"}");
        call.deadline = ctx.deadline;
        call.metadata["parent"] = ctx.parent_question_id;

        IRateLimitedExecutor& target = sq.id == "slow"
            ? static_cast<IRateLimitedExecutor&>(*slow_executor)
            : static_cast<IRateLimitedExecutor&>(*executor);
        ExternalCallResult response = target.call(call, ctx.cancel);
        return PartialResult::ok(sq.id, std::stod(response.payload));
    };

    Question question = binary_question({"a", "slow", "down", "b"});
    AggregateForecast forecast = coordinator.decompose_and_aggregate(
        question, coordinator.root_guard(), spawn, SubForecastAggregator());

    REQUIRE_THAT(forecast.probability(), WithinAbs(0.7, 1e-12));
    REQUIRE(forecast.contributing_count == 2);
    REQUIRE(forecast.excluded_count == 2);
    REQUIRE(executor->call_count() == 3);

    CoordinatorStats stats = coordinator.get_stats();
    REQUIRE(stats.timed_out_count == 1);
    REQUIRE(stats.failed_count == 1);
}

TEST_CASE("Coordinator statistics", "[coordinator]") {
    DecompositionCoordinator coordinator(fast_config());
    SpawnFunction spawn = [](const SubQuestion& sq, const UnitContext&) {
        return PartialResult::ok(sq.id, 0.5);
    };

    coordinator.decompose(binary_question({"a", "b"}), coordinator.root_guard(), spawn);
    coordinator.decompose(binary_question({"c"}), coordinator.root_guard(), spawn);

    CoordinatorStats stats = coordinator.get_stats();
    REQUIRE(stats.decompositions == 2);
    REQUIRE(stats.ok_count == 3);
    REQUIRE(stats.total_elapsed_ms >= 0.0);

    coordinator.reset_stats();
    REQUIRE(coordinator.get_stats().decompositions == 0);
}
