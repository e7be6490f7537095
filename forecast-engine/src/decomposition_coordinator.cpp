/**
 * @file decomposition_coordinator.cpp
 * @brief Implementation of DecompositionCoordinator
 */

#include "decomposition_coordinator.hpp"
#include "forecast_errors.hpp"
#include "worker_pool.hpp"
#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <memory>
#include <optional>
#include <set>
#include <thread>

namespace forecast {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds POLL_INTERVAL(5);

/**
 * @brief Per-unit bookkeeping shared with the worker running it
 */
struct UnitSlot {
    enum class Phase { PENDING, RUNNING, DONE };

    Phase phase;
    Clock::time_point started;
    Clock::time_point finished;
    PartialResult result;
    CancellationToken token;
    std::thread::id worker;

    UnitSlot() : phase(Phase::PENDING) {}
};

/**
 * @brief State of one decompose() call; outlives it if a unit is detached
 */
struct DecompositionRun {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<UnitSlot> slots;
};

double elapsed_ms(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

void finish(UnitSlot& slot, PartialResult result, Clock::time_point now) {
    slot.result = std::move(result);
    slot.phase = UnitSlot::Phase::DONE;
    slot.finished = now;
}

PartialResult run_unit(const SpawnFunction& spawn, const SubQuestion& sub_question, const UnitContext& ctx) {
    try {
        PartialResult result = spawn(sub_question, ctx);
        if (result.status == PartialResult::Status::OK && !result.value) {
            return PartialResult::failed(sub_question.id, ErrorKind::INTERNAL,
                                         "unit reported OK without a value");
        }
        return result;
    } catch (const TimeoutFailure& e) {
        return PartialResult::timed_out(sub_question.id, e.what());
    } catch (const RecursionLimitExceeded& e) {
        return PartialResult::failed(sub_question.id, ErrorKind::RECURSION_LIMIT, e.what());
    } catch (const ValidationError& e) {
        return PartialResult::failed(sub_question.id, ErrorKind::VALIDATION, e.what());
    } catch (const ExternalCallError& e) {
        return PartialResult::failed(sub_question.id, ErrorKind::EXTERNAL_FAILURE, e.what());
    } catch (const std::exception& e) {
        return PartialResult::failed(sub_question.id, ErrorKind::INTERNAL, e.what());
    } catch (...) {
        return PartialResult::failed(sub_question.id, ErrorKind::INTERNAL, "unknown exception");
    }
}

} // namespace

DecompositionCoordinator::DecompositionCoordinator(
    const CoordinatorConfig& config,
    Logger* logger
)
    : config_(config),
      logger_(logger ? logger : &Logger::get_instance()) {
    if (config_.max_workers == 0) {
        throw ValidationError("max_workers must be at least 1");
    }
    if (config_.unit_timeout.count() <= 0) {
        throw ValidationError("unit_timeout must be positive");
    }
    if (config_.cancel_grace.count() < 0) {
        throw ValidationError("cancel_grace must not be negative");
    }
}

void DecompositionCoordinator::validate_request(const Question& question) const {
    if (question.sub_questions.empty()) {
        throw ValidationError("question '" + question.id + "' has no sub-questions");
    }

    std::set<std::string> seen;
    for (const auto& sub_question : question.sub_questions) {
        if (sub_question.id.empty()) {
            throw ValidationError("sub-question of '" + question.id + "' has an empty id");
        }
        if (!seen.insert(sub_question.id).second) {
            throw ValidationError("duplicate sub-question id '" + sub_question.id + "'");
        }
        if (sub_question.weight && (!std::isfinite(*sub_question.weight) || *sub_question.weight < 0.0)) {
            throw ValidationError("sub-question '" + sub_question.id + "' has invalid weight " +
                                  std::to_string(*sub_question.weight));
        }
    }
}

std::vector<PartialResult> DecompositionCoordinator::decompose(
    const Question& question,
    const RecursionGuard& guard,
    const SpawnFunction& spawn,
    const CancellationToken& cancel
) {
    ForecastContext ctx(question.id, "decompose");
    ctx.depth = guard.current_depth;

    if (guard.exhausted()) {
        logger_->log_recursion_rejected(ctx, guard);
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.rejected_count++;
        }
        throw RecursionLimitExceeded(guard.current_depth, guard.max_depth);
    }
    validate_request(question);

    const size_t unit_count = question.sub_questions.size();
    const size_t worker_count = std::min(config_.max_workers, unit_count);
    const RecursionGuard child_guard = guard.descend();
    const auto unit_timeout = config_.unit_timeout;
    const auto grace = config_.cancel_grace;

    logger_->log_decomposition_start(ctx, unit_count, worker_count, guard);

    auto run = std::make_shared<DecompositionRun>();
    run->slots.resize(unit_count);
    for (auto& slot : run->slots) {
        slot.token = cancel.child();
    }

    const Clock::time_point start = Clock::now();

    WorkerPool pool(worker_count, grace);

    for (size_t i = 0; i < unit_count; ++i) {
        SubQuestion sub_question = question.sub_questions[i];
        sub_question.depth = guard.current_depth + 1;
        std::string parent_id = question.id;

        pool.submit([run, i, sub_question, spawn, child_guard, unit_timeout, parent_id]() {
            UnitContext unit;
            unit.guard = child_guard;
            unit.parent_question_id = parent_id;
            {
                std::lock_guard<std::mutex> lock(run->mutex);
                UnitSlot& slot = run->slots[i];
                if (slot.phase != UnitSlot::Phase::PENDING) {
                    return;
                }
                if (slot.token.is_cancelled()) {
                    finish(slot, PartialResult::failed(sub_question.id, ErrorKind::CANCELLED,
                                                       "cancelled before start"), Clock::now());
                    run->cv.notify_all();
                    return;
                }
                slot.phase = UnitSlot::Phase::RUNNING;
                slot.started = Clock::now();
                slot.worker = std::this_thread::get_id();
                unit.cancel = slot.token;
                unit.deadline = slot.started + unit_timeout;
            }

            PartialResult result = run_unit(spawn, sub_question, unit);

            std::lock_guard<std::mutex> lock(run->mutex);
            UnitSlot& slot = run->slots[i];
            if (slot.phase == UnitSlot::Phase::RUNNING) {
                finish(slot, std::move(result), Clock::now());
            }
            run->cv.notify_all();
        });
    }

    std::optional<Clock::time_point> cancel_deadline;
    std::vector<PartialResult> results;
    results.reserve(unit_count);
    {
        std::unique_lock<std::mutex> lock(run->mutex);
        for (;;) {
            const Clock::time_point now = Clock::now();

            if (!cancel_deadline && cancel.is_cancelled()) {
                cancel_deadline = now + grace;
                for (size_t i = 0; i < unit_count; ++i) {
                    UnitSlot& slot = run->slots[i];
                    slot.token.cancel();
                    if (slot.phase == UnitSlot::Phase::PENDING) {
                        finish(slot, PartialResult::failed(question.sub_questions[i].id, ErrorKind::CANCELLED,
                                                           "cancelled before start"), now);
                    }
                }
            }

            bool any_pending = false;
            for (const auto& slot : run->slots) {
                if (slot.phase == UnitSlot::Phase::PENDING) {
                    any_pending = true;
                    break;
                }
            }

            bool all_done = true;
            for (size_t i = 0; i < unit_count; ++i) {
                UnitSlot& slot = run->slots[i];
                const std::string& id = question.sub_questions[i].id;

                // Each unit's budget starts when a worker picks it up
                if (slot.phase == UnitSlot::Phase::RUNNING && now >= slot.started + unit_timeout) {
                    slot.token.cancel();
                    finish(slot, PartialResult::timed_out(id, "unit exceeded " +
                           std::to_string(unit_timeout.count()) + " ms"), now);
                    // The abandoned call may keep its thread; queued units get a fresh one
                    if (any_pending && !pool.replace_worker(slot.worker)) {
                        logger_->log_warning(ctx, "no replacement worker for timed-out unit '" + id + "'");
                    }
                }
                if (slot.phase == UnitSlot::Phase::RUNNING && cancel_deadline && now >= *cancel_deadline) {
                    finish(slot, PartialResult::failed(id, ErrorKind::CANCELLED,
                           "did not stop within " + std::to_string(grace.count()) + " ms of cancellation"), now);
                }
                if (slot.phase != UnitSlot::Phase::DONE) {
                    all_done = false;
                }
            }

            if (all_done) {
                break;
            }
            run->cv.wait_for(lock, POLL_INTERVAL);
        }

        for (size_t i = 0; i < unit_count; ++i) {
            const UnitSlot& slot = run->slots[i];
            const SubQuestion& sub_question = question.sub_questions[i];

            PartialResult result = slot.result;
            result.sub_question_id = sub_question.id;
            result.weight = sub_question.weight;
            result.duration_ms = slot.started == Clock::time_point()
                ? 0.0
                : elapsed_ms(slot.started, slot.finished);
            results.push_back(std::move(result));
        }
    }

    pool.shutdown(grace);

    for (const auto& result : results) {
        ForecastContext unit_ctx = ctx;
        unit_ctx.sub_question_id = result.sub_question_id;
        unit_ctx.depth = guard.current_depth + 1;
        logger_->log_unit_result(unit_ctx, result);
    }
    if (pool.detached_count() > 0) {
        logger_->log_warning(ctx, std::to_string(pool.detached_count()) +
                             " unit thread(s) still busy after grace period were detached");
    }

    double total_ms = elapsed_ms(start, Clock::now());
    logger_->log_decomposition_complete(ctx, results, total_ms);
    record(results, pool.detached_count(), total_ms);

    return results;
}

AggregateForecast DecompositionCoordinator::decompose_and_aggregate(
    const Question& question,
    const RecursionGuard& guard,
    const SpawnFunction& spawn,
    const SubForecastAggregator& aggregator,
    const CancellationToken& cancel
) {
    std::vector<PartialResult> results = decompose(question, guard, spawn, cancel);

    ForecastContext ctx(question.id, "aggregate");
    ctx.depth = guard.current_depth;
    return aggregator.aggregate(results, question.kind, ctx);
}

CoordinatorStats DecompositionCoordinator::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void DecompositionCoordinator::reset_stats() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_ = CoordinatorStats();
}

void DecompositionCoordinator::record(
    const std::vector<PartialResult>& results,
    size_t detached,
    double elapsed
) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.decompositions++;
    stats_.detached_threads += detached;
    stats_.total_elapsed_ms += elapsed;
    for (const auto& result : results) {
        switch (result.status) {
            case PartialResult::Status::OK:
                stats_.ok_count++;
                break;
            case PartialResult::Status::TIMED_OUT:
                stats_.timed_out_count++;
                break;
            case PartialResult::Status::FAILED:
                stats_.failed_count++;
                if (result.error == ErrorKind::CANCELLED) {
                    stats_.cancelled_count++;
                }
                break;
        }
    }
}

} // namespace forecast
