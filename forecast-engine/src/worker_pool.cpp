/**
 * @file worker_pool.cpp
 * @brief Implementation of WorkerPool
 */

#include "worker_pool.hpp"
#include <iostream>
#include <stdexcept>

namespace forecast {

WorkerPool::WorkerPool(size_t thread_count, std::chrono::milliseconds shutdown_grace)
    : state_(std::make_shared<State>()),
      shutdown_grace_(shutdown_grace),
      detached_count_(0),
      replaced_count_(0),
      shut_down_(false) {

    if (thread_count == 0) {
        throw std::invalid_argument("WorkerPool: thread_count must be at least 1");
    }

    threads_.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        start_worker();
    }
}

WorkerPool::~WorkerPool() {
    shutdown(shutdown_grace_);
}

void WorkerPool::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->stopping) {
            throw std::runtime_error("WorkerPool: submit after shutdown");
        }
        state_->jobs.push(std::move(job));
    }
    state_->work_cv.notify_one();
}

void WorkerPool::start_worker() {
    Worker worker;
    worker.exited = std::make_shared<bool>(false);
    worker.thread = std::thread(&WorkerPool::run_worker, state_, worker.exited);
    threads_.push_back(std::move(worker));
}

bool WorkerPool::replace_worker(std::thread::id busy) {
    if (shut_down_) {
        return false;
    }

    bool known = false;
    for (const auto& worker : threads_) {
        if (worker.thread.get_id() == busy) {
            known = true;
            break;
        }
    }
    if (!known) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->retiring.insert(busy).second) {
            return false;
        }
    }
    start_worker();
    replaced_count_++;
    return true;
}

void WorkerPool::shutdown(std::chrono::milliseconds grace) {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->stopping = true;
    state_->dropped += state_->jobs.size();
    std::queue<Job>().swap(state_->jobs);
    state_->work_cv.notify_all();

    const size_t total = threads_.size();
    state_->exit_cv.wait_for(lock, grace, [this, total] { return state_->exited == total; });

    std::vector<bool> finished;
    finished.reserve(total);
    for (const auto& worker : threads_) {
        finished.push_back(*worker.exited);
    }
    lock.unlock();

    for (size_t i = 0; i < total; ++i) {
        if (!threads_[i].thread.joinable()) {
            continue;
        }
        if (finished[i]) {
            threads_[i].thread.join();
        } else {
            // Still inside a job; the shared state outlives the pool
            threads_[i].thread.detach();
            detached_count_++;
        }
    }

    if (detached_count_ > 0) {
        std::cerr << "Warning: WorkerPool detached " << detached_count_
                  << " busy thread(s) after " << grace.count() << " ms grace" << std::endl;
    }
}

size_t WorkerPool::dropped_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->dropped;
}

size_t WorkerPool::failed_job_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->failed_jobs;
}

void WorkerPool::run_worker(std::shared_ptr<State> state, std::shared_ptr<bool> exited) {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->work_cv.wait(lock, [&state] { return state->stopping || !state->jobs.empty(); });
            if (state->stopping) {
                break;
            }
            job = std::move(state->jobs.front());
            state->jobs.pop();
        }

        try {
            job();
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->failed_jobs++;
            std::cerr << "Warning: WorkerPool job threw: " << e.what() << std::endl;
        } catch (...) {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->failed_jobs++;
            std::cerr << "Warning: WorkerPool job threw an unknown exception" << std::endl;
        }

        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->retiring.erase(std::this_thread::get_id()) > 0) {
            break;
        }
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    *exited = true;
    state->exited++;
    state->exit_cv.notify_all();
}

} // namespace forecast
