/**
 * @file worker_pool.hpp
 * @brief Fixed-size thread pool with bounded shutdown
 *
 * The pool drains a FIFO job queue with a fixed number of threads; the
 * thread count is the only admission control. Shutdown waits a bounded
 * grace period for running jobs and detaches threads that are still busy
 * afterwards, so a stuck external call can never block the caller
 * indefinitely.
 */

#ifndef FORECAST_WORKER_POOL_HPP
#define FORECAST_WORKER_POOL_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <set>
#include <thread>
#include <vector>

namespace forecast {

/**
 * @brief Fixed-size worker pool
 *
 * Usage Example:
 *   @code
 *   WorkerPool pool(4, std::chrono::milliseconds(500));
 *   pool.submit([] { run_unit(); });
 *   pool.shutdown(std::chrono::milliseconds(500));
 *   @endcode
 */
class WorkerPool {
public:
    using Job = std::function<void()>;

    /**
     * @param thread_count Number of worker threads (>= 1)
     * @param shutdown_grace Grace period used by the destructor
     *
     * @throws std::invalid_argument If thread_count is 0
     */
    explicit WorkerPool(
        size_t thread_count,
        std::chrono::milliseconds shutdown_grace = std::chrono::milliseconds(1000)
    );

    /**
     * @brief Shut down with the configured grace period
     */
    ~WorkerPool();

    // Disable copy and move
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a job
     *
     * Jobs must not throw; exceptions are caught and counted.
     *
     * @throws std::runtime_error If the pool is shut down
     */
    void submit(Job job);

    /**
     * @brief Stop intake, drop queued jobs and wait up to @p grace for running ones
     *
     * Threads that finished are joined; threads still running a job after
     * the grace period are detached. Idempotent.
     */
    void shutdown(std::chrono::milliseconds grace);

    /**
     * @brief Start a replacement for a worker stuck in an abandoned job
     *
     * The busy worker exits once its current job returns, so the number of
     * threads taking new jobs stays at the configured count.
     *
     * @param busy Id of the worker running the abandoned job
     * @return false if the pool is shut down or @p busy is not one of its workers
     */
    bool replace_worker(std::thread::id busy);

    size_t thread_count() const { return threads_.size(); }

    /**
     * @brief Workers started by replace_worker()
     */
    size_t replaced_count() const { return replaced_count_; }

    /**
     * @brief Jobs dropped from the queue at shutdown
     */
    size_t dropped_count() const;

    /**
     * @brief Jobs that escaped with an exception
     */
    size_t failed_job_count() const;

    /**
     * @brief Threads detached by shutdown because they were still busy
     */
    size_t detached_count() const { return detached_count_; }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable work_cv;
        std::condition_variable exit_cv;
        std::queue<Job> jobs;
        bool stopping;
        size_t exited;
        size_t dropped;
        size_t failed_jobs;
        std::set<std::thread::id> retiring;   ///< Workers to exit after their current job

        State() : stopping(false), exited(0), dropped(0), failed_jobs(0) {}
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<bool> exited;   ///< Guarded by State::mutex
    };

    void start_worker();

    static void run_worker(std::shared_ptr<State> state, std::shared_ptr<bool> exited);

    std::shared_ptr<State> state_;
    std::vector<Worker> threads_;
    std::chrono::milliseconds shutdown_grace_;
    size_t detached_count_;
    size_t replaced_count_;
    bool shut_down_;
};

} // namespace forecast

#endif // FORECAST_WORKER_POOL_HPP
