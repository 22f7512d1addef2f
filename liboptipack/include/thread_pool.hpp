/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool that runs optimization jobs.
 */

#ifndef OPTIPACK_THREAD_POOL_HPP
#define OPTIPACK_THREAD_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace optipack {

/**
 * @brief FIFO job queue drained by a fixed set of std::jthread workers.
 *
 * @details Each task receives its worker's std::stop_token. request_stop()
 * discards queued tasks and signals the running ones, which are expected
 * to return at their next cancellation point. Workers are joined on
 * destruction.
 */
class ThreadPool {
public:
    using Task = std::function<void(std::stop_token)>;

    /**
     * @param threads Number of workers; 0 is treated as 1.
     */
    explicit ThreadPool(unsigned threads = std::thread::hardware_concurrency());

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queues a task behind those already waiting.
     * @throws std::runtime_error if the pool has been stopped.
     */
    void submit(Task task);

    /**
     * @brief Blocks until no task is queued or running.
     */
    void wait_idle();

    /**
     * @brief Drops queued tasks and asks running ones to stop. Idempotent.
     */
    void request_stop();

    /**
     * @brief Number of tasks queued or running.
     */
    [[nodiscard]] std::size_t pending() const;

    [[nodiscard]] bool stopped() const;

    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

private:
    void worker_loop(std::stop_token st);
    void finish_one();

    mutable std::mutex mtx_;
    std::condition_variable_any work_cv_; ///< new task or stop
    std::condition_variable idle_cv_;     ///< in_flight_ reached zero
    std::deque<Task> queue_;
    std::size_t in_flight_{0};            ///< queued plus running
    bool stopped_{false};
    std::vector<std::jthread> workers_;
};

} // namespace optipack

#endif // OPTIPACK_THREAD_POOL_HPP
