#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"
#include <stdexcept>

namespace optipack {

ThreadPool::ThreadPool(const unsigned threads) {
    const unsigned count = threads == 0 ? 1 : threads;
    workers_.reserve(count);
    for (unsigned i = 0; i < count; ++i) {
        workers_.emplace_back([this](const std::stop_token st) { worker_loop(st); });
    }
}

ThreadPool::~ThreadPool() {
    request_stop();
}

void ThreadPool::submit(Task task) {
    {
        std::lock_guard lock(mtx_);
        if (stopped_) {
            throw std::runtime_error("submit on stopped ThreadPool");
        }
        queue_.push_back(std::move(task));
        ++in_flight_;
    }
    work_cv_.notify_one();
}

void ThreadPool::worker_loop(const std::stop_token st) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(mtx_);
            if (!work_cv_.wait(lock, st, [this] { return stopped_ || !queue_.empty(); })) {
                return; // stop requested while idle
            }
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            task(st);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, std::string("Task escaped with exception: ") + e.what(), "ThreadPool");
        }
        finish_one();
    }
}

void ThreadPool::finish_one() {
    {
        std::lock_guard lock(mtx_);
        --in_flight_;
    }
    idle_cv_.notify_all();
}

void ThreadPool::request_stop() {
    {
        std::lock_guard lock(mtx_);
        stopped_ = true;
        in_flight_ -= queue_.size();
        queue_.clear();
    }
    idle_cv_.notify_all();
    work_cv_.notify_all();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(mtx_);
    idle_cv_.wait(lock, [this] { return in_flight_ == 0; });
}

std::size_t ThreadPool::pending() const {
    std::lock_guard lock(mtx_);
    return in_flight_;
}

bool ThreadPool::stopped() const {
    std::lock_guard lock(mtx_);
    return stopped_;
}

} // namespace optipack
