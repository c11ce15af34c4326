#include "util/WorkerPool.hpp"
#include "util/Logger.hpp"
#include <exception>

namespace rdu::util {

WorkerPool::WorkerPool(size_t num_threads) {
    if (num_threads == 0) num_threads = 1;

    Logger::debug("WorkerPool: Starting " + std::to_string(num_threads) + " worker threads");

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this]() {
            worker_thread();
        });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    Logger::debug("WorkerPool: Shutdown complete");
}

void WorkerPool::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        job_queue_.push(std::move(job));
    }
    cv_.notify_one();
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this]() {
        return job_queue_.empty() && active_jobs_ == 0;
    });
}

void WorkerPool::worker_thread() {
    while (true) {
        Job job;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this]() {
                return stop_ || !job_queue_.empty();
            });

            if (stop_ && job_queue_.empty()) {
                break;
            }

            job = std::move(job_queue_.front());
            job_queue_.pop();
            ++active_jobs_;
        }

        // Run outside the lock; a throwing job must not kill the worker or
        // leave active_jobs_ raised forever
        try {
            job();
        } catch (const std::exception& e) {
            Logger::error("WorkerPool: Job threw: " + std::string(e.what()));
        }

        bool idle = false;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --active_jobs_;
            idle = job_queue_.empty() && active_jobs_ == 0;
        }
        if (idle) {
            idle_cv_.notify_all();
        }
    }
}

}  // namespace rdu::util
