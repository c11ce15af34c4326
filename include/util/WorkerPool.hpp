#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>
#include <cstddef>

namespace rdu::util {

// Fixed pool of worker threads draining a FIFO job queue.
// Jobs may submit further jobs; wait_idle() returns once the queue is empty
// and no job is running, so recursive fan-out completes before it returns.
class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(size_t num_threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(Job job);

    // Blocks until every submitted job (including ones submitted by jobs) finished
    void wait_idle();

    [[nodiscard]] size_t thread_count() const { return workers_.size(); }

private:
    void worker_thread();

    std::vector<std::thread> workers_;

    std::queue<Job> job_queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;

    size_t active_jobs_ = 0;  // guarded by queue_mutex_
    std::atomic<bool> stop_{false};
};

}  // namespace rdu::util
