#pragma once

#include "image_resizer.hpp"

#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace coco_tools {

// Runs independent jobs on a fixed set of threads. The first failing job
// stops further dequeuing; run() joins every worker before rethrowing it.
class ResizePool {
public:
    using Job = std::function<void()>;

    explicit ResizePool(int workers = 0);
    ~ResizePool();

    // Non-copyable
    ResizePool(const ResizePool&) = delete;
    ResizePool& operator=(const ResizePool&) = delete;

    void run(std::vector<Job> jobs);

    // Convenience: one job per resize task.
    void run(const std::vector<ResizeTask>& tasks, const RetryPolicy& retry);

    int workers() const { return workers_; }
    size_t completed() const { return completed_; }
    size_t skipped() const { return skipped_; }

private:
    void workerThread();
    void joinAll();

    int workers_;
    std::vector<std::thread> threads_;

    std::queue<Job> queue_;
    std::mutex queue_mutex_;

    std::exception_ptr first_error_;
    std::mutex error_mutex_;

    std::atomic<bool> aborted_{false};
    std::atomic<size_t> completed_{0};
    std::atomic<size_t> skipped_{0};
};

} // namespace coco_tools
