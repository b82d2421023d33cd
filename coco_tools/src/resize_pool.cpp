#include "coco_tools/resize_pool.hpp"

#include <algorithm>

namespace coco_tools {

ResizePool::ResizePool(int workers)
    : workers_(workers > 0 ? workers
                           : std::max(1, static_cast<int>(std::thread::hardware_concurrency()))) {}

ResizePool::~ResizePool() {
    aborted_ = true;
    joinAll();
}

void ResizePool::joinAll() {
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

void ResizePool::run(std::vector<Job> jobs) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        std::queue<Job> empty;
        std::swap(queue_, empty);
        for (auto& job : jobs) queue_.push(std::move(job));
    }
    first_error_ = nullptr;
    aborted_ = false;
    completed_ = 0;
    skipped_ = 0;

    const size_t count = std::min<size_t>(static_cast<size_t>(workers_), jobs.size());
    if (count <= 1) {
        workerThread();
    } else {
        threads_.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            threads_.emplace_back(&ResizePool::workerThread, this);
        }
        joinAll();
    }

    if (first_error_) std::rethrow_exception(first_error_);
}

void ResizePool::run(const std::vector<ResizeTask>& tasks, const RetryPolicy& retry) {
    std::vector<Job> jobs;
    jobs.reserve(tasks.size());
    for (const auto& task : tasks) {
        jobs.emplace_back([task, retry] { ImageResizer::resizeOne(task, retry); });
    }
    run(std::move(jobs));
}

void ResizePool::workerThread() {
    while (true) {
        Job job;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (queue_.empty()) break;
            job = std::move(queue_.front());
            queue_.pop();
            if (aborted_) {
                ++skipped_;
                continue;
            }
        }

        try {
            job();
            ++completed_;
        } catch (...) {
            // Kept and rethrown by run() once every worker has stopped.
            std::lock_guard<std::mutex> lock(error_mutex_);
            if (!first_error_) first_error_ = std::current_exception();
            aborted_ = true;
        }
    }
}

} // namespace coco_tools
