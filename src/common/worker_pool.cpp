#include "worker_pool.h"
#include "logger.h"
#include <exception>

WorkerPool::WorkerPool(size_t thread_count, const std::string& name)
    : name_(name)
    , active_(0)
    , stop_(false) {
    if (thread_count == 0) thread_count = 1;
    workers_.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        workers_.emplace_back([this]() { workerLoop(); });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    work_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.push_back(std::move(job));
    }
    work_cv_.notify_one();
}

void WorkerPool::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() {
        return jobs_.empty() && active_ == 0;
    });
}

void WorkerPool::workerLoop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this]() {
                return stop_ || !jobs_.empty();
            });
            if (stop_ && jobs_.empty()) {
                break;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
            ++active_;
        }

        try {
            job();
        } catch (const std::exception& e) {
            LOG_ERROR(name_, "Job failed: " << e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
            if (jobs_.empty() && active_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}
