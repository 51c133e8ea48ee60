#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Fixed set of worker threads draining a FIFO of jobs.
// Jobs report their own outcome; an exception escaping a job is logged and
// the worker keeps running.
class WorkerPool {
public:
    using Job = std::function<void()>;

    WorkerPool(size_t thread_count, const std::string& name);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(Job job);

    // Block until every submitted job has finished
    void wait();

    size_t threadCount() const { return workers_.size(); }

private:
    void workerLoop();

    std::string name_;
    std::vector<std::thread> workers_;
    std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<Job> jobs_;
    size_t active_;
    bool stop_;
};
