#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <set>
#include <string>
#include <thread>
#include <vector>

// Fixed set of threads draining a queue of job ids. The pool only moves ids
// around; claiming and finalizing happen inside the processor.
class WorkerPool {
public:
    using Processor = std::function<void(const std::string& job_id, int worker_index)>;

    explicit WorkerPool(int workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    bool start(Processor processor);
    void stop();

    // Queue a job id. Returns false if stopped or the id is already queued
    // or being processed by this pool.
    bool submit(const std::string& job_id);

    bool is_running() const { return running_.load(); }
    std::size_t queue_size() const;
    std::size_t in_flight() const;
    int worker_count() const { return workers_; }

private:
    void worker_loop(int worker_index);

    int workers_;
    Processor processor_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex queue_mutex_;
    std::condition_variable job_available_;
    std::queue<std::string> queue_;
    std::set<std::string> pending_ids_;   // queued or in progress

    std::vector<std::thread> threads_;
};
