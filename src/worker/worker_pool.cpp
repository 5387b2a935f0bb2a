#include "worker_pool.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

WorkerPool::WorkerPool(int workers) : workers_(workers > 0 ? workers : 1) {}

WorkerPool::~WorkerPool() {
    stop();
}

bool WorkerPool::start(Processor processor) {
    if (running_) return false;
    if (!processor) {
        coord_log("pool: refusing to start without a processor");
        return false;
    }

    processor_ = std::move(processor);
    shutdown_ = false;
    running_ = true;

    threads_.reserve(static_cast<std::size_t>(workers_));
    for (int i = 0; i < workers_; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this, i);
    }
    coord_log(fmt::format("pool: started {} worker threads", workers_));
    return true;
}

void WorkerPool::stop() {
    if (!running_) return;

    shutdown_ = true;
    running_ = false;
    job_available_.notify_all();

    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();

    // Unstarted ids stay pending in the store; any other worker may take them.
    std::lock_guard<std::mutex> lock(queue_mutex_);
    std::queue<std::string>().swap(queue_);
    pending_ids_.clear();
    coord_log("pool: stopped");
}

bool WorkerPool::submit(const std::string& job_id) {
    if (!running_ || shutdown_) return false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!pending_ids_.insert(job_id).second) return false;
        queue_.push(job_id);
    }
    job_available_.notify_one();
    return true;
}

std::size_t WorkerPool::queue_size() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

std::size_t WorkerPool::in_flight() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return pending_ids_.size() - queue_.size();
}

void WorkerPool::worker_loop(int worker_index) {
    while (!shutdown_) {
        std::string job_id;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            job_available_.wait(lock, [this] { return !queue_.empty() || shutdown_; });
            if (shutdown_) break;
            job_id = queue_.front();
            queue_.pop();
        }

        try {
            processor_(job_id, worker_index);
        } catch (const std::exception& e) {
            coord_log(fmt::format("pool: worker {} error on job {}: {}",
                                  worker_index, job_id, e.what()));
        } catch (...) {
            coord_log(fmt::format("pool: worker {} non-standard exception on job {}",
                                  worker_index, job_id));
        }

        std::lock_guard<std::mutex> lock(queue_mutex_);
        pending_ids_.erase(job_id);
    }
}
