#pragma once

#include <atomic>
#include <chrono>
#include <thread>
#include <store/job_store.hpp>
#include "worker_pool.hpp"

// Periodically lists pending jobs and feeds their ids to a WorkerPool.
// Stands in for an external scheduler: several dispatchers (in several
// processes) may feed the same ids, the claim decides who runs them.
class Dispatcher {
public:
    Dispatcher(JobStore& store, WorkerPool& pool, std::chrono::seconds interval);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    bool start();
    void stop();

    // One scan. Returns how many ids were newly queued.
    std::size_t dispatch_once();

private:
    void dispatch_loop();

    JobStore& store_;
    WorkerPool& pool_;
    std::chrono::seconds interval_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};
