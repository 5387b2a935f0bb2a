#include "dispatcher.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

Dispatcher::Dispatcher(JobStore& store, WorkerPool& pool, std::chrono::seconds interval)
    : store_(store), pool_(pool), interval_(interval) {}

Dispatcher::~Dispatcher() {
    stop();
}

bool Dispatcher::start() {
    if (running_) return true;
    running_ = true;
    thread_ = std::thread(&Dispatcher::dispatch_loop, this);
    coord_log(fmt::format("dispatcher: scanning every {}s", interval_.count()));
    return true;
}

void Dispatcher::stop() {
    if (!running_) return;
    running_ = false;
    if (thread_.joinable()) thread_.join();
    coord_log("dispatcher: stopped");
}

std::size_t Dispatcher::dispatch_once() {
    // Don't list more than the pool can start soon; the rest waits for the next scan.
    std::size_t want = static_cast<std::size_t>(pool_.worker_count()) * 2;
    auto pending = store_.find_by_status(JobStatus::Pending, want);
    if (pending.is_err()) {
        coord_log("dispatcher: pending scan failed: " + pending.error);
        return 0;
    }

    std::size_t queued = 0;
    for (const auto& job : pending.value) {
        if (pool_.submit(job.id)) ++queued;
    }
    return queued;
}

void Dispatcher::dispatch_loop() {
    while (running_) {
        dispatch_once();

        auto slices = std::chrono::duration_cast<std::chrono::milliseconds>(interval_).count()
                      / SHUTDOWN_SLICE_MS;
        for (long long i = 0; i < slices && running_; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(SHUTDOWN_SLICE_MS));
        }
    }
}
