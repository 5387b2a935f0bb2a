#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <thread>
#include <core/types.hpp>
#include <coordinator/coordinator.hpp>

struct ReapReport {
    std::size_t scanned = 0;     // running rows past the deadline
    std::size_t reaped = 0;      // moved to failed by this sweep
    std::size_t lost_races = 0;  // owner (or another reaper) finalized first
    std::size_t errors = 0;
};

// Fails jobs stuck in running past a deadline, through the same conditional
// update as everyone else: a worker finishing at the last moment and the
// reaper cannot both win.
class StuckJobReaper {
public:
    using SweepCallback = std::function<void(const ReapReport&)>;

    // Both durations come from configuration; there are no built-in defaults.
    StuckJobReaper(JobCoordinator& coordinator,
                   std::chrono::seconds interval,
                   std::chrono::seconds deadline,
                   SweepCallback on_sweep = nullptr);
    ~StuckJobReaper();

    StuckJobReaper(const StuckJobReaper&) = delete;
    StuckJobReaper& operator=(const StuckJobReaper&) = delete;

    // One sweep against the coordinator's clock / an explicit instant.
    ReapReport sweep_once();
    ReapReport sweep_once(TimePoint now);

    // Timer thread: sweep, then sleep `interval`, until stop().
    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    std::chrono::seconds interval() const { return interval_; }
    std::chrono::seconds deadline() const { return deadline_; }

private:
    void reaper_loop();

    JobCoordinator& coordinator_;
    std::chrono::seconds interval_;
    std::chrono::seconds deadline_;
    SweepCallback on_sweep_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};
