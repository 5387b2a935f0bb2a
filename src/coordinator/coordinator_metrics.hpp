#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include "coordinator.hpp"

// Counters fed by CoordinatorHooks. Cheap enough to leave attached in production.
class CoordinatorMetrics {
public:
    struct Snapshot {
        uint64_t claims_won = 0;
        uint64_t claims_lost = 0;
        uint64_t completed = 0;
        uint64_t failed = 0;
        uint64_t cancelled = 0;
        uint64_t conflicts = 0;
        uint64_t reaped = 0;
    };

    // Hooks that update this object. Must not outlive it.
    CoordinatorHooks hooks();

    // Reaper fails look like any other fail to the hooks; the reaper reports them here.
    void add_reaped(uint64_t count) { reaped_.fetch_add(count, std::memory_order_relaxed); }

    Snapshot snapshot() const;
    std::string summary() const;

private:
    std::atomic<uint64_t> claims_won_{0};
    std::atomic<uint64_t> claims_lost_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> cancelled_{0};
    std::atomic<uint64_t> conflicts_{0};
    std::atomic<uint64_t> reaped_{0};
};
