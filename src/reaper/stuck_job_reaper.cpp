#include "stuck_job_reaper.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

StuckJobReaper::StuckJobReaper(JobCoordinator& coordinator,
                               std::chrono::seconds interval,
                               std::chrono::seconds deadline,
                               SweepCallback on_sweep)
    : coordinator_(coordinator),
      interval_(interval),
      deadline_(deadline),
      on_sweep_(std::move(on_sweep)) {}

StuckJobReaper::~StuckJobReaper() {
    stop();
}

// ── Sweep ───────────────────────────────────────────────────

ReapReport StuckJobReaper::sweep_once() {
    return sweep_once(coordinator_.now());
}

ReapReport StuckJobReaper::sweep_once(TimePoint now) {
    ReapReport report;

    auto stale = coordinator_.store().find_stale_running(now - deadline_);
    if (stale.is_err()) {
        coord_log("reaper: scan failed: " + stale.error);
        report.errors++;
        return report;
    }
    report.scanned = stale.value.size();

    for (const auto& job : stale.value) {
        nlohmann::json info = {
            {"reason", REAPER_WORKER_TIMEOUT},
            {"worker", job.worker_ref},
            {"started_at", to_iso(job.started_at)},
            {"deadline", format_duration(deadline_)},
        };

        auto failed = coordinator_.fail(job.id, job.version, info.dump());
        if (failed.is_ok()) {
            report.reaped++;
            coord_log(fmt::format("reaper: failed job {} (owner {}, running {})",
                                  job.id, job.worker_ref,
                                  format_elapsed(job.started_at, std::nullopt, now)));
        } else if (failed.is(ErrorCode::ConcurrencyConflict)) {
            // The row moved since the scan; whoever moved it won.
            report.lost_races++;
        } else {
            report.errors++;
            coord_log(fmt::format("reaper: could not fail job {}: {}", job.id, failed.error));
        }
    }

    if (report.scanned > 0) {
        coord_log(fmt::format("reaper: sweep scanned={} reaped={} lost={} errors={}",
                              report.scanned, report.reaped, report.lost_races, report.errors));
    }
    return report;
}

// ── Lifecycle ───────────────────────────────────────────────

bool StuckJobReaper::start() {
    if (running_) return true;
    running_ = true;
    thread_ = std::thread(&StuckJobReaper::reaper_loop, this);
    coord_log(fmt::format("reaper: started (interval {}, deadline {})",
                          format_duration(interval_), format_duration(deadline_)));
    return true;
}

void StuckJobReaper::stop() {
    if (!running_) return;
    running_ = false;
    if (thread_.joinable()) thread_.join();
    coord_log("reaper: stopped");
}

void StuckJobReaper::reaper_loop() {
    while (running_) {
        auto report = sweep_once();
        if (on_sweep_) on_sweep_(report);

        // Sleep in short slices for responsive shutdown
        auto slices = std::chrono::duration_cast<std::chrono::milliseconds>(interval_).count()
                      / SHUTDOWN_SLICE_MS;
        for (long long i = 0; i < slices && running_; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(SHUTDOWN_SLICE_MS));
        }
    }
}
