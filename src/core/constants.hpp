#pragma once

#include <cstddef>

constexpr const char* SIMCOORD_VERSION = "0.4.0";

// ── Files ───────────────────────────────────────────────────
constexpr const char* CONFIG_FILE_NAME   = "simcoord.yaml";
constexpr const char* DEFAULT_LOG_NAME   = "simcoord.log";
constexpr const char* JOB_LOG_SUBDIR     = "jobs";

// ── Store ───────────────────────────────────────────────────
constexpr int  SQLITE_DEFAULT_BUSY_MS    = 5000;  // wait on a locked db before SQLITE_BUSY
constexpr int  INITIAL_JOB_VERSION       = 1;     // every row starts here
constexpr std::size_t DEFAULT_LIST_LIMIT = 100;

// ── Loops ───────────────────────────────────────────────────
constexpr int  SHUTDOWN_SLICE_MS         = 100;   // sleep granularity for responsive stop()
constexpr int  DEFAULT_WORKER_THREADS    = 4;

// ── Reaper ──────────────────────────────────────────────────
constexpr const char* REAPER_WORKER_TIMEOUT = "worker timeout";

// ── Worker runtime ──────────────────────────────────────────
// Recorded when a unit of work leaves without the adapter reaching complete/fail.
constexpr const char* UNFINALIZED_EXIT_REASON = "worker exited without finalizing";
constexpr const char* UNKNOWN_EXCEPTION_REASON = "unknown exception";
