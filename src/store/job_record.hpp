#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <cstdint>
#include <core/types.hpp>

enum class JobStatus { Pending, Running, Completed, Failed, Cancelled };

const char* to_string(JobStatus status);
std::optional<JobStatus> parse_job_status(const std::string& text);

// Completed, Failed and Cancelled admit no further transitions.
bool is_terminal(JobStatus status);

// One row per simulation job.
struct JobRecord {
    std::string id;                       // assigned at submission, immutable
    JobStatus status = JobStatus::Pending;
    int64_t version = 1;                  // +1 on every successful conditional update
    std::string worker_ref;               // claim token "<node>:<task>", kept for audit

    std::string model_type;               // which unit of work runs this job
    std::string parameters;               // opaque input for the unit of work

    TimePoint created_at{};
    TimePoint updated_at{};
    std::optional<TimePoint> started_at;  // set once, on pending -> running
    std::optional<TimePoint> completed_at;

    // Exactly one of these is populated once status is terminal.
    std::optional<std::string> result;
    std::optional<std::string> error_info;
    std::optional<std::string> cancel_reason;

    // completed_at - started_at, when both are known.
    std::optional<std::chrono::milliseconds> execution_time() const;
};

// New field values applied by a conditional update. Unset members are left
// untouched. The store bumps version and updated_at itself.
struct JobMutation {
    std::optional<JobStatus> status;
    std::optional<std::string> worker_ref;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;
    std::optional<std::string> result;
    std::optional<std::string> error_info;
    std::optional<std::string> cancel_reason;

    // Apply to an in-memory copy (the SQL backend maps fields to SET clauses).
    void apply_to(JobRecord& record) const;
};

// Outcome of JobStore::conditional_update. applied == false means the row's
// version did not match: a lost race, not an error.
struct CasOutcome {
    bool applied = false;
    int64_t new_version = 0;
};
