#pragma once

#include <string>
#include <functional>
#include <stdexcept>
#include <atomic>
#include <core/types.hpp>
#include <coordinator/coordinator.hpp>

// Thrown by a unit of work (usually via JobContext::throw_if_cancelled) to
// stop early because the job was cancelled.
class JobCancelled : public std::runtime_error {
public:
    explicit JobCancelled(const std::string& job_id)
        : std::runtime_error("job " + job_id + " cancelled") {}
};

// What a running unit of work sees of its job.
class JobContext {
public:
    JobContext(JobCoordinator& coordinator, JobRecord job, int64_t claim_version,
               std::string worker_ref);

    const JobRecord& job() const { return job_; }
    int64_t claim_version() const { return claim_version_; }
    const std::string& worker_ref() const { return worker_ref_; }

    // Polls the store. True once the record has been moved to cancelled.
    // Cancellation is cooperative: nothing interrupts the unit of work.
    bool cancel_requested();

    // Polls the store. True once anyone else has written the row since our
    // claim (cancel, reaper timeout). Continuing is wasted work.
    bool ownership_lost();

    void throw_if_cancelled();

    bool cancel_observed() const { return cancel_observed_; }

private:
    void refresh();

    JobCoordinator& coordinator_;
    JobRecord job_;
    int64_t claim_version_;
    std::string worker_ref_;
    JobStatus last_status_ = JobStatus::Running;
    int64_t last_version_;
    bool cancel_observed_ = false;
};

// The pluggable simulation. Returns the result payload; throws to fail.
using UnitOfWork = std::function<std::string(JobContext&)>;

// Guarantees one finalization per successful claim. complete(), fail() and
// acknowledge_cancel() are first-caller-wins; if none ran by destruction
// (an exception escaped the adapter) the destructor records a failure.
class FinalizationGuard {
public:
    FinalizationGuard(JobCoordinator& coordinator, std::string job_id, int64_t version);
    ~FinalizationGuard();

    FinalizationGuard(const FinalizationGuard&) = delete;
    FinalizationGuard& operator=(const FinalizationGuard&) = delete;

    Result<int64_t> complete(const std::string& result);
    Result<int64_t> fail(const std::string& error_info);

    // The record is already cancelled by someone else; nothing to write.
    void acknowledge_cancel();

    bool finalized() const { return finalized_; }

private:
    Result<int64_t> already_finalized() const;

    JobCoordinator& coordinator_;
    std::string job_id_;
    int64_t version_;
    bool finalized_ = false;
};

enum class RunOutcome {
    NotClaimed,   // another worker owns the job; abandoned silently
    Completed,
    Failed,       // unit of work threw; failure recorded
    Cancelled,    // cancel request observed
    Conflict,     // finalization hit ConcurrencyConflict (reaper or bug)
    Error,        // store or argument error before/while finalizing
};

const char* to_string(RunOutcome outcome);

struct RunReport {
    RunOutcome outcome = RunOutcome::NotClaimed;
    std::string job_id;
    std::string worker_ref;
    int64_t final_version = 0;
    std::string detail;
};

// Claim -> execute -> finalize around one unit of work.
class WorkerRuntime {
public:
    WorkerRuntime(JobCoordinator& coordinator, std::string worker_node,
                  FailurePolicy policy = FailurePolicy::Swallow);

    // Runs `work` for job_id if this worker wins the claim. With
    // FailurePolicy::Rethrow the unit's exception propagates after the
    // failure has been written.
    RunReport run(const std::string& job_id, const UnitOfWork& work);

    // "<node>:<pid>-<seq>", unique per run() call.
    std::string next_worker_ref();

    const std::string& worker_node() const { return worker_node_; }

private:
    RunReport finish_with_failure(FinalizationGuard& guard, RunReport report,
                                  const std::string& message);

    JobCoordinator& coordinator_;
    std::string worker_node_;
    FailurePolicy policy_;
    std::atomic<uint64_t> sequence_{0};
};
