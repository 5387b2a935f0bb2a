#pragma once

#include <string>
#include <memory>
#include <optional>
#include <functional>
#include <initializer_list>
#include <core/types.hpp>
#include <store/job_store.hpp>

// claimed == false is the normal outcome when another worker got there
// first (or the job is no longer pending). It is not an error.
struct ClaimOutcome {
    bool claimed = false;
    int64_t version = 0;      // version after the claim when claimed
    std::string worker_ref;
};

// A finalization found the row at a different version than the caller held.
struct ConflictEvent {
    std::string operation;    // "complete", "fail", "cancel"
    std::string job_id;
    int64_t expected_version = 0;
    int64_t observed_version = 0;
};

// Monitoring hooks. Any member may be empty. Called on the thread that ran
// the operation, after the store call returned.
struct CoordinatorHooks {
    // Every claim that returned claimed == false (contention signal).
    std::function<void(const std::string& job_id, const std::string& worker_ref)> on_claim_lost;
    // Every ConcurrencyConflict (anomaly signal).
    std::function<void(const ConflictEvent&)> on_conflict;
    // Every successful conditional update.
    std::function<void(const std::string& job_id, JobStatus from, JobStatus to, int64_t version)> on_transition;
};

// Chain two hook sets: both are invoked, `first` before `second`.
CoordinatorHooks chain_hooks(CoordinatorHooks first, CoordinatorHooks second);

// Optimistic-concurrency front end over a JobStore.
//
// Every operation is: load the row, validate the transition, attempt one
// conditional write, map the outcome. Nothing here retries a version
// conflict and nothing holds a lock on a job; retry policy belongs to the
// caller (normally: stop and let the reaper clean up).
class JobCoordinator {
public:
    explicit JobCoordinator(std::shared_ptr<JobStore> store,
                            CoordinatorHooks hooks = {},
                            NowFn now = system_now);

    // pending -> running. Sets worker_ref and started_at.
    // Many workers may race; at most one sees claimed == true.
    // Errors: NotFound, InvalidArgument (empty worker_ref), StoreFailure.
    Result<ClaimOutcome> claim(const std::string& id, const std::string& worker_ref);

    // running -> completed with result. Returns the new version.
    // Errors: NotFound, InvalidTransition, ConcurrencyConflict, StoreFailure.
    Result<int64_t> complete(const std::string& id, int64_t expected_version,
                             const std::string& result);

    // running -> failed with error_info.
    Result<int64_t> fail(const std::string& id, int64_t expected_version,
                         const std::string& error_info);

    // pending|running -> cancelled with reason.
    Result<int64_t> cancel(const std::string& id, int64_t expected_version,
                           const std::string& reason);

    // Read access for status polling.
    Result<JobRecord> get(const std::string& id);

    JobStore& store() { return *store_; }
    TimePoint now() const { return now_(); }

private:
    struct TransitionOutcome {
        bool applied = false;
        int64_t version = 0;      // new version if applied, observed version otherwise
        JobStatus from = JobStatus::Pending;
    };

    // The one primitive behind every public operation. When expected_version
    // is empty the loaded row's version is used (claim).
    Result<TransitionOutcome> transition(const std::string& id,
                                         std::optional<int64_t> expected_version,
                                         std::initializer_list<JobStatus> from,
                                         JobStatus to,
                                         const JobMutation& mutation);

    // complete/fail/cancel share this: run transition, turn a miss into
    // ConcurrencyConflict and raise the alarm.
    Result<int64_t> finalize(const char* operation,
                             const std::string& id,
                             int64_t expected_version,
                             std::initializer_list<JobStatus> from,
                             JobStatus to,
                             const JobMutation& mutation);

    std::shared_ptr<JobStore> store_;
    CoordinatorHooks hooks_;
    NowFn now_;
};
