#pragma once

#include <set>
#include <string>
#include <core/types.hpp>
#include <store/job_record.hpp>

// Legal transitions:
//
//   pending -> running     worker claim
//   pending -> cancelled   cancel before any worker claims
//   running -> completed   worker reports success
//   running -> failed      worker reports failure, or reaper timeout
//   running -> cancelled   cancel honored mid-flight
//
// Nothing leaves a terminal state. Self-transitions are not legal.
class JobStateMachine {
public:
    // Pure predicate. Never touches a store.
    static bool is_transition_allowed(JobStatus current, JobStatus requested);

    // Same check as a Result, ErrorCode::InvalidTransition on rejection.
    static Result<void> validate_transition(JobStatus current, JobStatus requested);

    static std::set<JobStatus> valid_next_states(JobStatus current);
};
