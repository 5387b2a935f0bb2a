#include "job_state_machine.hpp"
#include <fmt/format.h>

bool JobStateMachine::is_transition_allowed(JobStatus current, JobStatus requested) {
    switch (current) {
        case JobStatus::Pending:
            return requested == JobStatus::Running || requested == JobStatus::Cancelled;
        case JobStatus::Running:
            return requested == JobStatus::Completed ||
                   requested == JobStatus::Failed ||
                   requested == JobStatus::Cancelled;
        case JobStatus::Completed:
        case JobStatus::Failed:
        case JobStatus::Cancelled:
            return false;
    }
    return false;
}

Result<void> JobStateMachine::validate_transition(JobStatus current, JobStatus requested) {
    if (is_transition_allowed(current, requested)) return Result<void>::Ok();
    return Result<void>::Err(
        fmt::format("Transition {} -> {} is not allowed", to_string(current), to_string(requested)),
        ErrorCode::InvalidTransition);
}

std::set<JobStatus> JobStateMachine::valid_next_states(JobStatus current) {
    static const JobStatus ALL[] = {
        JobStatus::Pending, JobStatus::Running, JobStatus::Completed,
        JobStatus::Failed, JobStatus::Cancelled,
    };
    std::set<JobStatus> next;
    for (JobStatus s : ALL) {
        if (is_transition_allowed(current, s)) next.insert(s);
    }
    return next;
}
